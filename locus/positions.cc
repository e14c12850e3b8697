/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/positions.hh>

#include <fmt/core.h>

using namespace locus;

using std::optional;
using std::size_t;

namespace
{
    auto check_index(PointID p, size_t n) -> void
    {
        if (p.index >= n)
            throw UnknownID{fmt::format("point {} in a figure with {} points", p, n)};
    }
}

KnownPoints::KnownPoints(size_t n) :
    _known(n, false)
{
}

auto KnownPoints::contains(PointID p) const -> bool
{
    check_index(p, _known.size());
    return _known[p.index];
}

auto KnownPoints::insert(PointID p) -> void
{
    check_index(p, _known.size());
    if (! _known[p.index]) {
        _known[p.index] = true;
        ++_count;
    }
}

auto KnownPoints::erase(PointID p) -> void
{
    check_index(p, _known.size());
    if (_known[p.index]) {
        _known[p.index] = false;
        --_count;
    }
}

auto KnownPoints::size() const -> size_t
{
    return _count;
}

auto KnownPoints::number_of_points() const -> size_t
{
    return _known.size();
}

auto KnownPoints::all() const -> bool
{
    return _count == _known.size();
}

Positions::Positions(size_t n) :
    _positions(n),
    _known(n)
{
}

auto Positions::known() const -> const KnownPoints &
{
    return _known;
}

auto Positions::has(PointID p) const -> bool
{
    return _known.contains(p);
}

auto Positions::operator[](PointID p) const -> const optional<Vector> &
{
    check_index(p, _positions.size());
    return _positions[p.index];
}

auto Positions::at(PointID p) const -> const Vector &
{
    auto & result = (*this)[p];
    if (! result)
        throw UnexpectedException{fmt::format("asked for the position of {}, which is not known", p)};
    return *result;
}

auto Positions::place(PointID p, const Vector & v) -> void
{
    check_index(p, _positions.size());
    _positions[p.index] = v;
    _known.insert(p);
}

auto Positions::clear(PointID p) -> void
{
    check_index(p, _positions.size());
    _positions[p.index].reset();
    _known.erase(p);
}

auto Positions::number_of_points() const -> size_t
{
    return _positions.size();
}
