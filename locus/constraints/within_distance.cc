/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/within_distance.hh>
#include <locus/exception.hh>

#include <cmath>

#include <fmt/core.h>

using namespace locus;

using std::isfinite;
using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

WithinDistance::WithinDistance(PointID a, PointID b, double max_length) :
    _a(a),
    _b(b),
    _max_length(max_length)
{
}

auto WithinDistance::points() const -> vector<PointID>
{
    return vector{_a, _b};
}

auto WithinDistance::shape_for(PointID target) const -> optional<LocusShape>
{
    if (target == _a)
        return LocusShape{Dimension::Two, "disc", {_b}, {_max_length}};
    else if (target == _b)
        return LocusShape{Dimension::Two, "disc", {_a}, {_max_length}};
    else
        return nullopt;
}

auto WithinDistance::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    if (target != _a && target != _b)
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};

    return PossibilitySpace{Region{Disc{positions.at(target == _a ? _b : _a), _max_length}}};
}

auto WithinDistance::validate() const -> void
{
    Constraint::validate();
    if (! isfinite(_max_length) || _max_length < 0.0)
        throw InvalidConstraint{describe() + " needs a finite non-negative length"};
}

auto WithinDistance::clone() const -> unique_ptr<Constraint>
{
    return make_unique<WithinDistance>(_a, _b, _max_length);
}

auto WithinDistance::describe() const -> string
{
    return fmt::format("within_distance({}, {}) <= {}", _a, _b, _max_length);
}
