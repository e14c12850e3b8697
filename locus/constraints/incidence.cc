/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/incidence.hh>
#include <locus/exception.hh>

#include <algorithm>
#include <utility>

#include <fmt/core.h>

using namespace locus;

using std::make_unique;
using std::minmax;
using std::nullopt;
using std::optional;
using std::pair;
using std::string;
using std::unique_ptr;
using std::vector;

OnLine::OnLine(PointID p, PointID a, PointID b) :
    _p(p),
    _a(a),
    _b(b)
{
}

namespace
{
    auto others(PointID target, PointID p, PointID a, PointID b) -> optional<pair<PointID, PointID>>
    {
        if (target == p)
            return pair{a, b};
        else if (target == a)
            return pair{p, b};
        else if (target == b)
            return pair{p, a};
        else
            return nullopt;
    }
}

auto OnLine::points() const -> vector<PointID>
{
    return vector{_p, _a, _b};
}

auto OnLine::shape_for(PointID target) const -> optional<LocusShape>
{
    auto through = others(target, _p, _a, _b);
    if (! through)
        return nullopt;

    auto [first, second] = minmax(through->first, through->second);
    return LocusShape{Dimension::One, "line", {first, second}, {}};
}

auto OnLine::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    auto through = others(target, _p, _a, _b);
    if (! through)
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};

    auto u = positions.at(through->first), v = positions.at(through->second);
    if (about_equal(u, v))
        return Degenerate{fmt::format("{} and {} coincide, so {} does not give a line", through->first, through->second, describe())};

    return PossibilitySpace{Curve{Line{u, (v - u).unit()}}};
}

auto OnLine::clone() const -> unique_ptr<Constraint>
{
    return make_unique<OnLine>(_p, _a, _b);
}

auto OnLine::describe() const -> string
{
    return fmt::format("on_line({}, {}, {})", _p, _a, _b);
}
