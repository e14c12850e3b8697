/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/side_of.hh>
#include <locus/exception.hh>

#include <fmt/core.h>

using namespace locus;

using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;

SideOf::SideOf(PointID p, PointID a, PointID b, Side side) :
    _p(p),
    _a(a),
    _b(b),
    _side(side)
{
}

auto SideOf::points() const -> vector<PointID>
{
    return vector{_p, _a, _b};
}

auto SideOf::shape_for(PointID target) const -> optional<LocusShape>
{
    double sign = _side == Side::Left ? 1.0 : -1.0;
    if (target == _p)
        return LocusShape{Dimension::Two, "half-plane", {_a, _b}, {sign}};
    else if (target == _a)
        return LocusShape{Dimension::Two, "half-plane", {_p, _b}, {sign}};
    else if (target == _b)
        return LocusShape{Dimension::Two, "half-plane", {_a, _p}, {sign}};
    else
        return nullopt;
}

auto SideOf::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    // p is left of a -> b exactly when (b - a) x (p - a) >= 0. Rearranging
    // that for whichever point is unknown gives a half-plane each time.
    double sign = _side == Side::Left ? 1.0 : -1.0;

    auto half_plane = [&](PointID u, PointID v, double flip) -> LocusResult {
        auto from = positions.at(u), to = positions.at(v);
        if (about_equal(from, to))
            return Degenerate{fmt::format("{} and {} coincide, so {} has no direction", u, v, describe())};
        return PossibilitySpace{Region{HalfPlane{from, (to - from).perpendicular() * (sign * flip)}}};
    };

    if (target == _p)
        return half_plane(_a, _b, 1.0);
    else if (target == _a)
        return half_plane(_p, _b, -1.0);
    else if (target == _b)
        return half_plane(_a, _p, -1.0);
    else
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};
}

auto SideOf::clone() const -> unique_ptr<Constraint>
{
    return make_unique<SideOf>(_p, _a, _b, _side);
}

auto SideOf::describe() const -> string
{
    return fmt::format("side_of({}, {} -> {}) is {}", _p, _a, _b, _side == Side::Left ? "left" : "right");
}
