/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/angle.hh>
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

Angle::Angle(PointID a, PointID vertex, PointID b, double angle) :
    _a(a),
    _vertex(vertex),
    _b(b),
    _angle(angle)
{
}

auto Angle::points() const -> vector<PointID>
{
    return vector{_a, _vertex, _b};
}

auto Angle::shape_for(PointID target) const -> optional<LocusShape>
{
    if (target == _b)
        return LocusShape{Dimension::One, "angle-ray", {_vertex, _a}, {_angle}};
    else if (target == _a)
        return LocusShape{Dimension::One, "angle-ray", {_vertex, _b}, {-_angle}};
    else
        return nullopt;
}

auto Angle::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    if (target != _a && target != _b)
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};

    auto arm = target == _b ? _a : _b;
    auto vertex = positions.at(_vertex), through = positions.at(arm);
    if (about_equal(vertex, through))
        return Degenerate{fmt::format("{} sits on the vertex of {}", arm, describe())};

    auto turn = target == _b ? _angle : -_angle;
    return PossibilitySpace{Curve{Ray{vertex, (through - vertex).unit().rotated(turn)}}};
}

auto Angle::validate() const -> void
{
    Constraint::validate();
    if (! isfinite(_angle))
        throw InvalidConstraint{describe() + " needs a finite angle"};
}

auto Angle::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Angle>(_a, _vertex, _b, _angle);
}

auto Angle::describe() const -> string
{
    return fmt::format("angle({}, {}, {}) = {}", _a, _vertex, _b, _angle);
}
