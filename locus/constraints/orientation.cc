/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/orientation.hh>
#include <locus/exception.hh>

#include <cmath>
#include <numbers>

#include <fmt/core.h>

using namespace locus;

using std::fmod;
using std::isfinite;
using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;
using std::numbers::pi;

namespace
{
    auto normalised(double angle) -> double
    {
        auto result = fmod(angle, 2.0 * pi);
        return result < 0.0 ? result + 2.0 * pi : result;
    }
}

Orientation::Orientation(PointID from, PointID to, double angle) :
    _from(from),
    _to(to),
    _angle(angle)
{
}

auto Orientation::points() const -> vector<PointID>
{
    return vector{_from, _to};
}

auto Orientation::shape_for(PointID target) const -> optional<LocusShape>
{
    if (target == _to)
        return LocusShape{Dimension::One, "ray", {_from}, {normalised(_angle)}, normalised(_angle)};
    else if (target == _from)
        return LocusShape{Dimension::One, "ray", {_to}, {normalised(_angle + pi)}, normalised(_angle + pi)};
    else
        return nullopt;
}

auto Orientation::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    if (target == _to)
        return PossibilitySpace{Curve{Ray{positions.at(_from), Vector::from_angle(_angle)}}};
    else if (target == _from)
        return PossibilitySpace{Curve{Ray{positions.at(_to), -Vector::from_angle(_angle)}}};
    else
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};
}

auto Orientation::validate() const -> void
{
    Constraint::validate();
    if (! isfinite(_angle))
        throw InvalidConstraint{describe() + " needs a finite angle"};
}

auto Orientation::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Orientation>(_from, _to, _angle);
}

auto Orientation::describe() const -> string
{
    return fmt::format("orientation({} -> {}) = {}", _from, _to, _angle);
}
