/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/distance.hh>
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

Distance::Distance(PointID a, PointID b, double length) :
    _a(a),
    _b(b),
    _length(length)
{
}

auto Distance::points() const -> vector<PointID>
{
    return vector{_a, _b};
}

auto Distance::shape_for(PointID target) const -> optional<LocusShape>
{
    if (target == _a)
        return LocusShape{Dimension::One, "circle", {_b}, {_length}};
    else if (target == _b)
        return LocusShape{Dimension::One, "circle", {_a}, {_length}};
    else
        return nullopt;
}

auto Distance::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    if (target != _a && target != _b)
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};

    auto centre = positions.at(target == _a ? _b : _a);
    return PossibilitySpace{Curve{Circle{centre, _length}}};
}

auto Distance::validate() const -> void
{
    Constraint::validate();
    if (! isfinite(_length) || _length < 0.0)
        throw InvalidConstraint{describe() + " needs a finite non-negative length"};
}

auto Distance::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Distance>(_a, _b, _length);
}

auto Distance::describe() const -> string
{
    return fmt::format("distance({}, {}) = {}", _a, _b, _length);
}
