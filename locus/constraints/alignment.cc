/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/alignment.hh>
#include <locus/exception.hh>

#include <numbers>

#include <fmt/core.h>

using namespace locus;
using namespace locus::innards;

using std::make_unique;
using std::nullopt;
using std::optional;
using std::string;
using std::unique_ptr;
using std::vector;
using std::numbers::pi;

AlignmentBase::AlignmentBase(PointID a, PointID b) :
    _a(a),
    _b(b)
{
}

auto AlignmentBase::points() const -> vector<PointID>
{
    return vector{_a, _b};
}

auto AlignmentBase::shape_for(PointID target) const -> optional<LocusShape>
{
    if (target == _a)
        return LocusShape{Dimension::One, "line", {_b}, {direction()}, direction()};
    else if (target == _b)
        return LocusShape{Dimension::One, "line", {_a}, {direction()}, direction()};
    else
        return nullopt;
}

auto AlignmentBase::locus_for(PointID target, const Positions & positions) const -> LocusResult
{
    if (target != _a && target != _b)
        throw UnexpectedException{fmt::format("{} asked to place {}", describe(), target)};

    return PossibilitySpace{Curve{Line{positions.at(target == _a ? _b : _a), Vector::from_angle(direction())}}};
}

Horizontal::Horizontal(PointID a, PointID b) :
    AlignmentBase(a, b)
{
}

auto Horizontal::direction() const -> double
{
    return 0.0;
}

auto Horizontal::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Horizontal>(_a, _b);
}

auto Horizontal::describe() const -> string
{
    return fmt::format("horizontal({}, {})", _a, _b);
}

Vertical::Vertical(PointID a, PointID b) :
    AlignmentBase(a, b)
{
}

auto Vertical::direction() const -> double
{
    return pi / 2.0;
}

auto Vertical::clone() const -> unique_ptr<Constraint>
{
    return make_unique<Vertical>(_a, _b);
}

auto Vertical::describe() const -> string
{
    return fmt::format("vertical({}, {})", _a, _b);
}
