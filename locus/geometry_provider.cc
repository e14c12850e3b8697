/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/geometry_provider.hh>

#include <util/overloaded.hh>

#include <algorithm>
#include <cmath>
#include <numbers>

#include <fmt/core.h>

using namespace locus;

using std::fabs;
using std::find;
using std::find_if;
using std::fmod;
using std::get;
using std::get_if;
using std::nullopt;
using std::optional;
using std::size_t;
using std::sqrt;
using std::vector;
using std::numbers::pi;

GeometryProvider::~GeometryProvider() = default;

namespace
{
    // Lines and rays share most of their arithmetic, so flatten them into
    // one form: origin + t * direction, with t >= 0 if it is a ray.
    struct Straight
    {
        Vector origin;
        Vector direction;
        bool is_ray;
    };

    auto as_straight(const Curve & c) -> optional<Straight>
    {
        return overloaded{
            [](const Circle &) -> optional<Straight> { return nullopt; },
            [](const Line & l) -> optional<Straight> { return Straight{l.origin, l.direction, false}; },
            [](const Ray & r) -> optional<Straight> { return Straight{r.origin, r.direction, true}; }}
            .visit(c);
    }

    auto on_straight(const Straight & s, double t, double tolerance) -> bool
    {
        return (! s.is_ray) || t >= -tolerance;
    }

    auto collinear(const Straight & s, const Straight & u, double tolerance) -> bool
    {
        return about_zero(s.direction.cross(u.direction)) && about_zero(s.direction.cross(u.origin - s.origin), tolerance);
    }

    // Collinear straights overlap in more than a single point, unless they
    // are two rays that face away from each other or meet only at a shared
    // origin.
    auto coincident_straights(const Straight & s, const Straight & u, double tolerance) -> bool
    {
        if (! collinear(s, u, tolerance))
            return false;
        if (! (s.is_ray && u.is_ray))
            return true;
        if (s.direction.dot(u.direction) > 0.0)
            return true;

        // Opposite directions: they overlap along a segment exactly when u's
        // origin lies strictly ahead of s's origin.
        return (u.origin - s.origin).dot(s.direction) > tolerance;
    }

    auto coincident(const Curve & a, const Curve & b, double tolerance) -> bool
    {
        auto ca = get_if<Circle>(&a), cb = get_if<Circle>(&b);
        if (ca && cb)
            return about_equal(ca->centre, cb->centre, tolerance) && about_equal(ca->radius, cb->radius, tolerance);
        if (ca || cb)
            return false;
        return coincident_straights(*as_straight(a), *as_straight(b), tolerance);
    }

    auto circle_circle(const Circle & c0, const Circle & c1, double tolerance) -> vector<Vector>
    {
        auto offset = c1.centre - c0.centre;
        auto d = offset.magnitude();
        if (about_zero(d))
            return {};
        if (d > c0.radius + c1.radius + tolerance)
            return {};
        if (d < fabs(c0.radius - c1.radius) - tolerance)
            return {};

        auto dir = offset / d;
        auto a = (c0.radius * c0.radius - c1.radius * c1.radius + d * d) / (2.0 * d);
        auto mid = c0.centre + dir * a;
        auto h_squared = c0.radius * c0.radius - a * a;
        if (h_squared <= 0.0 || sqrt(h_squared) <= tolerance)
            return {mid};

        auto h = dir.perpendicular() * sqrt(h_squared);
        return {mid + h, mid - h};
    }

    auto circle_straight(const Circle & c, const Straight & s, double tolerance) -> vector<Vector>
    {
        auto t_foot = (c.centre - s.origin).dot(s.direction);
        auto foot = s.origin + s.direction * t_foot;
        auto d = foot.distance_to(c.centre);
        if (d > c.radius + tolerance)
            return {};

        vector<double> ts;
        auto h_squared = c.radius * c.radius - d * d;
        if (h_squared <= 0.0 || sqrt(h_squared) <= tolerance)
            ts.push_back(t_foot);
        else {
            auto h = sqrt(h_squared);
            ts.push_back(t_foot + h);
            ts.push_back(t_foot - h);
        }

        vector<Vector> result;
        for (auto t : ts)
            if (on_straight(s, t, tolerance))
                result.push_back(s.origin + s.direction * t);
        return result;
    }

    auto straight_straight(const Straight & s, const Straight & u, double tolerance) -> vector<Vector>
    {
        auto denominator = s.direction.cross(u.direction);
        if (about_zero(denominator)) {
            // Parallel. Anything coincident has already been weeded out, so
            // the only possible meeting point is a shared ray origin.
            if (collinear(s, u, tolerance) && about_equal(s.origin, u.origin, tolerance))
                return {s.origin};
            return {};
        }

        auto between = u.origin - s.origin;
        auto t_s = between.cross(u.direction) / denominator;
        auto t_u = between.cross(s.direction) / denominator;
        if (on_straight(s, t_s, tolerance) && on_straight(u, t_u, tolerance))
            return {s.origin + s.direction * t_s};
        return {};
    }

    auto intersect_pair(const Curve & a, const Curve & b, double tolerance) -> vector<Vector>
    {
        auto ca = get_if<Circle>(&a), cb = get_if<Circle>(&b);
        if (ca && cb)
            return circle_circle(*ca, *cb, tolerance);
        else if (ca)
            return circle_straight(*ca, *as_straight(b), tolerance);
        else if (cb)
            return circle_straight(*cb, *as_straight(a), tolerance);
        else
            return straight_straight(*as_straight(a), *as_straight(b), tolerance);
    }

    auto merge_close(const vector<Vector> & points, double tolerance) -> vector<Vector>
    {
        vector<Vector> result;
        for (auto & p : points)
            if (result.end() == find_if(result.begin(), result.end(), [&](const Vector & q) { return about_equal(p, q, tolerance); }))
                result.push_back(p);
        return result;
    }

    auto angle_between_is_flat(double a, double b) -> bool
    {
        auto diff = fmod(fabs(a - b), pi);
        return about_zero(diff) || about_equal(diff, pi);
    }
}

PlanarGeometry::PlanarGeometry(double tolerance) :
    _tolerance(tolerance)
{
}

auto PlanarGeometry::possibility_space(const Constraint & constraint, PointID target,
    const Positions & positions) const -> LocusResult
{
    for (auto & p : constraint.points())
        if (p != target && ! positions.has(p))
            throw UnexpectedException{fmt::format("asked for the locus of {} from {} while {} is unknown",
                target, constraint.describe(), p)};

    return constraint.locus_for(target, positions);
}

auto PlanarGeometry::intersect(const vector<PossibilitySpace> & spaces) const -> Intersection
{
    optional<size_t> first_point_set;
    vector<size_t> curve_indices;
    for (size_t i = 0; i < spaces.size(); ++i) {
        if (get_if<PointSet>(&spaces[i]) && ! first_point_set)
            first_point_set = i;
        else if (auto curve = get_if<Curve>(&spaces[i])) {
            bool duplicate = false;
            for (auto j : curve_indices)
                if (coincident(get<Curve>(spaces[j]), *curve, _tolerance))
                    duplicate = true;
            if (! duplicate)
                curve_indices.push_back(i);
        }
    }

    vector<Vector> candidates;
    vector<size_t> used;
    if (first_point_set) {
        candidates = get<PointSet>(spaces[*first_point_set]).points;
        used.push_back(*first_point_set);
    }
    else if (curve_indices.size() < 2) {
        return Unbounded{curve_indices.empty()
                ? "no curves or point sets to intersect"
                : "only one independent curve"};
    }
    else {
        candidates = intersect_pair(get<Curve>(spaces[curve_indices[0]]), get<Curve>(spaces[curve_indices[1]]), _tolerance);
        used.push_back(curve_indices[0]);
        used.push_back(curve_indices[1]);
    }

    vector<Vector> result;
    for (auto & c : candidates) {
        bool ok = true;
        for (size_t i = 0; i < spaces.size() && ok; ++i)
            if (used.end() == find(used.begin(), used.end(), i) && ! contains(spaces[i], c, _tolerance))
                ok = false;
        if (ok)
            result.push_back(c);
    }

    return FinitePoints{merge_close(result, _tolerance)};
}

auto PlanarGeometry::shape_for(const Constraint & constraint, PointID target) const -> optional<LocusShape>
{
    return constraint.shape_for(target);
}

auto PlanarGeometry::independent(const LocusShape & a, const LocusShape & b) const -> bool
{
    if (a.dimension != Dimension::One || b.dimension != Dimension::One)
        return false;

    if (a.family == b.family && a.anchors == b.anchors && a.parameters.size() == b.parameters.size()) {
        bool same = true;
        for (size_t i = 0; i < a.parameters.size(); ++i)
            if (! about_equal(a.parameters[i], b.parameters[i]))
                same = false;
        if (same)
            return false;
    }

    if (a.fixed_direction && b.fixed_direction && angle_between_is_flat(*a.fixed_direction, *b.fixed_direction))
        return false;

    return true;
}

auto PlanarGeometry::sample(const Curve & curve, unsigned how_many) const -> vector<Vector>
{
    return representatives(curve, how_many);
}

auto PlanarGeometry::tolerance() const -> double
{
    return _tolerance;
}
