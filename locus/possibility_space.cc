/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/possibility_space.hh>

#include <util/overloaded.hh>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <ostream>

using namespace locus;

using std::fabs;
using std::max;
using std::min;
using std::numeric_limits;
using std::ostream;
using std::vector;
using std::numbers::pi;

namespace
{
    auto closest_on_ray(const Ray & r, const Vector & p) -> Vector
    {
        auto t = max(0.0, (p - r.origin).dot(r.direction));
        return r.origin + r.direction * t;
    }

    auto curve_distance(const Curve & curve, const Vector & p) -> double
    {
        return overloaded{
            [&](const Circle & circle) { return fabs(p.distance_to(circle.centre) - circle.radius); },
            [&](const Line & l) { return fabs(l.direction.cross(p - l.origin)); },
            [&](const Ray & r) { return p.distance_to(closest_on_ray(r, p)); }}
            .visit(curve);
    }

    auto region_distance(const Region & region, const Vector & p) -> double
    {
        return overloaded{
            [&](const HalfPlane & h) { return max(0.0, -(p - h.origin).dot(h.normal.unit())); },
            [&](const Disc & d) { return max(0.0, p.distance_to(d.centre) - d.radius); }}
            .visit(region);
    }
}

auto locus::dimension(const PossibilitySpace & space) -> Dimension
{
    return overloaded{
        [](const PointSet &) { return Dimension::Zero; },
        [](const Curve &) { return Dimension::One; },
        [](const Region &) { return Dimension::Two; }}
        .visit(space);
}

auto locus::contains(const PossibilitySpace & space, const Vector & p, double tolerance) -> bool
{
    return distance_to(space, p) <= tolerance;
}

auto locus::distance_to(const PossibilitySpace & space, const Vector & p) -> double
{
    return overloaded{
        [&](const PointSet & s) {
            auto result = numeric_limits<double>::infinity();
            for (auto & q : s.points)
                result = min(result, p.distance_to(q));
            return result;
        },
        [&](const Curve & c) { return curve_distance(c, p); },
        [&](const Region & r) { return region_distance(r, p); }}
        .visit(space);
}

auto locus::representatives(const Curve & curve, unsigned how_many) -> vector<Vector>
{
    vector<Vector> result;
    overloaded{
        [&](const Circle & c) {
            if (about_zero(c.radius)) {
                result.push_back(c.centre);
                return;
            }
            for (unsigned k = 0; k < how_many; ++k)
                result.push_back(c.centre + Vector::from_angle(2.0 * pi * k / how_many) * c.radius);
        },
        [&](const Line & l) {
            double step = 1.0;
            for (unsigned k = 0; k < how_many; ++k) {
                if (0 == k % 2)
                    result.push_back(l.origin + l.direction * step);
                else {
                    result.push_back(l.origin - l.direction * step);
                    step *= 2.0;
                }
            }
        },
        [&](const Ray & r) {
            double step = 1.0;
            for (unsigned k = 0; k < how_many; ++k, step *= 2.0)
                result.push_back(r.origin + r.direction * step);
        }}
        .visit(curve);
    return result;
}

auto locus::point_on(const Curve & curve, double t) -> Vector
{
    return overloaded{
        [&](const Circle & c) { return c.centre + Vector::from_angle(t) * c.radius; },
        [&](const Line & l) { return l.origin + l.direction * t; },
        [&](const Ray & r) { return r.origin + r.direction * max(0.0, t); }}
        .visit(curve);
}

auto locus::operator<<(ostream & s, const Curve & curve) -> ostream &
{
    overloaded{
        [&](const Circle & c) { s << "circle centre " << c.centre << " radius " << c.radius; },
        [&](const Line & l) { s << "line through " << l.origin << " along " << l.direction; },
        [&](const Ray & r) { s << "ray from " << r.origin << " along " << r.direction; }}
        .visit(curve);
    return s;
}

auto locus::operator<<(ostream & s, const Region & region) -> ostream &
{
    overloaded{
        [&](const HalfPlane & h) { s << "half-plane at " << h.origin << " facing " << h.normal; },
        [&](const Disc & d) { s << "disc centre " << d.centre << " radius " << d.radius; }}
        .visit(region);
    return s;
}

auto locus::operator<<(ostream & s, const PossibilitySpace & space) -> ostream &
{
    overloaded{
        [&](const PointSet & p) {
            s << "points {";
            bool first = true;
            for (auto & v : p.points) {
                s << (first ? " " : ", ") << v;
                first = false;
            }
            s << " }";
        },
        [&](const Curve & c) { s << c; },
        [&](const Region & r) { s << r; }}
        .visit(space);
    return s;
}
