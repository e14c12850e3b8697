/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/innards/orbiter_search.hh>

#include <util/overloaded.hh>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <utility>

using namespace locus;
using namespace locus::innards;

using std::all_of;
using std::get_if;
using std::isfinite;
using std::ldexp;
using std::max;
using std::move;
using std::none_of;
using std::numeric_limits;
using std::reverse;
using std::size_t;
using std::sqrt;
using std::vector;
using std::numbers::pi;

namespace
{
    // Lines and rays are searched from 2^-4 to 2^16 away from their origin,
    // with each doubling split into this many pieces.
    constexpr int smallest_doubling = -4, largest_doubling = 16, pieces_per_doubling = 4;

    constexpr int golden_section_iterations = 100;

    auto locus_residual(const LocusResult & locus, const Vector & at) -> double
    {
        return overloaded{
            [&](const PossibilitySpace & s) { return distance_to(s, at); },
            [&](const Degenerate &) { return 0.0; }}
            .visit(locus);
    }

    auto outwards(vector<double> & result, double sign) -> void
    {
        for (int k = smallest_doubling; k < largest_doubling; ++k)
            for (int j = 0; j < pieces_per_doubling; ++j)
                result.push_back(sign * ldexp(1.0 + static_cast<double>(j) / pieces_per_doubling, k));
    }

    auto search_grid(const Curve & curve, unsigned steps) -> vector<double>
    {
        vector<double> result;
        overloaded{
            [&](const Circle &) {
                steps = max(steps, 1u);
                for (unsigned k = 0; k <= steps; ++k)
                    result.push_back(2.0 * pi * k / steps);
            },
            [&](const Line &) {
                outwards(result, -1.0);
                reverse(result.begin(), result.end());
                result.push_back(0.0);
                outwards(result, 1.0);
            },
            [&](const Ray &) {
                result.push_back(0.0);
                outwards(result, 1.0);
            }}
            .visit(curve);
        return result;
    }

    auto golden_section(const auto & f, double lo, double hi) -> double
    {
        const double ratio = (sqrt(5.0) - 1.0) / 2.0;
        double x1 = hi - ratio * (hi - lo), x2 = lo + ratio * (hi - lo);
        double f1 = f(x1), f2 = f(x2);
        for (int i = 0; i < golden_section_iterations; ++i) {
            if (f1 <= f2) {
                hi = x2;
                x2 = x1;
                f2 = f1;
                x1 = hi - ratio * (hi - lo);
                f1 = f(x1);
            }
            else {
                lo = x1;
                x1 = x2;
                f1 = f2;
                x2 = lo + ratio * (hi - lo);
                f2 = f(x2);
            }
        }
        return f1 <= f2 ? x1 : x2;
    }

    struct Descent
    {
        const OrbiterSearch & search;
        Positions trial;
        double best = numeric_limits<double>::infinity();

        auto check_residual(ConstraintID c) const -> double
        {
            auto & constraint = search.graph.constraint(c);
            for (auto & p : search.graph.points_of(c))
                if (search.geometry.shape_for(constraint, p))
                    return locus_residual(search.geometry.possibility_space(constraint, p, trial), trial.at(p));
            return 0.0;
        }

        auto run(size_t e, double so_far) -> void
        {
            if (so_far >= best)
                return;

            if (e == search.plan.entries.size()) {
                best = so_far;
                return;
            }

            auto & here = search.plan.entries[e];
            vector<PossibilitySpace> spaces;
            for (auto & c : here.contributing) {
                auto locus = search.geometry.possibility_space(search.graph.constraint(c), here.point, trial);
                auto space = get_if<PossibilitySpace>(&locus);
                if (! space)
                    return;
                spaces.push_back(move(*space));
            }

            auto found = search.geometry.intersect(spaces);
            auto finite = get_if<FinitePoints>(&found);
            if (! finite)
                return;

            auto checks = checks_for(search.graph, here.point, search.geometry, trial);
            for (auto & v : finite->points) {
                trial.place(here.point, v);
                double r = so_far;
                for (auto & c : here.filters)
                    r += locus_residual(search.geometry.possibility_space(search.graph.constraint(c), here.point, trial), v);
                for (auto & c : checks)
                    r += check_residual(c);
                run(e + 1, r);
                trial.clear(here.point);
            }
        }
    };
}

auto locus::innards::checks_for(const ConstraintGraph & graph, PointID point, const GeometryProvider & geometry,
    const Positions & positions) -> vector<ConstraintID>
{
    vector<ConstraintID> result;
    for (auto & c : graph.constraints_referencing(point)) {
        if (geometry.shape_for(graph.constraint(c), point))
            continue;

        bool others_placed = true;
        for (auto & p : graph.points_of(c))
            if (p != point && ! positions.has(p))
                others_placed = false;

        if (others_placed)
            result.push_back(c);
    }
    return result;
}

auto OrbiterSearch::residual(const Positions & known, const vector<PossibilitySpace> & spaces, const Vector & at) const -> double
{
    auto point = plan.entries.at(entry).point;

    double so_far = 0.0;
    for (auto & s : spaces)
        so_far += distance_to(s, at);

    Descent descent{*this, known};
    auto checks = checks_for(graph, point, geometry, descent.trial);
    descent.trial.place(point, at);
    for (auto & c : checks)
        so_far += descent.check_residual(c);

    descent.run(entry + 1, so_far);
    return descent.best;
}

auto OrbiterSearch::positions(const Positions & known, const vector<PossibilitySpace> & spaces, const Curve & curve,
    unsigned samples, unsigned search_steps, Stats & stats) const -> vector<Vector>
{
    auto tolerance = geometry.tolerance();

    vector<Vector> fitting;
    bool every_sample_fits = true;
    for (auto & v : geometry.sample(curve, samples)) {
        if (! all_of(spaces.begin(), spaces.end(), [&](const PossibilitySpace & s) { return contains(s, v, tolerance); }))
            continue;
        if (residual(known, spaces, v) <= tolerance)
            fitting.push_back(v);
        else
            every_sample_fits = false;
    }

    if (every_sample_fits && ! fitting.empty())
        return fitting;

    ++stats.orbiter_searches;

    auto along = [&](double t) { return residual(known, spaces, point_on(curve, t)); };

    auto grid = search_grid(curve, search_steps);
    vector<double> values;
    for (auto & t : grid)
        values.push_back(along(t));

    // Every local minimum on the grid is narrowed down between its
    // neighbours, and kept if the constraints can all be met there.
    vector<Vector> result;
    for (size_t i = 0; i < grid.size(); ++i) {
        if (! isfinite(values[i]))
            continue;
        if (i > 0 && values[i - 1] < values[i])
            continue;
        if (i + 1 < grid.size() && values[i + 1] < values[i])
            continue;

        auto t = golden_section(along, grid[i > 0 ? i - 1 : i], grid[i + 1 < grid.size() ? i + 1 : i]);
        if (along(t) > tolerance)
            continue;

        auto v = point_on(curve, t);
        if (none_of(result.begin(), result.end(), [&](const Vector & r) { return about_equal(r, v, tolerance); }))
            result.push_back(v);
    }

    return result;
}
