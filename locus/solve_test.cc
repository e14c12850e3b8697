#include <locus/constraints/alignment.hh>
#include <locus/constraints/angle.hh>
#include <locus/constraints/distance.hh>
#include <locus/constraints/side_of.hh>
#include <locus/order_planner.hh>
#include <locus/solve.hh>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <numbers>
#include <tuple>
#include <variant>
#include <vector>

#include <fmt/core.h>

using namespace locus;

using std::atomic;
using std::get;
using std::holds_alternative;
using std::sqrt;
using std::tuple;
using std::vector;
using std::numbers::pi;

namespace
{
    auto check_distances(const ConstraintGraph & graph, const Assignment & assignment) -> void
    {
        for (auto & c : graph.all_constraints()) {
            auto & pts = graph.points_of(c);
            auto d = dynamic_cast<const Distance *>(&graph.constraint(c));
            if (d && pts.size() == 2)
                CHECK(about_equal(assignment(pts[0]).distance_to(assignment(pts[1])),
                    graph.constraint(c).shape_for(pts[0])->parameters.at(0), 1e-6));
        }
    }
}

TEST_CASE("Equilateral triangle")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0}, "A");
    auto [b, c] = graph.create_n_points<2>();
    graph.post(Distance{a, b, 5.0});
    graph.post(Distance{a, c, 5.0});
    graph.post(Distance{b, c, 5.0});

    auto outcome = solve(graph, geometry);
    REQUIRE(outcome.status == SolveStatus::Solved);
    REQUIRE(outcome.assignment);
    check_distances(graph, *outcome.assignment);

    CHECK((*outcome.assignment)(a) == Vector{0.0, 0.0});
    CHECK(about_equal((*outcome.assignment)(b), Vector{5.0, 0.0}));
    CHECK(about_equal((*outcome.assignment)(c), Vector{2.5, 5.0 * sqrt(3.0) / 2.0}, 1e-9));
    CHECK(outcome.stats.plans_tried == 1);
    CHECK(outcome.stats.backtracks == 0);

    SECTION("Solving again gives the same answer")
    {
        auto again = solve(graph, geometry);
        REQUIRE(again.assignment);
        CHECK((*again.assignment)(b) == (*outcome.assignment)(b));
        CHECK((*again.assignment)(c) == (*outcome.assignment)(c));
    }
}

TEST_CASE("Under constrained figure fails to order")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_point();
    graph.post(Distance{a, b, 5.0});

    auto outcome = solve(graph, geometry);
    CHECK(outcome.status == SolveStatus::OrderingFailed);
    CHECK(! outcome.assignment);
    CHECK(outcome.stats.plans_tried == 0);
    CHECK(outcome.stats.steps == 0);
}

TEST_CASE("Inconsistent figure is not found within budget")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_point();
    graph.post(Distance{a, b, 5.0});
    graph.post(Distance{a, b, 3.0});

    auto outcome = solve(graph, geometry);
    CHECK(outcome.status == SolveStatus::NotFoundWithinBudget);
    CHECK(! outcome.assignment);
    CHECK(outcome.stats.plans_tried == 1);
    CHECK(outcome.stats.failures == 1);
}

TEST_CASE("Inconsistent origins are not found within budget")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{3.0, 4.0});
    graph.post(Distance{a, b, 6.0});

    CHECK(solve(graph, geometry).status == SolveStatus::NotFoundWithinBudget);
}

namespace
{
    struct Backtracker
    {
        ConstraintGraph graph;
        PointID a, b, c, d;

        Backtracker() :
            a(graph.create_origin(Vector{0.0, 0.0}, "A")),
            b(graph.create_origin(Vector{6.0, 0.0}, "B")),
            c(graph.create_point("C")),
            d(graph.create_point("D"))
        {
            graph.post(Distance{a, c, 5.0});
            graph.post(Distance{b, c, 5.0});
            graph.post(Distance{a, d, 5.0});
            graph.post(Distance{b, d, 5.0});
            graph.post(SideOf{d, a, b, Side::Left});
            graph.post(Distance{c, d, 8.0});
        }
    };
}

TEST_CASE("Backtracking reopens the previous point")
{
    Backtracker figure;
    PlanarGeometry geometry;

    auto planner = plan_orders(figure.graph, geometry);
    auto plan = planner.next();
    REQUIRE(plan);
    REQUIRE(plan->points() == vector{figure.c, figure.d});

    vector<tuple<TraceEvent, PointID, std::size_t>> events;
    SolveOptions options;
    options.trace = [&](TraceEvent e, PointID p, std::size_t depth) {
        events.emplace_back(e, p, depth);
        return true;
    };

    Stats stats;
    auto result = solve_plan(figure.graph, *plan, geometry, options, stats);
    REQUIRE(holds_alternative<Assignment>(result));
    auto & assignment = get<Assignment>(result);
    CHECK(about_equal(assignment(figure.c), Vector{3.0, -4.0}));
    CHECK(about_equal(assignment(figure.d), Vector{3.0, 4.0}));

    CHECK(stats.backtracks == 1);
    CHECK(stats.failures == 1);
    CHECK(stats.steps == 3);
    CHECK(stats.max_depth == 2);
    CHECK(events == vector<tuple<TraceEvent, PointID, std::size_t>>{
                        {TraceEvent::Resolved, figure.c, 1},
                        {TraceEvent::Exhausted, figure.d, 1},
                        {TraceEvent::Backtracked, figure.c, 1},
                        {TraceEvent::Resolved, figure.d, 2}});
}

TEST_CASE("Exhausting every candidate fails the plan")
{
    Backtracker figure;
    figure.graph.post(Distance{figure.c, figure.d, 7.0});
    PlanarGeometry geometry;

    auto planner = plan_orders(figure.graph, geometry);
    auto plan = planner.next();
    REQUIRE(plan);

    Stats stats;
    auto result = solve_plan(figure.graph, *plan, geometry, SolveOptions{}, stats);
    REQUIRE(holds_alternative<SolveFailure>(result));
    CHECK(get<SolveFailure>(result).reason == FailureReason::Exhausted);
    CHECK(stats.backtracks == 2);
}

TEST_CASE("Candidate ordering can avoid backtracking")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{6.0, 0.0});
    auto e = graph.create_origin(Vector{3.0, -10.0});
    auto [c, d] = graph.create_n_points<2>();
    graph.post(Distance{a, c, 5.0});
    graph.post(Distance{b, c, 5.0});
    graph.post(Distance{e, d, 1.0});
    graph.post(Distance{c, d, 5.0});

    SECTION("As listed")
    {
        auto outcome = solve(graph, geometry);
        REQUIRE(outcome.status == SolveStatus::Solved);
        CHECK(outcome.stats.backtracks == 1);
        CHECK(about_equal((*outcome.assignment)(c), Vector{3.0, -4.0}));
        CHECK(about_equal((*outcome.assignment)(d), Vector{3.0, -9.0}));
    }

    SECTION("Closest to future")
    {
        auto outcome = solve(graph, geometry, SolveOptions{.candidate_order = candidate_order::closest_to_future()});
        REQUIRE(outcome.status == SolveStatus::Solved);
        CHECK(outcome.stats.backtracks == 0);
        CHECK(about_equal((*outcome.assignment)(c), Vector{3.0, -4.0}));
    }
}

TEST_CASE("Constraints that cannot place their last point still get checked")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{6.0, 0.0});
    auto v = graph.create_point();
    graph.post(Distance{a, v, 3.0 * sqrt(2.0)});
    graph.post(Distance{b, v, 3.0 * sqrt(2.0)});
    // Of (3, 3) and (3, -3), only the second turns clockwise from a to b.
    graph.post(Angle{a, v, b, -pi / 2.0});

    auto outcome = solve(graph, geometry);
    REQUIRE(outcome.status == SolveStatus::Solved);
    CHECK(about_equal((*outcome.assignment)(v), Vector{3.0, -3.0}, 1e-9));
    CHECK(outcome.stats.backtracks == 0);
}

TEST_CASE("Cancellation")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto previous = graph.create_origin(Vector{0.0, 0.0});
    auto before_that = graph.create_origin(Vector{1.0, 0.0});
    for (int i = 0; i < 200; ++i) {
        auto p = graph.create_point();
        graph.post(Distance{previous, p, 1.0});
        graph.post(Distance{before_that, p, 1.0});
        before_that = previous;
        previous = p;
    }

    atomic<bool> abort_flag{false};
    unsigned long long resolved = 0;
    SolveOptions options;
    options.trace = [&](TraceEvent e, PointID, std::size_t) {
        if (e == TraceEvent::Resolved && ++resolved == 10)
            abort_flag = true;
        return true;
    };

    SECTION("From the abort flag")
    {
        auto outcome = solve(graph, geometry, options, &abort_flag);
        CHECK(outcome.status == SolveStatus::Cancelled);
        CHECK(! outcome.assignment);
        CHECK(outcome.stats.steps == 10);
    }

    SECTION("From the trace callback")
    {
        options.trace = [&](TraceEvent, PointID, std::size_t depth) { return depth < 5; };
        auto outcome = solve(graph, geometry, options);
        CHECK(outcome.status == SolveStatus::Cancelled);
        CHECK(! outcome.assignment);
    }

    SECTION("Without cancelling, it solves")
    {
        auto outcome = solve(graph, geometry, options);
        CHECK(outcome.status == SolveStatus::Solved);
        REQUIRE(outcome.assignment);
        check_distances(graph, *outcome.assignment);
    }
}

TEST_CASE("Step limit")
{
    Backtracker figure;
    figure.graph.post(Distance{figure.c, figure.d, 7.0});
    PlanarGeometry geometry;

    SolveOptions options;
    options.step_limit = 2;
    auto outcome = solve(figure.graph, geometry, options);
    CHECK(outcome.status == SolveStatus::NotFoundWithinBudget);
    CHECK(outcome.stats.steps == 2);
}

TEST_CASE("Plan limit")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_point();
    graph.post(Distance{a, b, 5.0});
    graph.post(Horizontal{a, b});

    SolveOptions options;
    options.plan_limit = 0;
    CHECK(solve(graph, geometry, options).status == SolveStatus::NotFoundWithinBudget);
}

TEST_CASE("A second origin pins the orbiter down")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto d = graph.create_origin(Vector{10.0, 0.0});
    auto [b, c] = graph.create_n_points<2>();
    graph.post(Distance{a, b, 5.0});
    graph.post(Distance{d, c, 5.0});
    graph.post(Distance{b, c, 3.0});
    graph.post(Horizontal{b, c});

    auto outcome = solve(graph, geometry);
    REQUIRE(outcome.status == SolveStatus::Solved);
    REQUIRE(outcome.assignment);
    check_distances(graph, *outcome.assignment);

    CHECK(about_equal((*outcome.assignment)(b), Vector{3.5, sqrt(12.75)}, 1e-6));
    CHECK(about_equal((*outcome.assignment)(c), Vector{6.5, sqrt(12.75)}, 1e-6));
    CHECK(outcome.stats.orbiter_searches >= 1);
    CHECK(outcome.stats.plans_tried == 1);
}

TEST_CASE("Time limit")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto [b, c] = graph.create_n_points<2>();
    graph.post(Distance{a, b, 5.0});
    graph.post(Distance{a, c, 5.0});
    graph.post(Distance{b, c, 5.0});

    SolveOptions options;
    options.time_limit = std::chrono::milliseconds{0};

    SECTION("Running out of time is not found within budget")
    {
        auto outcome = solve(graph, geometry, options);
        CHECK(outcome.status == SolveStatus::NotFoundWithinBudget);
        CHECK(! outcome.assignment);
        CHECK(outcome.stats.steps == 0);
        CHECK(outcome.stats.plans_tried == 0);
    }

    SECTION("A single plan stops with its budget exceeded")
    {
        auto planner = plan_orders(graph, geometry);
        auto plan = planner.next();
        REQUIRE(plan);

        Stats stats;
        auto result = solve_plan(graph, *plan, geometry, options, stats);
        REQUIRE(holds_alternative<SolveFailure>(result));
        CHECK(get<SolveFailure>(result).reason == FailureReason::BudgetExceeded);
        CHECK(stats.steps == 0);
    }
}

TEST_CASE("Outcomes are formattable")
{
    CHECK(fmt::format("{}", SolveStatus::NotFoundWithinBudget) == "not found within budget");
    CHECK(fmt::format("{}", FailureReason::Cancelled) == "cancelled");
    CHECK(fmt::format("{}", TraceEvent::Backtracked) == "backtracked");
}
