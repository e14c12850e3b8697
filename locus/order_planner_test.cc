#include <locus/constraints/alignment.hh>
#include <locus/constraints/distance.hh>
#include <locus/constraints/side_of.hh>
#include <locus/order_planner.hh>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include <fmt/core.h>

using namespace locus;

using std::count;
using std::vector;

namespace
{
    // Every point that is not an origin appears exactly once, and each entry
    // carries at least two pairwise independent one dimensional constraints.
    auto check_plan(const ConstraintGraph & graph, const GeometryProvider & geometry, const OrderPlan & plan) -> void
    {
        auto points = plan.points();
        for (auto & p : graph.all_points())
            CHECK(count(points.begin(), points.end(), p) == (graph.is_origin(p) ? 0 : 1));

        for (auto & e : plan.entries) {
            REQUIRE(e.contributing.size() >= 2);
            for (auto & c : e.contributing) {
                auto shape = geometry.shape_for(graph.constraint(c), e.point);
                REQUIRE(shape);
                CHECK(shape->dimension == Dimension::One);
            }
            for (unsigned i = 0; i < e.contributing.size(); ++i)
                for (unsigned j = i + 1; j < e.contributing.size(); ++j)
                    CHECK(geometry.independent(*geometry.shape_for(graph.constraint(e.contributing[i]), e.point),
                        *geometry.shape_for(graph.constraint(e.contributing[j]), e.point)));
        }
    }
}

TEST_CASE("Triangle plans with an orbiter")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0}, "A");
    auto [b, c] = graph.create_n_points<2>();
    auto ab = graph.post(Distance{a, b, 5.0});
    auto ac = graph.post(Distance{a, c, 5.0});
    auto bc = graph.post(Distance{b, c, 5.0});

    auto planner = plan_orders(graph, geometry);
    auto plan = planner.next();
    REQUIRE(plan);
    check_plan(graph, geometry, *plan);

    CHECK(plan->root == a);
    CHECK(plan->orbiter == b);
    REQUIRE(plan->entries.size() == 2);
    CHECK(plan->entries[0].point == b);
    CHECK(plan->entries[0].orbiter);
    CHECK(plan->entries[0].contributing == vector{ab, bc});
    CHECK(plan->entries[1].point == c);
    CHECK(! plan->entries[1].orbiter);
    CHECK(plan->entries[1].contributing == vector{ac, bc});
    CHECK(fmt::format("{}", *plan) == "root p0 orbiter p1: p1 orbiting by c0 c2, p2 by c1 c2");

    SECTION("The pair with c as orbiter is redundant")
    {
        CHECK(! planner.next());
        CHECK(planner.pairs_explored() == 1);
        CHECK(planner.pairs_skipped() == 1);
        CHECK(planner.plans_produced() == 1);
    }

    SECTION("Restarting gives the same plans again")
    {
        planner.restart();
        auto again = planner.next();
        REQUIRE(again);
        CHECK(again->points() == plan->points());
        CHECK(again->entries[0].contributing == plan->entries[0].contributing);
    }
}

TEST_CASE("Rigid figures need no orbiter")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{6.0, 0.0});
    auto [c, d] = graph.create_n_points<2>();
    graph.post(Distance{a, c, 5.0});
    graph.post(Distance{b, c, 5.0});
    auto left = graph.post(SideOf{c, a, b, Side::Left});
    graph.post(Distance{c, d, 1.0});
    graph.post(Horizontal{c, d});

    auto planner = plan_orders(graph, geometry);
    auto plan = planner.next();
    REQUIRE(plan);
    check_plan(graph, geometry, *plan);
    CHECK(! plan->root);
    CHECK(! plan->orbiter);
    CHECK(plan->points() == vector{c, d});
    CHECK(plan->entries[0].filters == vector{left});

    CHECK(! planner.next());
    CHECK(planner.pairs_explored() == 0);
}

TEST_CASE("Under constrained figures have no plan")
{
    PlanarGeometry geometry;

    SECTION("One distance")
    {
        ConstraintGraph graph;
        auto a = graph.create_origin(Vector{0.0, 0.0});
        auto b = graph.create_point();
        graph.post(Distance{a, b, 5.0});

        auto planner = plan_orders(graph, geometry);
        CHECK(! planner.next());
        CHECK(planner.pairs_explored() == 1);
    }

    SECTION("Identical constraints do not count twice")
    {
        ConstraintGraph graph;
        auto a = graph.create_origin(Vector{0.0, 0.0});
        auto b = graph.create_point();
        graph.post(Distance{a, b, 5.0});
        graph.post(Distance{b, a, 5.0});

        auto planner = plan_orders(graph, geometry);
        CHECK(! planner.next());
    }

    SECTION("Parallel lines do not count twice")
    {
        ConstraintGraph graph;
        auto a = graph.create_origin(Vector{0.0, 0.0});
        auto b = graph.create_origin(Vector{0.0, 3.0});
        auto c = graph.create_point();
        graph.post(Horizontal{a, c});
        graph.post(Horizontal{b, c});

        auto planner = plan_orders(graph, geometry);
        CHECK(! planner.next());
    }

    SECTION("No origins")
    {
        ConstraintGraph graph;
        auto [a, b] = graph.create_n_points<2>();
        graph.post(Distance{a, b, 5.0});

        auto planner = plan_orders(graph, geometry);
        CHECK(! planner.next());
    }

    SECTION("Disconnected point")
    {
        ConstraintGraph graph;
        auto a = graph.create_origin(Vector{0.0, 0.0});
        auto [b, c] = graph.create_n_points<2>();
        static_cast<void>(c);
        graph.post(Distance{a, b, 5.0});
        graph.post(Horizontal{a, b});

        auto planner = plan_orders(graph, geometry);
        CHECK(! planner.next());
    }
}

TEST_CASE("Areal constraints never make a point discrete")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{6.0, 0.0});
    auto c = graph.create_point();
    graph.post(Distance{a, c, 5.0});
    graph.post(SideOf{c, a, b, Side::Left});

    auto planner = plan_orders(graph, geometry);
    CHECK(! planner.next());
}

TEST_CASE("A point one plan has orbited is not orbited again")
{
    ConstraintGraph graph;
    PlanarGeometry geometry;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{10.0, 0.0});
    auto [p, q] = graph.create_n_points<2>();
    graph.post(Horizontal{a, p});
    graph.post(Horizontal{b, p});
    graph.post(Distance{a, q, 5.0});
    graph.post(Distance{p, q, 5.0});

    auto planner = plan_orders(graph, geometry);
    vector<OrderPlan> plans;
    while (auto plan = planner.next()) {
        check_plan(graph, geometry, *plan);
        plans.push_back(*plan);
    }

    REQUIRE(plans.size() == 1);
    CHECK(plans[0].root == a);
    CHECK(plans[0].orbiter == p);
    CHECK(plans[0].points() == vector{p, q});

    // Orbiting q from a, or p from b, could only rediscover p and q.
    CHECK(planner.pairs_skipped() == 2);
    CHECK(planner.pairs_explored() == 1);
}
