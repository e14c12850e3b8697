#include <locus/constraint_graph.hh>
#include <locus/constraints/angle.hh>
#include <locus/constraints/distance.hh>
#include <locus/constraints/side_of.hh>
#include <locus/exception.hh>

#include <catch2/catch_test_macros.hpp>

#include <utility>
#include <vector>

using namespace locus;

using std::pair;
using std::vector;

TEST_CASE("Creating points")
{
    ConstraintGraph graph;
    auto a = graph.create_origin(Vector{1.0, 2.0}, "A");
    auto b = graph.create_point("B");
    auto [c, d] = graph.create_n_points<2>();

    CHECK(graph.number_of_points() == 4);
    CHECK(c == PointID{2});
    CHECK(d == PointID{3});
    CHECK(graph.is_origin(a));
    CHECK(! graph.is_origin(b));
    CHECK(graph.degrees_of_freedom(a) == 0);
    CHECK(graph.degrees_of_freedom(c) == 2);
    CHECK(graph.origins() == vector{a});
    CHECK(graph.name_of(b) == "B");
    CHECK(graph.name_of(c) == "p2");
    CHECK(graph.find_point("A") == a);
    CHECK(! graph.find_point("Z"));

    auto positions = graph.initial_positions();
    CHECK(positions.has(a));
    CHECK(positions.at(a) == Vector{1.0, 2.0});
    CHECK(! positions.has(b));

    CHECK_THROWS_AS(graph.create_point("A"), NamingError);
    CHECK_THROWS_AS(graph.is_origin(PointID{17}), UnknownID);
}

TEST_CASE("Posting constraints")
{
    ConstraintGraph graph;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto [b, c] = graph.create_n_points<2>();

    auto ab = graph.post(Distance{a, b, 5.0});
    auto bc = graph.post(Distance{b, c, 3.0});
    auto side = graph.post(SideOf{c, a, b, Side::Left});

    CHECK(graph.number_of_constraints() == 3);
    CHECK(graph.constraints_referencing(b) == vector{ab, bc, side});
    CHECK(graph.constraints_referencing(a) == vector{ab, side});
    CHECK(graph.points_of(side) == vector{c, a, b});
    CHECK(graph.constraint(ab).describe() == "distance(p0, p1) = 5");

    CHECK_THROWS_AS(graph.post(Distance{a, a, 1.0}), InvalidConstraint);
    CHECK_THROWS_AS(graph.post(Distance{a, b, -1.0}), InvalidConstraint);
    CHECK_THROWS_AS(graph.post(Distance{a, PointID{9}, 1.0}), UnknownID);
    CHECK(graph.number_of_constraints() == 3);
}

TEST_CASE("Evaluable constraints")
{
    ConstraintGraph graph;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto [b, c, v] = graph.create_n_points<3>();

    auto ab = graph.post(Distance{a, b, 5.0});
    auto bc = graph.post(Distance{b, c, 3.0});
    auto angle = graph.post(Angle{a, v, c, 1.0});

    KnownPoints known{graph.number_of_points()};
    known.insert(a);

    CHECK(graph.evaluable_target(ab, known) == b);
    CHECK(! graph.evaluable_target(bc, known));
    CHECK(graph.currently_evaluable(known) == vector<pair<ConstraintID, PointID>>{{ab, b}});

    known.insert(b);
    CHECK(! graph.evaluable_target(ab, known));
    CHECK(graph.evaluable_for(c, known) == vector{bc});

    SECTION("Unsupported targets are never evaluable")
    {
        known.insert(c);
        CHECK(! graph.evaluable_target(angle, known));
    }

    SECTION("Supported targets are")
    {
        known.insert(v);
        CHECK(graph.evaluable_target(angle, known) == c);
    }
}

TEST_CASE("Fully fixed constraints")
{
    ConstraintGraph graph;
    auto a = graph.create_origin(Vector{0.0, 0.0});
    auto b = graph.create_origin(Vector{3.0, 4.0});
    auto c = graph.create_point();

    auto ab = graph.post(Distance{a, b, 5.0});
    graph.post(Distance{a, c, 5.0});

    CHECK(graph.fully_fixed_constraints() == vector{ab});
}
