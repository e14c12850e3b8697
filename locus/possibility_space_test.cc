#include <locus/possibility_space.hh>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>

#include <fmt/core.h>

using namespace locus;

using std::sqrt;

TEST_CASE("Dimension of spaces")
{
    CHECK(dimension(PointSet{{Vector{1.0, 1.0}}}) == Dimension::Zero);
    CHECK(dimension(Curve{Circle{Vector{0.0, 0.0}, 1.0}}) == Dimension::One);
    CHECK(dimension(Curve{Ray{Vector{0.0, 0.0}, Vector{1.0, 0.0}}}) == Dimension::One);
    CHECK(dimension(Region{Disc{Vector{0.0, 0.0}, 1.0}}) == Dimension::Two);
}

TEST_CASE("Membership")
{
    SECTION("Circle")
    {
        PossibilitySpace s = Curve{Circle{Vector{1.0, 1.0}, 2.0}};
        CHECK(contains(s, Vector{3.0, 1.0}, 1e-6));
        CHECK(contains(s, Vector{1.0, -1.0}, 1e-6));
        CHECK(! contains(s, Vector{1.0, 1.0}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{1.0, 5.0}), 2.0));
    }

    SECTION("Line")
    {
        PossibilitySpace s = Curve{Line{Vector{0.0, 1.0}, Vector{1.0, 0.0}}};
        CHECK(contains(s, Vector{-100.0, 1.0}, 1e-6));
        CHECK(! contains(s, Vector{0.0, 1.1}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{7.0, -2.0}), 3.0));
    }

    SECTION("Ray")
    {
        PossibilitySpace s = Curve{Ray{Vector{0.0, 0.0}, Vector{1.0, 0.0}}};
        CHECK(contains(s, Vector{10.0, 0.0}, 1e-6));
        CHECK(contains(s, Vector{0.0, 0.0}, 1e-6));
        CHECK(! contains(s, Vector{-1.0, 0.0}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{-3.0, 4.0}), 5.0));
    }

    SECTION("Half-plane")
    {
        PossibilitySpace s = Region{HalfPlane{Vector{0.0, 0.0}, Vector{0.0, 2.0}}};
        CHECK(contains(s, Vector{5.0, 3.0}, 1e-6));
        CHECK(contains(s, Vector{5.0, 0.0}, 1e-6));
        CHECK(! contains(s, Vector{5.0, -0.5}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{5.0, -0.5}), 0.5));
    }

    SECTION("Disc")
    {
        PossibilitySpace s = Region{Disc{Vector{0.0, 0.0}, 2.0}};
        CHECK(contains(s, Vector{1.0, 1.0}, 1e-6));
        CHECK(! contains(s, Vector{2.0, 2.0}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{0.0, 0.0}), 0.0));
    }

    SECTION("Point set")
    {
        PossibilitySpace s = PointSet{{Vector{0.0, 0.0}, Vector{3.0, 4.0}}};
        CHECK(contains(s, Vector{3.0, 4.0}, 1e-6));
        CHECK(! contains(s, Vector{3.0, 3.0}, 1e-6));
        CHECK(about_equal(distance_to(s, Vector{3.0, 3.0}), 1.0));
    }
}

TEST_CASE("Representatives")
{
    SECTION("Circle starts at angle zero and goes round")
    {
        auto r = representatives(Curve{Circle{Vector{1.0, 1.0}, 2.0}}, 4);
        REQUIRE(r.size() == 4);
        CHECK(about_equal(r[0], Vector{3.0, 1.0}));
        CHECK(about_equal(r[1], Vector{1.0, 3.0}));
        CHECK(about_equal(r[2], Vector{-1.0, 1.0}));
        CHECK(about_equal(r[3], Vector{1.0, -1.0}));
    }

    SECTION("Ray doubles in distance")
    {
        auto r = representatives(Curve{Ray{Vector{0.0, 0.0}, Vector{0.0, 1.0}}}, 3);
        REQUIRE(r.size() == 3);
        CHECK(about_equal(r[0], Vector{0.0, 1.0}));
        CHECK(about_equal(r[1], Vector{0.0, 2.0}));
        CHECK(about_equal(r[2], Vector{0.0, 4.0}));
    }

    SECTION("Line alternates sides")
    {
        auto r = representatives(Curve{Line{Vector{0.0, 0.0}, Vector{1.0, 0.0}}}, 4);
        REQUIRE(r.size() == 4);
        CHECK(about_equal(r[0], Vector{1.0, 0.0}));
        CHECK(about_equal(r[1], Vector{-1.0, 0.0}));
        CHECK(about_equal(r[2], Vector{2.0, 0.0}));
        CHECK(about_equal(r[3], Vector{-2.0, 0.0}));
    }

    SECTION("Every representative lies on its curve")
    {
        Curve c = Circle{Vector{-2.0, 5.0}, sqrt(2.0)};
        for (auto & v : representatives(c, 8))
            CHECK(contains(c, v, 1e-9));
    }
}

TEST_CASE("Positions along a curve")
{
    CHECK(about_equal(point_on(Curve{Circle{Vector{1.0, 1.0}, 2.0}}, std::numbers::pi / 2.0), Vector{1.0, 3.0}));
    CHECK(about_equal(point_on(Curve{Line{Vector{1.0, 0.0}, Vector{0.0, 1.0}}}, -3.0), Vector{1.0, -3.0}));
    CHECK(about_equal(point_on(Curve{Ray{Vector{1.0, 0.0}, Vector{0.0, 1.0}}}, 3.0), Vector{1.0, 3.0}));
    CHECK(about_equal(point_on(Curve{Ray{Vector{1.0, 0.0}, Vector{0.0, 1.0}}}, -3.0), Vector{1.0, 0.0}));
}

TEST_CASE("Space formatting")
{
    CHECK(fmt::format("{}", PossibilitySpace{Curve{Circle{Vector{0.0, 0.0}, 5.0}}}) == "circle centre (0, 0) radius 5");
    CHECK(fmt::format("{}", PossibilitySpace{PointSet{{Vector{1.0, 2.0}}}}) == "points { (1, 2) }");
}
