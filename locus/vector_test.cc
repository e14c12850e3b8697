#include <locus/vector.hh>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>

#include <fmt/core.h>

using namespace locus;

using std::numbers::pi;

TEST_CASE("Vector arithmetic")
{
    Vector a{3.0, 4.0}, b{1.0, -2.0};

    CHECK(a + b == Vector{4.0, 2.0});
    CHECK(a - b == Vector{2.0, 6.0});
    CHECK(-a == Vector{-3.0, -4.0});
    CHECK(a * 2.0 == Vector{6.0, 8.0});
    CHECK(2.0 * a == Vector{6.0, 8.0});
    CHECK(a / 2.0 == Vector{1.5, 2.0});
    CHECK(a.dot(b) == -5.0);
    CHECK(a.cross(b) == -10.0);
    CHECK(a.magnitude() == 5.0);
    CHECK(a.distance_to(Vector{0.0, 0.0}) == 5.0);
}

TEST_CASE("Vector directions")
{
    CHECK(about_equal(Vector{3.0, 4.0}.unit(), Vector{0.6, 0.8}));
    CHECK(Vector{1.0, 0.0}.perpendicular() == Vector{-0.0, 1.0});
    CHECK(about_equal(Vector{1.0, 0.0}.rotated(pi / 2.0), Vector{0.0, 1.0}));
    CHECK(about_equal(Vector::from_angle(pi), Vector{-1.0, 0.0}));
    CHECK(about_equal(Vector{0.0, 2.0}.angle(), pi / 2.0));
    CHECK(parallel(Vector{1.0, 1.0}, Vector{-2.0, -2.0}));
    CHECK(! parallel(Vector{1.0, 1.0}, Vector{1.0, -1.0}));
}

TEST_CASE("Vector tolerance")
{
    CHECK(about_zero(1e-12));
    CHECK(! about_zero(1e-6));
    CHECK(about_equal(1.0, 1.0 + 1e-12));
    CHECK(about_equal(1.0, 1.1, 0.2));
    CHECK(about_equal(Vector{1.0, 2.0}, Vector{1.0 + 1e-12, 2.0 - 1e-12}));
}

TEST_CASE("Vector formatting")
{
    CHECK(fmt::format("{}", Vector{1.5, -2.0}) == "(1.5, -2)");
}
