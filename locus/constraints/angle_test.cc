#include <locus/constraints/angle.hh>
#include <locus/constraints/constraints_test_utils.hh>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>
#include <variant>

using namespace locus;
using namespace locus::test_innards;

using std::holds_alternative;
using std::remainder;
using std::numbers::pi;

TEST_CASE("Angle")
{
    PointID a{0}, vertex{1}, b{2};
    Angle angle{a, vertex, b, pi / 2.0};
    Positions positions{3};
    positions.place(vertex, Vector{1.0, 1.0});

    auto right_angle = [&](const Positions & p) {
        auto from = (p.at(a) - p.at(vertex)).angle(), to = (p.at(b) - p.at(vertex)).angle();
        return about_zero(remainder(to - from - pi / 2.0, 2.0 * pi), 1e-9);
    };

    SECTION("Place b")
    {
        positions.place(a, Vector{3.0, 1.0});
        check_locus(angle, b, positions, right_angle);
    }

    SECTION("Place a")
    {
        positions.place(b, Vector{1.0, -4.0});
        check_locus(angle, a, positions, right_angle);
    }

    SECTION("Arm on the vertex")
    {
        positions.place(a, Vector{1.0, 1.0});
        CHECK(holds_alternative<Degenerate>(angle.locus_for(b, positions)));
    }

    CHECK(! angle.shape_for(vertex));
}
