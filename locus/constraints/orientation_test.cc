#include <locus/constraints/alignment.hh>
#include <locus/constraints/constraints_test_utils.hh>
#include <locus/constraints/orientation.hh>

#include <catch2/catch_test_macros.hpp>

#include <numbers>

using namespace locus;
using namespace locus::test_innards;

using std::numbers::pi;

TEST_CASE("Orientation")
{
    PointID from{0}, to{1};
    Orientation o{from, to, pi / 3.0};
    Positions positions{2};

    auto along = [&](const Positions & p) {
        auto offset = p.at(to) - p.at(from);
        return about_equal(offset.unit(), Vector::from_angle(pi / 3.0), 1e-9);
    };

    SECTION("Place to")
    {
        positions.place(from, Vector{2.0, 1.0});
        check_locus(o, to, positions, along);
    }

    SECTION("Place from")
    {
        positions.place(to, Vector{-1.0, 4.0});
        check_locus(o, from, positions, along);
    }

    CHECK(o.shape_for(to)->fixed_direction);
    CHECK(about_equal(*o.shape_for(from)->fixed_direction, 4.0 * pi / 3.0));
}

TEST_CASE("Horizontal and vertical")
{
    PointID a{0}, b{1};
    Positions positions{2};
    positions.place(a, Vector{3.0, -2.0});

    SECTION("Horizontal")
    {
        check_locus(Horizontal{a, b}, b, positions, [&](const Positions & p) { return about_equal(p.at(a).y, p.at(b).y); });
        CHECK(about_equal(*Horizontal(a, b).shape_for(b)->fixed_direction, 0.0));
    }

    SECTION("Vertical")
    {
        check_locus(Vertical{a, b}, b, positions, [&](const Positions & p) { return about_equal(p.at(a).x, p.at(b).x); });
        CHECK(about_equal(*Vertical(a, b).shape_for(b)->fixed_direction, pi / 2.0));
    }
}
