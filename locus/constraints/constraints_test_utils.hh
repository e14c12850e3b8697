#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_CONSTRAINTS_TEST_UTILS_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_CONSTRAINTS_TEST_UTILS_HH

#include <locus/constraint.hh>
#include <locus/positions.hh>
#include <locus/possibility_space.hh>

#include <catch2/catch_test_macros.hpp>

#include <variant>

namespace locus::test_innards
{
    /**
     * Check a constraint's locus for target against a direct test of the
     * constraint. Samples along a curve must all satisfy it, and for an
     * areal locus, membership must agree with it over a grid of positions.
     */
    template <typename Satisfied_>
    auto check_locus(const Constraint & constraint, PointID target, Positions positions, Satisfied_ satisfied) -> void
    {
        auto result = constraint.locus_for(target, positions);
        REQUIRE(std::holds_alternative<PossibilitySpace>(result));
        auto & space = std::get<PossibilitySpace>(result);

        if (auto curve = std::get_if<Curve>(&space)) {
            for (auto & v : representatives(*curve, 8)) {
                positions.place(target, v);
                CHECK(satisfied(positions));
                positions.clear(target);
            }
        }
        else {
            for (int x = -5; x <= 5; ++x)
                for (int y = -5; y <= 5; ++y) {
                    Vector v{double(x), double(y)};
                    positions.place(target, v);
                    CHECK(contains(space, v, 1e-6) == satisfied(positions));
                    positions.clear(target);
                }
        }
    }
}

#endif
