/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_INNARDS_ORBITER_SEARCH_HH
#define LOCUS_GUARD_LOCUS_INNARDS_ORBITER_SEARCH_HH

#include <locus/constraint_graph.hh>
#include <locus/geometry_provider.hh>
#include <locus/order_plan.hh>
#include <locus/positions.hh>
#include <locus/possibility_space.hh>
#include <locus/stats.hh>

#include <cstddef>
#include <vector>

namespace locus::innards
{
    /**
     * \brief Constraints that become fully placed along with this point, but
     * which are unable to place it themselves, so never turn up as evaluable
     * for it. These can only be checked once the point has a position.
     */
    [[nodiscard]] auto checks_for(const ConstraintGraph &, PointID, const GeometryProvider &,
        const Positions &) -> std::vector<ConstraintID>;

    /**
     * \brief Chooses positions for the orbiter of an OrderPlan, which only
     * has one curve when it is reached.
     *
     * If the rest of the plan can be met equally well wherever the orbiter
     * goes on that curve, the figure is free to turn or slide, and evenly
     * spread samples are all that is needed. Otherwise the constraints
     * further along the plan pin the orbiter down, and the curve is
     * searched for the positions where they can all be met.
     */
    struct OrbiterSearch final
    {
        const ConstraintGraph & graph;
        const OrderPlan & plan;
        const GeometryProvider & geometry;
        std::size_t entry;

        /**
         * How far the constraints from the orbiter onwards are from being
         * satisfied with the orbiter at this position. Later points are
         * placed using only the constraints that make them discrete, every
         * branch is followed, and the best total distance to the remaining
         * loci is returned. Infinite if no branch reaches the end of the
         * plan.
         */
        [[nodiscard]] auto residual(const Positions &, const std::vector<PossibilitySpace> & spaces,
            const Vector &) const -> double;

        /**
         * Positions for the orbiter on its curve, in order along the curve.
         * The curve is divided into search_steps pieces if it is a circle,
         * and searched outwards at doubling distances otherwise.
         */
        [[nodiscard]] auto positions(const Positions &, const std::vector<PossibilitySpace> & spaces,
            const Curve &, unsigned samples, unsigned search_steps, Stats &) const -> std::vector<Vector>;
    };
}

#endif
