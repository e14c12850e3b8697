/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CANDIDATE_ORDER_HH
#define LOCUS_GUARD_LOCUS_CANDIDATE_ORDER_HH

#include <locus/constraint_graph.hh>
#include <locus/geometry_provider.hh>
#include <locus/order_plan.hh>
#include <locus/positions.hh>
#include <locus/vector.hh>

#include <cstddef>
#include <functional>
#include <vector>

namespace locus
{
    /**
     * \defgroup CandidateOrders Orderings for candidate positions
     *
     * \sa SolveOptions
     */

    /**
     * \brief Everything a CandidateOrder may look at when deciding which
     * candidate to try first.
     *
     * \ingroup CandidateOrders
     */
    struct CandidateContext final
    {
        const ConstraintGraph & graph;
        const GeometryProvider & geometry;
        const OrderPlan & plan;

        /// The entry in the plan being resolved. Its point is not yet placed.
        std::size_t entry;

        const Positions & positions;
    };

    /**
     * \brief Reorders the candidates for a point in place. The first
     * candidate is tried first, and the rest become alternatives for
     * backtracking. Must be deterministic.
     *
     * \ingroup CandidateOrders
     */
    using CandidateOrder = std::function<auto(const CandidateContext &, std::vector<Vector> &)->void>;

    /**
     * Candidate ordering heuristics.
     *
     * \ingroup CandidateOrders
     */
    namespace candidate_order
    {
        /**
         * Try candidates in the order the GeometryProvider listed them.
         *
         * \ingroup CandidateOrders
         */
        [[nodiscard]] auto as_listed() -> CandidateOrder;

        /**
         * Prefer candidates that are closest to where a later point will
         * have to go. Looks for the first later entry in the plan that
         * already has possibility spaces without the current point, and
         * stably sorts candidates by their summed distance to those
         * spaces. If there is no such entry, the order is left alone.
         *
         * \ingroup CandidateOrders
         */
        [[nodiscard]] auto closest_to_future() -> CandidateOrder;
    }
}

#endif
