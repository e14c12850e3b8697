/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_ORDER_PLAN_HH
#define LOCUS_GUARD_LOCUS_ORDER_PLAN_HH

#include <locus/point_id.hh>

#include <iosfwd>
#include <optional>
#include <vector>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \defgroup Planning Planning orders
     */

    /**
     * \brief One step of an OrderPlan: the point to place next, and the
     * constraints that make it discrete at that moment.
     *
     * \ingroup Planning
     */
    struct PlanEntry final
    {
        PointID point;

        /// Two or more independent one dimensional constraints. For an
        /// orbiter, the first is the constraint from the root and the
        /// second is the constraint that closes it later on.
        std::vector<ConstraintID> contributing;

        /// Everything else that is evaluable for this point when it is
        /// reached, including areal constraints.
        std::vector<ConstraintID> filters;

        /// Placed by sampling its single curve from the root, rather than
        /// by intersection.
        bool orbiter = false;
    };

    /**
     * \brief A total order over every point that is not an origin, such
     * that each point is discrete by the time it is reached.
     *
     * Produced by an OrderPlanner, consumed by solve_plan().
     *
     * \ingroup Planning
     */
    struct OrderPlan final
    {
        /// Unset for a rigid plan, which needs no orbiter.
        std::optional<PointID> root = std::nullopt;
        std::optional<PointID> orbiter = std::nullopt;

        std::vector<PlanEntry> entries;

        [[nodiscard]] auto points() const -> std::vector<PointID>;
    };

    auto operator<<(std::ostream &, const PlanEntry &) -> std::ostream &;
    auto operator<<(std::ostream &, const OrderPlan &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::PlanEntry> : ostream_formatter
{
};

template <>
struct fmt::formatter<locus::OrderPlan> : ostream_formatter
{
};

#endif
