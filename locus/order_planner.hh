/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_ORDER_PLANNER_HH
#define LOCUS_GUARD_LOCUS_ORDER_PLANNER_HH

#include <locus/constraint_graph.hh>
#include <locus/geometry_provider.hh>
#include <locus/order_plan.hh>

#include <memory>
#include <optional>

namespace locus
{
    /**
     * \brief Enumerates complete OrderPlan instances for a ConstraintGraph,
     * one at a time.
     *
     * If the origins alone make every point discrete, that rigid plan comes
     * first. After that, each (root, orbiter) pair is explored in turn:
     * roots are origins in creation order, and orbiters are the points
     * reachable from the root by a single one dimensional constraint, in
     * the order that constraints were posted and then in the order they
     * reference points. From each pair, points are discretised breadth
     * first as soon as two independent one dimensional constraints apply
     * to them. Pairs that could only rediscover points an earlier plan
     * already discretised are skipped, and pairs that leave some point
     * unknown yield nothing.
     *
     * The graph and the geometry must outlive the planner.
     *
     * \ingroup Planning
     */
    class OrderPlanner
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        explicit OrderPlanner(const ConstraintGraph &, const GeometryProvider &);
        ~OrderPlanner();

        OrderPlanner(const OrderPlanner &) = delete;
        OrderPlanner & operator=(const OrderPlanner &) = delete;

        OrderPlanner(OrderPlanner &&) noexcept;
        OrderPlanner & operator=(OrderPlanner &&) noexcept;

        ///@}

        /**
         * The next complete plan, or nullopt once every pair has been
         * tried.
         */
        [[nodiscard]] auto next() -> std::optional<OrderPlan>;

        /**
         * Start again from the beginning, producing the same sequence of
         * plans.
         */
        auto restart() -> void;

        /**
         * \name Statistics for the enumeration so far.
         * @{
         */
        [[nodiscard]] auto pairs_explored() const -> unsigned long long;
        [[nodiscard]] auto pairs_skipped() const -> unsigned long long;
        [[nodiscard]] auto plans_produced() const -> unsigned long long;

        ///@}
    };

    /**
     * \brief Create an OrderPlanner, for pulling plans one at a time.
     *
     * \ingroup Planning
     */
    [[nodiscard]] auto plan_orders(const ConstraintGraph &, const GeometryProvider &) -> OrderPlanner;
}

#endif
