/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_SOLVE_HH
#define LOCUS_GUARD_LOCUS_SOLVE_HH

#include <locus/candidate_order.hh>
#include <locus/constraint_graph.hh>
#include <locus/geometry_provider.hh>
#include <locus/order_plan.hh>
#include <locus/stats.hh>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <variant>
#include <vector>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \defgroup SolveCallbacks Callbacks and options for solving
     *
     * \sa CandidateOrders
     */

    /**
     * \brief What just happened, for a TraceCallback.
     *
     * \ingroup SolveCallbacks
     */
    enum class TraceEvent
    {
        Resolved,
        Exhausted,
        Backtracked
    };

    /**
     * \brief Called after every resolution step and every backtrack step,
     * with the point involved and the depth of the choice stack. If false
     * is returned then search stops, and is reported as cancelled.
     *
     * \ingroup SolveCallbacks
     */
    using TraceCallback = std::function<auto(TraceEvent, PointID, std::size_t depth)->bool>;

    /**
     * \brief Options for locus::solve() and locus::solve_plan().
     *
     * Every option has a sensible default.
     *
     * \ingroup SolveCallbacks
     */
    struct SolveOptions final
    {
        CandidateOrder candidate_order = candidate_order::as_listed();

        /// How many positions to try for an orbiter on its curve, if it is
        /// free to go anywhere along it.
        unsigned orbiter_samples = 8;

        /// How finely to search a circle for an orbiter that the rest of
        /// the figure pins down.
        unsigned orbiter_search_steps = 64;

        /// Give up after this many resolution steps, over every plan tried.
        std::optional<unsigned long long> step_limit = std::nullopt;

        /// Give up after trying this many plans.
        std::optional<unsigned long long> plan_limit = std::nullopt;

        /// Give up once this much time has been spent, over every plan tried.
        /// Running out is reported as not found within budget, never as
        /// cancelled.
        std::optional<std::chrono::milliseconds> time_limit = std::nullopt;

        TraceCallback trace = TraceCallback{};
    };

    /**
     * \brief A position for every point in a ConstraintGraph, origins
     * included.
     *
     * \ingroup Core
     */
    class Assignment
    {
    private:
        std::vector<Vector> _positions;

    public:
        explicit Assignment(std::vector<Vector>);

        [[nodiscard]] auto operator()(PointID) const -> const Vector &;
        [[nodiscard]] auto number_of_points() const -> std::size_t;
    };

    /**
     * \brief Why solve_plan() did not produce an Assignment.
     *
     * \ingroup Core
     */
    enum class FailureReason
    {
        Exhausted,      ///< Every candidate for the first point was tried.
        Cancelled,      ///< The abort flag was set, or the trace callback said stop.
        BudgetExceeded  ///< The step limit or the time limit was reached.
    };

    /**
     * \ingroup Core
     */
    struct SolveFailure final
    {
        FailureReason reason;
    };

    using PlanResult = std::variant<Assignment, SolveFailure>;

    /**
     * \brief The overall result of locus::solve(). Never a claim that no
     * solution exists.
     *
     * \ingroup Core
     */
    enum class SolveStatus
    {
        Solved,
        OrderingFailed,
        NotFoundWithinBudget,
        Cancelled
    };

    /**
     * \ingroup Core
     */
    struct SolveOutcome final
    {
        SolveStatus status;
        std::optional<Assignment> assignment;
        Stats stats;
    };

    /**
     * \brief Try to place every point by following one plan, backtracking
     * over earlier choices when a point has nowhere to go.
     *
     * If the final argument is not nullptr, the provided atomic is polled
     * once per resolution step and once per backtrack step, and search
     * stops if it becomes true. The time limit is polled just as often,
     * and counts any solve_time already in the Stats given. Statistics are
     * added to those Stats.
     *
     * \ingroup Core
     */
    auto solve_plan(const ConstraintGraph &, const OrderPlan &, const GeometryProvider &,
        const SolveOptions &, Stats &, std::atomic<bool> * optional_abort_flag = nullptr) -> PlanResult;

    /**
     * \brief Pull plans from an OrderPlanner and try each in turn, until one
     * gives an Assignment or the budget runs out.
     *
     * \ingroup Core
     * \sa SolveOptions
     */
    auto solve(const ConstraintGraph &, const GeometryProvider &, const SolveOptions & = SolveOptions{},
        std::atomic<bool> * optional_abort_flag = nullptr) -> SolveOutcome;

    auto operator<<(std::ostream &, const TraceEvent &) -> std::ostream &;
    auto operator<<(std::ostream &, const FailureReason &) -> std::ostream &;
    auto operator<<(std::ostream &, const SolveStatus &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::TraceEvent> : ostream_formatter
{
};

template <>
struct fmt::formatter<locus::FailureReason> : ostream_formatter
{
};

template <>
struct fmt::formatter<locus::SolveStatus> : ostream_formatter
{
};

#endif
