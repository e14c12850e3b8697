/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/innards/orbiter_search.hh>
#include <locus/innards/solver_state.hh>
#include <locus/order_planner.hh>
#include <locus/solve.hh>

#include <util/overloaded.hh>

#include <algorithm>
#include <chrono>
#include <ostream>
#include <utility>

#include <fmt/core.h>

using namespace locus;
using namespace locus::innards;

using std::atomic;
using std::get_if;
using std::max;
using std::move;
using std::nullopt;
using std::ostream;
using std::size_t;
using std::vector;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::steady_clock;

namespace
{
    auto aborted(atomic<bool> * optional_abort_flag) -> bool
    {
        return optional_abort_flag && optional_abort_flag->load();
    }

    // Check a constraint whose points are all placed, by asking for the
    // locus of any point it is able to place and testing membership.
    auto satisfied(const ConstraintGraph & graph, ConstraintID id, const GeometryProvider & geometry,
        const Positions & positions, Stats & stats) -> bool
    {
        auto & constraint = graph.constraint(id);
        for (auto & p : graph.points_of(id)) {
            if (! geometry.shape_for(constraint, p))
                continue;

            return overloaded{
                [&](const PossibilitySpace & s) { return contains(s, positions.at(p), geometry.tolerance()); },
                [&](const Degenerate &) {
                    ++stats.degenerate;
                    return true;
                }}
                .visit(geometry.possibility_space(constraint, p, positions));
        }

        throw UnexpectedException{fmt::format("{} cannot place any of its points", constraint.describe())};
    }

    struct Resolver
    {
        const ConstraintGraph & graph;
        const OrderPlan & plan;
        const GeometryProvider & geometry;
        const SolveOptions & options;
        Stats & stats;

        auto spaces_for(PointID point, const Positions & positions) -> vector<PossibilitySpace>
        {
            vector<PossibilitySpace> result;
            for (auto & c : graph.evaluable_for(point, positions.known()))
                overloaded{
                    [&](const PossibilitySpace & s) { result.push_back(s); },
                    [&](const Degenerate &) { ++stats.degenerate; }}
                    .visit(geometry.possibility_space(graph.constraint(c), point, positions));
            return result;
        }

        // An orbiter has only one curve, so either it is free to go anywhere
        // along it, or the rest of the plan decides where.
        auto orbiter_positions(size_t entry, const Positions & positions, const vector<PossibilitySpace> & spaces) -> vector<Vector>
        {
            const Curve * curve = nullptr;
            for (auto & s : spaces)
                if (auto c = get_if<Curve>(&s); c && ! curve)
                    curve = c;

            if (! curve) {
                ++stats.degenerate;
                return {};
            }

            OrbiterSearch search{graph, plan, geometry, entry};
            return search.positions(positions, spaces, *curve, options.orbiter_samples, options.orbiter_search_steps, stats);
        }

        auto candidates_for(size_t entry, const Positions & positions) -> vector<Vector>
        {
            auto & e = plan.entries[entry];
            auto spaces = spaces_for(e.point, positions);

            auto candidates = overloaded{
                [&](const FinitePoints & f) { return f.points; },
                [&](const Unbounded &) -> vector<Vector> {
                    if (e.orbiter)
                        return orbiter_positions(entry, positions, spaces);
                    ++stats.degenerate;
                    return {};
                }}.visit(geometry.intersect(spaces));

            auto checks = checks_for(graph, e.point, geometry, positions);
            if (! checks.empty()) {
                Positions trial = positions;
                vector<Vector> kept;
                for (auto & v : candidates) {
                    trial.place(e.point, v);
                    bool ok = true;
                    for (auto & c : checks)
                        if (! satisfied(graph, c, geometry, trial, stats))
                            ok = false;
                    if (ok)
                        kept.push_back(v);
                    trial.clear(e.point);
                }
                candidates = move(kept);
            }

            if (options.candidate_order)
                options.candidate_order(CandidateContext{graph, geometry, plan, entry, positions}, candidates);

            return candidates;
        }
    };
}

Assignment::Assignment(vector<Vector> positions) :
    _positions(move(positions))
{
}

auto Assignment::operator()(PointID p) const -> const Vector &
{
    if (p.index >= _positions.size())
        throw UnknownID{fmt::format("point {} in an assignment of {} points", p, _positions.size())};
    return _positions[p.index];
}

auto Assignment::number_of_points() const -> size_t
{
    return _positions.size();
}

auto locus::solve_plan(const ConstraintGraph & graph, const OrderPlan & plan, const GeometryProvider & geometry,
    const SolveOptions & options, Stats & stats, atomic<bool> * optional_abort_flag) -> PlanResult
{
    auto start_time = steady_clock::now();
    auto finish = [&](PlanResult && result) -> PlanResult {
        stats.solve_time += duration_cast<microseconds>(steady_clock::now() - start_time);
        return move(result);
    };

    auto out_of_time = [&]() -> bool {
        return options.time_limit
            && stats.solve_time + duration_cast<microseconds>(steady_clock::now() - start_time) >= *options.time_limit;
    };

    auto trace = [&](TraceEvent event, PointID p, size_t depth) -> bool {
        return (! options.trace) || options.trace(event, p, depth);
    };

    SolverState state{graph.initial_positions()};

    for (auto & c : graph.fully_fixed_constraints())
        if (! satisfied(graph, c, geometry, state.positions(), stats)) {
            ++stats.failures;
            return finish(SolveFailure{FailureReason::Exhausted});
        }

    Resolver resolver{graph, plan, geometry, options, stats};

    size_t entry = 0;
    while (entry < plan.entries.size()) {
        if (aborted(optional_abort_flag))
            return finish(SolveFailure{FailureReason::Cancelled});
        if ((options.step_limit && stats.steps >= *options.step_limit) || out_of_time())
            return finish(SolveFailure{FailureReason::BudgetExceeded});

        ++stats.steps;
        auto point = plan.entries[entry].point;
        auto candidates = resolver.candidates_for(entry, state.positions());

        if (! candidates.empty()) {
            state.push(point, entry, move(candidates));
            stats.max_depth = max<unsigned long long>(stats.max_depth, state.depth());
            if (! trace(TraceEvent::Resolved, point, state.depth()))
                return finish(SolveFailure{FailureReason::Cancelled});
            ++entry;
            continue;
        }

        ++stats.failures;
        if (! trace(TraceEvent::Exhausted, point, state.depth()))
            return finish(SolveFailure{FailureReason::Cancelled});

        // Reopen the most recent choice that still has an untried candidate.
        // Everything after it in the plan will be resolved again.
        while (true) {
            if (state.empty())
                return finish(SolveFailure{FailureReason::Exhausted});
            if (aborted(optional_abort_flag))
                return finish(SolveFailure{FailureReason::Cancelled});
            if (out_of_time())
                return finish(SolveFailure{FailureReason::BudgetExceeded});

            ++stats.backtracks;
            auto reopened = state.top().point;
            bool moved = state.advance();
            if (! trace(TraceEvent::Backtracked, reopened, state.depth()))
                return finish(SolveFailure{FailureReason::Cancelled});

            if (moved) {
                entry = state.top().entry + 1;
                break;
            }
        }
    }

    return finish(Assignment{state.all_positions()});
}

auto locus::solve(const ConstraintGraph & graph, const GeometryProvider & geometry, const SolveOptions & options,
    atomic<bool> * optional_abort_flag) -> SolveOutcome
{
    auto start_time = steady_clock::now();

    SolveOutcome outcome{SolveStatus::NotFoundWithinBudget, nullopt, Stats{}};
    auto planner = plan_orders(graph, geometry);

    bool any_plans = false, planner_exhausted = false;
    while (true) {
        if (options.plan_limit && outcome.stats.plans_tried >= *options.plan_limit)
            break;
        if (options.time_limit && duration_cast<microseconds>(steady_clock::now() - start_time) >= *options.time_limit)
            break;
        if (aborted(optional_abort_flag)) {
            outcome.status = SolveStatus::Cancelled;
            break;
        }

        auto plan = planner.next();
        if (! plan) {
            planner_exhausted = true;
            break;
        }

        any_plans = true;
        ++outcome.stats.plans_tried;

        auto result = solve_plan(graph, *plan, geometry, options, outcome.stats, optional_abort_flag);
        if (auto assignment = get_if<Assignment>(&result)) {
            outcome.status = SolveStatus::Solved;
            outcome.assignment = move(*assignment);
            break;
        }

        auto reason = get_if<SolveFailure>(&result)->reason;
        if (reason == FailureReason::Cancelled) {
            outcome.status = SolveStatus::Cancelled;
            break;
        }
        else if (reason == FailureReason::BudgetExceeded)
            break;
    }

    if (planner_exhausted && ! any_plans)
        outcome.status = SolveStatus::OrderingFailed;

    outcome.stats.pairs_explored = planner.pairs_explored();
    outcome.stats.pairs_skipped = planner.pairs_skipped();
    outcome.stats.solve_time = duration_cast<microseconds>(steady_clock::now() - start_time);
    return outcome;
}

auto locus::operator<<(ostream & s, const TraceEvent & e) -> ostream &
{
    switch (e) {
    case TraceEvent::Resolved: return s << "resolved";
    case TraceEvent::Exhausted: return s << "exhausted";
    case TraceEvent::Backtracked: return s << "backtracked";
    }
    throw NonExhaustiveSwitch{};
}

auto locus::operator<<(ostream & s, const FailureReason & r) -> ostream &
{
    switch (r) {
    case FailureReason::Exhausted: return s << "exhausted";
    case FailureReason::Cancelled: return s << "cancelled";
    case FailureReason::BudgetExceeded: return s << "budget exceeded";
    }
    throw NonExhaustiveSwitch{};
}

auto locus::operator<<(ostream & s, const SolveStatus & r) -> ostream &
{
    switch (r) {
    case SolveStatus::Solved: return s << "solved";
    case SolveStatus::OrderingFailed: return s << "ordering failed";
    case SolveStatus::NotFoundWithinBudget: return s << "not found within budget";
    case SolveStatus::Cancelled: return s << "cancelled";
    }
    throw NonExhaustiveSwitch{};
}
