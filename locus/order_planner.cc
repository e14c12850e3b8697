/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/order_planner.hh>

#include <algorithm>
#include <deque>
#include <utility>

using namespace locus;

using std::deque;
using std::find;
using std::move;
using std::nullopt;
using std::optional;
using std::pair;
using std::size_t;
using std::vector;

namespace
{
    // Discretises points breadth first from whatever is already known. A
    // point becomes known once two independent one dimensional constraints
    // apply to it, using only points that were already known.
    struct Closure
    {
        const ConstraintGraph * graph;
        const GeometryProvider * geometry;
        KnownPoints known;
        vector<bool> considered;
        vector<vector<pair<ConstraintID, LocusShape>>> counted;
        deque<PointID> queue{};
        vector<PlanEntry> entries{};

        Closure(const ConstraintGraph & g, const GeometryProvider & p) :
            graph(&g),
            geometry(&p),
            known(g.number_of_points()),
            considered(g.number_of_constraints(), false),
            counted(g.number_of_points())
        {
            for (auto & o : g.origins()) {
                known.insert(o);
                queue.push_back(o);
            }
        }

        auto run() -> void
        {
            while (! queue.empty()) {
                auto p = queue.front();
                queue.pop_front();
                for (auto & c : graph->constraints_referencing(p))
                    consider(c);
            }
        }

        auto consider(ConstraintID c) -> void
        {
            if (considered[c.index])
                return;

            auto target = graph->evaluable_target(c, known);
            if (! target)
                return;

            // A constraint stays evaluable for the same target until that
            // target becomes known, so it only needs looking at once.
            considered[c.index] = true;

            auto shape = geometry->shape_for(graph->constraint(c), *target);
            if ((! shape) || shape->dimension != Dimension::One)
                return;

            auto & so_far = counted[target->index];
            for (auto & [_, s] : so_far)
                if (! geometry->independent(s, *shape))
                    return;

            so_far.emplace_back(c, move(*shape));
            if (so_far.size() >= 2)
                discretise(*target);
        }

        auto entry_for(PointID p, const vector<ConstraintID> & contributing) const -> PlanEntry
        {
            PlanEntry result{.point = p, .contributing = contributing, .filters = {}};
            for (auto & c : graph->evaluable_for(p, known))
                if (contributing.end() == find(contributing.begin(), contributing.end(), c))
                    result.filters.push_back(c);
            return result;
        }

        auto discretise(PointID p) -> void
        {
            vector<ConstraintID> contributing;
            for (auto & [c, _] : counted[p.index])
                contributing.push_back(c);

            entries.push_back(entry_for(p, contributing));
            known.insert(p);
            queue.push_back(p);
        }

        auto place_orbiter(PointID p, ConstraintID from_root) -> void
        {
            auto entry = entry_for(p, {from_root});
            entry.orbiter = true;
            entries.push_back(move(entry));
            considered[from_root.index] = true;
            known.insert(p);
            queue.push_back(p);
        }
    };

    struct RootAndOrbiter
    {
        PointID root;
        ConstraintID from_root;
        PointID orbiter;
    };
}

struct OrderPlanner::Imp
{
    const ConstraintGraph & graph;
    const GeometryProvider & geometry;

    optional<Closure> from_origins = nullopt;
    vector<RootAndOrbiter> pairs{};
    size_t next_pair = 0;
    bool rigid_considered = false;
    vector<bool> covered{};

    unsigned long long pairs_explored = 0;
    unsigned long long pairs_skipped = 0;
    unsigned long long plans_produced = 0;

    Imp(const ConstraintGraph & g, const GeometryProvider & p) :
        graph(g),
        geometry(p)
    {
    }

    auto start() -> void
    {
        if (from_origins)
            return;

        from_origins.emplace(graph, geometry);
        from_origins->run();

        for (auto & r : graph.origins())
            for (auto & c : graph.constraints_referencing(r)) {
                auto target = graph.evaluable_target(c, from_origins->known);
                if (! target)
                    continue;
                auto shape = geometry.shape_for(graph.constraint(c), *target);
                if ((! shape) || shape->dimension != Dimension::One)
                    continue;
                bool seen = false;
                for (auto & p : pairs)
                    if (p.root == r && p.orbiter == *target)
                        seen = true;
                if (! seen)
                    pairs.push_back(RootAndOrbiter{r, c, *target});
            }
    }

    // An orbiter in an emitted plan has its closing constraint, so it is as
    // discrete as every other point there.
    auto cover(const vector<PlanEntry> & entries) -> void
    {
        for (auto & e : entries)
            covered[e.point.index] = true;
    }

    // The first constraint that pins the orbiter down independently of the
    // constraint it was placed with, once everything else is known.
    auto find_closing(PointID orbiter, ConstraintID from_root) const -> optional<ConstraintID>
    {
        auto root_shape = geometry.shape_for(graph.constraint(from_root), orbiter);
        if (! root_shape)
            throw UnexpectedException{"orbiter was placed by a constraint that cannot place it"};

        for (auto & c : graph.constraints_referencing(orbiter)) {
            if (c == from_root)
                continue;
            auto shape = geometry.shape_for(graph.constraint(c), orbiter);
            if (shape && shape->dimension == Dimension::One && geometry.independent(*root_shape, *shape))
                return c;
        }

        return nullopt;
    }

    auto explore(const RootAndOrbiter & candidate) -> optional<OrderPlan>
    {
        Closure closure = *from_origins;
        closure.place_orbiter(candidate.orbiter, candidate.from_root);
        closure.run();

        if (! closure.known.all())
            return nullopt;

        auto closing = find_closing(candidate.orbiter, candidate.from_root);
        if (! closing)
            return nullopt;

        for (auto & e : closure.entries)
            if (e.point == candidate.orbiter)
                e.contributing.push_back(*closing);

        return OrderPlan{.root = candidate.root, .orbiter = candidate.orbiter, .entries = move(closure.entries)};
    }

    auto next() -> optional<OrderPlan>
    {
        start();

        if (! rigid_considered) {
            rigid_considered = true;
            covered.assign(graph.number_of_points(), false);
            cover(from_origins->entries);
            if (from_origins->known.all()) {
                ++plans_produced;
                return OrderPlan{.entries = from_origins->entries};
            }
        }

        while (next_pair < pairs.size()) {
            auto & candidate = pairs[next_pair++];
            if (covered[candidate.orbiter.index]) {
                ++pairs_skipped;
                continue;
            }

            ++pairs_explored;
            if (auto plan = explore(candidate)) {
                cover(plan->entries);
                ++plans_produced;
                return plan;
            }
        }

        return nullopt;
    }
};

OrderPlanner::OrderPlanner(const ConstraintGraph & graph, const GeometryProvider & geometry) :
    _imp(new Imp{graph, geometry})
{
}

OrderPlanner::~OrderPlanner() = default;

OrderPlanner::OrderPlanner(OrderPlanner &&) noexcept = default;

auto OrderPlanner::operator=(OrderPlanner &&) noexcept -> OrderPlanner & = default;

auto OrderPlanner::next() -> optional<OrderPlan>
{
    return _imp->next();
}

auto OrderPlanner::restart() -> void
{
    _imp->next_pair = 0;
    _imp->rigid_considered = false;
    _imp->covered.clear();
    _imp->pairs_explored = 0;
    _imp->pairs_skipped = 0;
    _imp->plans_produced = 0;
}

auto OrderPlanner::pairs_explored() const -> unsigned long long
{
    return _imp->pairs_explored;
}

auto OrderPlanner::pairs_skipped() const -> unsigned long long
{
    return _imp->pairs_skipped;
}

auto OrderPlanner::plans_produced() const -> unsigned long long
{
    return _imp->plans_produced;
}

auto locus::plan_orders(const ConstraintGraph & graph, const GeometryProvider & geometry) -> OrderPlanner
{
    return OrderPlanner{graph, geometry};
}
