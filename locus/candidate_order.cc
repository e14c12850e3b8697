/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/candidate_order.hh>

#include <util/overloaded.hh>

#include <algorithm>
#include <utility>

using namespace locus;

using std::pair;
using std::size_t;
using std::stable_sort;
using std::vector;

namespace
{
    auto future_spaces(const CandidateContext & context) -> vector<PossibilitySpace>
    {
        for (size_t e = context.entry + 1; e < context.plan.entries.size(); ++e) {
            auto point = context.plan.entries[e].point;
            vector<PossibilitySpace> result;
            for (auto & c : context.graph.evaluable_for(point, context.positions.known()))
                overloaded{
                    [&](const PossibilitySpace & s) { result.push_back(s); },
                    [&](const Degenerate &) {}}
                    .visit(context.geometry.possibility_space(context.graph.constraint(c), point, context.positions));

            if (! result.empty())
                return result;
        }

        return {};
    }
}

auto candidate_order::as_listed() -> CandidateOrder
{
    return [](const CandidateContext &, vector<Vector> &) {};
}

auto candidate_order::closest_to_future() -> CandidateOrder
{
    return [](const CandidateContext & context, vector<Vector> & candidates) {
        if (candidates.size() < 2)
            return;

        auto spaces = future_spaces(context);
        if (spaces.empty())
            return;

        vector<pair<double, Vector>> scored;
        for (auto & c : candidates) {
            double total = 0.0;
            for (auto & s : spaces)
                total += distance_to(s, c);
            scored.emplace_back(total, c);
        }

        stable_sort(scored.begin(), scored.end(), [](const auto & a, const auto & b) { return a.first < b.first; });

        candidates.clear();
        for (auto & [_, c] : scored)
            candidates.push_back(c);
    };
}
