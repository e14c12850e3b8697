/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/exception.hh>
#include <locus/innards/solver_state.hh>

#include <utility>

#include <fmt/core.h>

using namespace locus;
using namespace locus::innards;

using std::move;
using std::size_t;
using std::vector;

SolverState::SolverState(Positions initial) :
    _positions(move(initial))
{
}

auto SolverState::positions() const -> const Positions &
{
    return _positions;
}

auto SolverState::push(PointID p, size_t entry, vector<Vector> candidates) -> const Vector &
{
    if (candidates.empty())
        throw UnexpectedException{fmt::format("tried to choose a position for {} with no candidates", p)};
    if (_positions.has(p))
        throw UnexpectedException{fmt::format("tried to choose a position for {} which is already placed", p)};

    _positions.place(p, candidates.front());
    _choices.push_back(Choice{p, entry, move(candidates), 0});
    return _choices.back().candidates.front();
}

auto SolverState::advance() -> bool
{
    if (_choices.empty())
        throw UnexpectedException{"tried to backtrack with nothing on the choice stack"};

    auto & top = _choices.back();
    _positions.clear(top.point);
    if (++top.chosen < top.candidates.size()) {
        _positions.place(top.point, top.candidates[top.chosen]);
        return true;
    }

    _choices.pop_back();
    return false;
}

auto SolverState::empty() const -> bool
{
    return _choices.empty();
}

auto SolverState::depth() const -> size_t
{
    return _choices.size();
}

auto SolverState::top() const -> const Choice &
{
    if (_choices.empty())
        throw UnexpectedException{"asked for the top of an empty choice stack"};
    return _choices.back();
}

auto SolverState::all_positions() const -> vector<Vector>
{
    vector<Vector> result;
    for (size_t i = 0; i < _positions.number_of_points(); ++i)
        result.push_back(_positions.at(PointID{i}));
    return result;
}
