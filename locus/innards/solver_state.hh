/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_INNARDS_SOLVER_STATE_HH
#define LOCUS_GUARD_LOCUS_INNARDS_SOLVER_STATE_HH

#include <locus/point_id.hh>
#include <locus/positions.hh>
#include <locus/vector.hh>

#include <cstddef>
#include <vector>

namespace locus::innards
{
    /**
     * \brief One record on the choice stack: the candidates a point had
     * when it was resolved, and which of them it currently holds.
     */
    struct Choice final
    {
        PointID point;
        std::size_t entry;
        std::vector<Vector> candidates;
        std::size_t chosen;
    };

    /**
     * \brief A partial assignment, together with the explicit stack of
     * choices that produced it.
     *
     * Points are only ever placed by push() and only ever moved or removed
     * by advance(), so the positions of points below the top of the stack
     * never change.
     */
    class SolverState
    {
    private:
        Positions _positions;
        std::vector<Choice> _choices;

    public:
        explicit SolverState(Positions initial);

        SolverState(const SolverState &) = delete;
        auto operator=(const SolverState &) -> SolverState & = delete;

        [[nodiscard]] auto positions() const -> const Positions &;

        /**
         * Place the point at the first candidate, and remember the rest as
         * alternatives. There must be at least one candidate.
         */
        auto push(PointID, std::size_t entry, std::vector<Vector> candidates) -> const Vector &;

        /**
         * Move the top point on to its next untried candidate. If it has
         * none left, remove it from the stack and from the positions, and
         * return false.
         */
        [[nodiscard]] auto advance() -> bool;

        [[nodiscard]] auto empty() const -> bool;
        [[nodiscard]] auto depth() const -> std::size_t;
        [[nodiscard]] auto top() const -> const Choice &;

        /**
         * Every position, which only makes sense once every point is placed.
         */
        [[nodiscard]] auto all_positions() const -> std::vector<Vector>;
    };
}

#endif
