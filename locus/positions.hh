/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_POSITIONS_HH
#define LOCUS_GUARD_LOCUS_POSITIONS_HH

#include <locus/point_id.hh>
#include <locus/vector.hh>

#include <cstddef>
#include <optional>
#include <vector>

namespace locus
{
    /**
     * \brief The set of points whose positions are known, or treated as
     * known, at some point during planning or solving.
     *
     * \ingroup Core
     */
    class KnownPoints
    {
    private:
        std::vector<bool> _known;
        std::size_t _count = 0;

    public:
        explicit KnownPoints(std::size_t number_of_points);

        [[nodiscard]] auto contains(PointID) const -> bool;
        auto insert(PointID) -> void;
        auto erase(PointID) -> void;

        [[nodiscard]] auto size() const -> std::size_t;
        [[nodiscard]] auto number_of_points() const -> std::size_t;
        [[nodiscard]] auto all() const -> bool;
    };

    /**
     * \brief A partial assignment of positions to points. Keeps the
     * corresponding KnownPoints up to date.
     *
     * \ingroup Core
     */
    class Positions
    {
    private:
        std::vector<std::optional<Vector>> _positions;
        KnownPoints _known;

    public:
        explicit Positions(std::size_t number_of_points);

        [[nodiscard]] auto known() const -> const KnownPoints &;
        [[nodiscard]] auto has(PointID) const -> bool;
        [[nodiscard]] auto operator[](PointID) const -> const std::optional<Vector> &;

        /**
         * The position of a point, which must be known. Throws
         * UnexpectedException otherwise, since constraints only ask for
         * points they have been told are known.
         */
        [[nodiscard]] auto at(PointID) const -> const Vector &;

        auto place(PointID, const Vector &) -> void;
        auto clear(PointID) -> void;

        [[nodiscard]] auto number_of_points() const -> std::size_t;
    };
}

#endif
