/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_POINT_ID_HH
#define LOCUS_GUARD_LOCUS_POINT_ID_HH

#include <compare>
#include <iosfwd>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \brief Identifies a point belonging to a ConstraintGraph.
     *
     * Created by ConstraintGraph::create_point() or
     * ConstraintGraph::create_origin().
     *
     * \ingroup Core
     */
    struct PointID final
    {
        unsigned long long index;

        constexpr explicit PointID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const PointID &) const = default;
    };

    /**
     * \brief Identifies a constraint belonging to a ConstraintGraph.
     *
     * Returned by ConstraintGraph::post().
     *
     * \ingroup Core
     */
    struct ConstraintID final
    {
        unsigned long long index;

        constexpr explicit ConstraintID(unsigned long long x) :
            index(x)
        {
        }

        [[nodiscard]] constexpr auto operator<=>(const ConstraintID &) const = default;
    };

    auto operator<<(std::ostream &, const PointID &) -> std::ostream &;
    auto operator<<(std::ostream &, const ConstraintID &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::PointID> : ostream_formatter
{
};

template <>
struct fmt::formatter<locus::ConstraintID> : ostream_formatter
{
};

#endif
