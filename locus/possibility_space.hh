/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_POSSIBILITY_SPACE_HH
#define LOCUS_GUARD_LOCUS_POSSIBILITY_SPACE_HH

#include <locus/vector.hh>

#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \defgroup Spaces Possibility spaces
     */

    /**
     * \brief How many degrees of freedom a PossibilitySpace leaves a point.
     *
     * \ingroup Spaces
     */
    enum class Dimension
    {
        Zero,
        One,
        Two
    };

    /**
     * \brief A finite set of positions.
     *
     * \ingroup Spaces
     */
    struct PointSet final
    {
        std::vector<Vector> points;
    };

    /**
     * \ingroup Spaces
     */
    struct Circle final
    {
        Vector centre;
        double radius;
    };

    /**
     * \brief An infinite line. The direction is a unit vector.
     *
     * \ingroup Spaces
     */
    struct Line final
    {
        Vector origin;
        Vector direction;
    };

    /**
     * \brief Every origin + t * direction with t >= 0. The direction is a
     * unit vector.
     *
     * \ingroup Spaces
     */
    struct Ray final
    {
        Vector origin;
        Vector direction;
    };

    /**
     * \brief Every p with (p - origin) . normal >= 0.
     *
     * \ingroup Spaces
     */
    struct HalfPlane final
    {
        Vector origin;
        Vector normal;
    };

    /**
     * \brief A closed disc.
     *
     * \ingroup Spaces
     */
    struct Disc final
    {
        Vector centre;
        double radius;
    };

    using Curve = std::variant<Circle, Line, Ray>;

    using Region = std::variant<HalfPlane, Disc>;

    /**
     * \brief The locus of positions a point may occupy while satisfying
     * one constraint, given the other points that constraint references.
     *
     * Intersecting spaces is the job of a GeometryProvider.
     *
     * \ingroup Spaces
     */
    using PossibilitySpace = std::variant<PointSet, Curve, Region>;

    [[nodiscard]] auto dimension(const PossibilitySpace &) -> Dimension;

    [[nodiscard]] auto contains(const PossibilitySpace &, const Vector &, double tolerance) -> bool;

    /**
     * Euclidean distance from a position to the nearest member of the
     * space, which is zero for positions inside a region.
     */
    [[nodiscard]] auto distance_to(const PossibilitySpace &, const Vector &) -> double;

    /**
     * Deterministic sample positions on a curve, used to place a point
     * that only one curve constrains. For a circle these go round from
     * angle zero, for a ray they double in distance from the origin, and
     * for a line they alternate either side of the origin.
     */
    [[nodiscard]] auto representatives(const Curve &, unsigned how_many) -> std::vector<Vector>;

    /**
     * The position at parameter t along a curve. For a circle t is the angle
     * from the centre, and for a line or ray it is the distance from the
     * origin along the direction, so a ray only has t >= 0.
     */
    [[nodiscard]] auto point_on(const Curve &, double t) -> Vector;

    auto operator<<(std::ostream &, const PossibilitySpace &) -> std::ostream &;
    auto operator<<(std::ostream &, const Curve &) -> std::ostream &;
    auto operator<<(std::ostream &, const Region &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::PossibilitySpace> : ostream_formatter
{
};

template <>
struct fmt::formatter<locus::Curve> : ostream_formatter
{
};

#endif
