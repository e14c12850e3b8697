/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_GEOMETRY_PROVIDER_HH
#define LOCUS_GUARD_LOCUS_GEOMETRY_PROVIDER_HH

#include <locus/constraint.hh>
#include <locus/point_id.hh>
#include <locus/positions.hh>
#include <locus/possibility_space.hh>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace locus
{
    /**
     * \brief The spaces meet in a finite set of positions, which may be
     * empty.
     *
     * \ingroup Spaces
     */
    struct FinitePoints final
    {
        std::vector<Vector> points;
    };

    /**
     * \brief The spaces meet in infinitely many positions, either because
     * two of them coincide over a continuous range or because there are not
     * enough of them. This is never the same as having no intersection.
     *
     * \ingroup Spaces
     */
    struct Unbounded final
    {
        std::string reason;
    };

    using Intersection = std::variant<FinitePoints, Unbounded>;

    /**
     * \brief Turns constraints into possibility spaces, and intersects those
     * spaces. The planner and the solver only ever talk about geometry
     * through this interface.
     *
     * Implementations must be pure: the same inputs always give the same
     * results.
     *
     * \ingroup Core
     */
    class GeometryProvider
    {
    public:
        virtual ~GeometryProvider() = 0;

        /**
         * The locus the constraint gives target. Every other point the
         * constraint references must be known.
         */
        [[nodiscard]] virtual auto possibility_space(const Constraint &, PointID target,
            const Positions &) const -> LocusResult = 0;

        /**
         * Intersect a collection of spaces. Curves that coincide over a
         * continuous range are reported as Unbounded, never as an empty
         * intersection.
         */
        [[nodiscard]] virtual auto intersect(const std::vector<PossibilitySpace> &) const -> Intersection = 0;

        [[nodiscard]] virtual auto shape_for(const Constraint &, PointID target) const -> std::optional<LocusShape> = 0;

        /**
         * Could two one dimensional loci for the same point ever meet in a
         * finite set of positions? Two identical circles, or two lines with
         * the same fixed direction, cannot.
         */
        [[nodiscard]] virtual auto independent(const LocusShape &, const LocusShape &) const -> bool = 0;

        /**
         * Representative positions on a curve, for placing a point that only
         * one curve constrains.
         */
        [[nodiscard]] virtual auto sample(const Curve &, unsigned how_many) const -> std::vector<Vector> = 0;

        [[nodiscard]] virtual auto tolerance() const -> double = 0;
    };

    /**
     * \brief Euclidean geometry in the plane, for the constraint kinds in
     * \ref Constraints.
     *
     * \ingroup Core
     */
    class PlanarGeometry : public GeometryProvider
    {
    private:
        double _tolerance;

    public:
        /**
         * The tolerance is used for membership tests and for merging
         * candidates that are effectively the same position.
         */
        explicit PlanarGeometry(double tolerance = 1e-6);

        virtual auto possibility_space(const Constraint &, PointID target,
            const Positions &) const -> LocusResult override;
        virtual auto intersect(const std::vector<PossibilitySpace> &) const -> Intersection override;
        virtual auto shape_for(const Constraint &, PointID target) const -> std::optional<LocusShape> override;
        virtual auto independent(const LocusShape &, const LocusShape &) const -> bool override;
        virtual auto sample(const Curve &, unsigned how_many) const -> std::vector<Vector> override;
        virtual auto tolerance() const -> double override;
    };
}

#endif
