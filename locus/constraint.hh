/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINT_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINT_HH

#include <locus/point_id.hh>
#include <locus/positions.hh>
#include <locus/possibility_space.hh>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace locus
{
    /**
     * \defgroup Constraints Constraints
     */

    /**
     * \brief What a constraint's possibility space for a given target will
     * look like, without knowing where any points are.
     *
     * The OrderPlanner uses this to decide whether a point will become
     * discrete, and to recognise pairs of constraints that can never meet
     * in a finite set of positions.
     *
     * \ingroup Constraints
     */
    struct LocusShape final
    {
        Dimension dimension;

        /// For example "circle", "line", "ray", "disc" or "half-plane".
        std::string family;

        /// The other points the locus is built from, in a canonical order.
        std::vector<PointID> anchors;

        std::vector<double> parameters;

        /// Set if the locus runs in a direction that does not depend on
        /// any position, in radians.
        std::optional<double> fixed_direction = std::nullopt;
    };

    /**
     * \brief Returned instead of a PossibilitySpace when the known
     * positions make a constraint meaningless, for example a line through
     * two coincident points.
     *
     * \ingroup Constraints
     */
    struct Degenerate final
    {
        std::string reason;
    };

    using LocusResult = std::variant<PossibilitySpace, Degenerate>;

    /**
     * \brief Subclasses of Constraint relate two or more points. See \ref
     * Constraints for the available kinds.
     *
     * Instances are passed to ConstraintGraph::post(), which keeps a clone.
     * A constraint never changes which points it references.
     *
     * \ingroup Core
     */
    class [[nodiscard]] Constraint
    {
    public:
        virtual ~Constraint() = 0;

        /**
         * The points this constraint relates, in the order given when it
         * was constructed.
         */
        [[nodiscard]] virtual auto points() const -> std::vector<PointID> = 0;

        /**
         * The shape of the locus this constraint gives target, once every
         * other point it references is known, or nullopt if this kind of
         * constraint cannot be used to place target.
         */
        [[nodiscard]] virtual auto shape_for(PointID target) const -> std::optional<LocusShape> = 0;

        /**
         * The locus for target, given that every other point this
         * constraint references has a position in the Positions.
         */
        [[nodiscard]] virtual auto locus_for(PointID target, const Positions &) const -> LocusResult = 0;

        /**
         * Throws InvalidConstraint if the constraint cannot be used. The
         * default implementation rejects constraints that reference the same
         * point more than once.
         */
        virtual auto validate() const -> void;

        [[nodiscard]] virtual auto clone() const -> std::unique_ptr<Constraint> = 0;

        [[nodiscard]] virtual auto describe() const -> std::string = 0;
    };
}

#endif
