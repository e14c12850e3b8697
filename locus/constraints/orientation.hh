/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_ORIENTATION_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_ORIENTATION_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Constrain the direction from one point to another to be a
     * given angle, in radians anticlockwise from the positive x axis.
     *
     * The second point lies on a ray leaving the first at that angle, and the
     * first lies on a ray leaving the second in the opposite direction.
     *
     * \ingroup Constraints
     */
    class Orientation : public Constraint
    {
    private:
        PointID _from, _to;
        double _angle;

    public:
        explicit Orientation(PointID from, PointID to, double angle);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto validate() const -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
