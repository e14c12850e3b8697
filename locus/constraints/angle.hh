/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_ANGLE_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_ANGLE_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Constrain the directed angle at a vertex, measured anticlockwise
     * from the arm through a to the arm through b, in radians.
     *
     * Either arm point can be placed, on a ray leaving the vertex. The vertex
     * itself cannot be placed by this constraint.
     *
     * \ingroup Constraints
     */
    class Angle : public Constraint
    {
    private:
        PointID _a, _vertex, _b;
        double _angle;

    public:
        explicit Angle(PointID a, PointID vertex, PointID b, double angle);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto validate() const -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
