/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_SIDE_OF_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_SIDE_OF_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Which side of a directed line.
     *
     * \ingroup Constraints
     */
    enum class Side
    {
        Left,
        Right
    };

    /**
     * \brief Constrain a point to lie on one side of the directed line from a
     * to b, or on the line itself. This is an areal constraint, so it only
     * filters candidates.
     *
     * Any of the three points can be the one being placed: with the other
     * two known, the allowed positions always form a half-plane.
     *
     * \ingroup Constraints
     */
    class SideOf : public Constraint
    {
    private:
        PointID _p, _a, _b;
        Side _side;

    public:
        explicit SideOf(PointID p, PointID a, PointID b, Side side);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
