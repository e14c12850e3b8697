/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_INCIDENCE_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_INCIDENCE_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Constrain a point to lie on the line through two other points.
     *
     * Any of the three points can be placed from the other two, since the
     * condition only says that all three are collinear.
     *
     * \ingroup Constraints
     */
    class OnLine : public Constraint
    {
    private:
        PointID _p, _a, _b;

    public:
        explicit OnLine(PointID p, PointID a, PointID b);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
