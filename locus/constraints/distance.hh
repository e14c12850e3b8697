/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_DISTANCE_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_DISTANCE_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Constrain two points to be a given distance apart. Either point
     * is placed on a circle around the other.
     *
     * \ingroup Constraints
     */
    class Distance : public Constraint
    {
    private:
        PointID _a, _b;
        double _length;

    public:
        explicit Distance(PointID a, PointID b, double length);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto validate() const -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
