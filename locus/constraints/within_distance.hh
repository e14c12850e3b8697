/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_WITHIN_DISTANCE_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_WITHIN_DISTANCE_HH

#include <locus/constraint.hh>

namespace locus
{
    /**
     * \brief Constrain two points to be no further apart than a given
     * distance. This is an areal constraint: it never makes a point
     * discrete, and is only used to filter candidates.
     *
     * \ingroup Constraints
     */
    class WithinDistance : public Constraint
    {
    private:
        PointID _a, _b;
        double _max_length;

    public:
        explicit WithinDistance(PointID a, PointID b, double max_length);

        virtual auto points() const -> std::vector<PointID> override;
        virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
        virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        virtual auto validate() const -> void override;
        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
