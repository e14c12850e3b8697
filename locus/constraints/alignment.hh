/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINTS_ALIGNMENT_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINTS_ALIGNMENT_HH

#include <locus/constraint.hh>

namespace locus
{
    namespace innards
    {
        /**
         * \brief Shared implementation for constraints that put two points on
         * a common line with a fixed direction.
         *
         * \ingroup Constraints
         */
        class AlignmentBase : public Constraint
        {
        protected:
            PointID _a, _b;

            explicit AlignmentBase(PointID a, PointID b);

            [[nodiscard]] virtual auto direction() const -> double = 0;

        public:
            virtual auto points() const -> std::vector<PointID> override;
            virtual auto shape_for(PointID) const -> std::optional<LocusShape> override;
            virtual auto locus_for(PointID, const Positions &) const -> LocusResult override;
        };
    }

    /**
     * \brief Constrain two points to have the same y coordinate.
     *
     * \ingroup Constraints
     */
    class Horizontal : public innards::AlignmentBase
    {
    protected:
        virtual auto direction() const -> double override;

    public:
        explicit Horizontal(PointID a, PointID b);

        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };

    /**
     * \brief Constrain two points to have the same x coordinate.
     *
     * \ingroup Constraints
     */
    class Vertical : public innards::AlignmentBase
    {
    protected:
        virtual auto direction() const -> double override;

    public:
        explicit Vertical(PointID a, PointID b);

        virtual auto clone() const -> std::unique_ptr<Constraint> override;
        virtual auto describe() const -> std::string override;
    };
}

#endif
