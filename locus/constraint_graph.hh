/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_CONSTRAINT_GRAPH_HH
#define LOCUS_GUARD_LOCUS_CONSTRAINT_GRAPH_HH

#include <locus/constraint.hh>
#include <locus/point_id.hh>
#include <locus/positions.hh>
#include <locus/vector.hh>

#include <array>
#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace locus
{
    /**
     * \defgroup Core Core functionality
     */

    /**
     * \brief Thrown if a point is given a name that is already in use.
     *
     * \ingroup Core
     */
    class NamingError : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit NamingError(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief The central class, which holds the points of a figure and the
     * constraints between them.
     *
     * Structure never changes during a solve. Which points are known is
     * tracked separately, in a KnownPoints or Positions, so the same graph
     * can be planned and solved any number of times.
     *
     * \ingroup Core
     */
    class ConstraintGraph
    {
    private:
        struct Imp;
        std::unique_ptr<Imp> _imp;

        auto check_name(const std::string &) -> const std::string &;

    public:
        /**
         * \name Constructors, destructors, etc.
         * @{
         */
        ConstraintGraph();

        ~ConstraintGraph();

        ConstraintGraph(const ConstraintGraph &) = delete;
        ConstraintGraph & operator=(const ConstraintGraph &) = delete;

        ConstraintGraph(ConstraintGraph &&) noexcept;
        ConstraintGraph & operator=(ConstraintGraph &&) noexcept;

        ///@}

        /**
         * \name Building a figure.
         * @{
         */

        /**
         * \brief Create a new point, with two degrees of freedom. The name
         * is optional, but must be unique if given.
         */
        [[nodiscard]] auto create_point(const std::optional<std::string> & name = std::nullopt) -> PointID;

        /**
         * \brief Create a new point that is fixed at the given position
         * before solving starts.
         */
        [[nodiscard]] auto create_origin(const Vector &, const std::optional<std::string> & name = std::nullopt) -> PointID;

        /**
         * \brief Create n free points, for assigning to structured bindings,
         * like `auto [b, c] = graph.create_n_points<2>();`.
         */
        template <std::size_t n_>
        [[nodiscard]] auto create_n_points() -> std::array<PointID, n_>;

        /**
         * \brief Add a clone of this Constraint to the figure. Throws
         * InvalidConstraint if it cannot be used, and UnknownID if it
         * references a point that this graph did not create.
         */
        auto post(const Constraint &) -> ConstraintID;

        ///@}

        /**
         * \name Queries.
         * @{
         */

        [[nodiscard]] auto number_of_points() const -> std::size_t;
        [[nodiscard]] auto number_of_constraints() const -> std::size_t;

        [[nodiscard]] auto all_points() const -> std::vector<PointID>;
        [[nodiscard]] auto all_constraints() const -> std::vector<ConstraintID>;

        /**
         * Origin points, in the order they were created.
         */
        [[nodiscard]] auto origins() const -> const std::vector<PointID> &;

        [[nodiscard]] auto is_origin(PointID) const -> bool;
        [[nodiscard]] auto degrees_of_freedom(PointID) const -> int;
        [[nodiscard]] auto name_of(PointID) const -> const std::string &;
        [[nodiscard]] auto find_point(const std::string & name) const -> std::optional<PointID>;

        [[nodiscard]] auto constraint(ConstraintID) const -> const Constraint &;

        /**
         * Every constraint that references this point, in posting order.
         */
        [[nodiscard]] auto constraints_referencing(PointID) const -> const std::vector<ConstraintID> &;

        /**
         * Every distinct point the constraint references, in reference order.
         */
        [[nodiscard]] auto points_of(ConstraintID) const -> const std::vector<PointID> &;

        /**
         * If every point the constraint references except exactly one is
         * known, and the constraint is able to place that one, return it.
         */
        [[nodiscard]] auto evaluable_target(ConstraintID, const KnownPoints &) const -> std::optional<PointID>;

        /**
         * Every constraint that is currently evaluable, with the point it
         * would place, in posting order.
         */
        [[nodiscard]] auto currently_evaluable(const KnownPoints &) const -> std::vector<std::pair<ConstraintID, PointID>>;

        /**
         * Every currently evaluable constraint whose target is this point.
         */
        [[nodiscard]] auto evaluable_for(PointID, const KnownPoints &) const -> std::vector<ConstraintID>;

        /**
         * Constraints whose points are all origins. Nothing will ever place
         * these, so they can only be checked.
         */
        [[nodiscard]] auto fully_fixed_constraints() const -> std::vector<ConstraintID>;

        /**
         * Positions with only the origins placed.
         */
        [[nodiscard]] auto initial_positions() const -> Positions;

        ///@}
    };

    namespace innards
    {
        template <std::size_t n_>
        struct ArrayInitialisationMagicForGraph
        {
            std::array<PointID, n_> result;

            explicit ArrayInitialisationMagicForGraph(ConstraintGraph * g) :
                ArrayInitialisationMagicForGraph(g, std::make_index_sequence<n_>{})
            {
            }

            template <std::size_t... nn_>
            ArrayInitialisationMagicForGraph(ConstraintGraph * g, std::index_sequence<nn_...>) :
                result{{(static_cast<void>(nn_), g->create_point())...}}
            {
            }
        };
    }

    template <std::size_t n_>
    auto ConstraintGraph::create_n_points() -> std::array<PointID, n_>
    {
        innards::ArrayInitialisationMagicForGraph<n_> magic{this};
        return magic.result;
    }
}

#endif
