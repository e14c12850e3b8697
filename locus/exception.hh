/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_EXCEPTION_HH
#define LOCUS_GUARD_LOCUS_EXCEPTION_HH

#include <exception>
#include <string>
#include <version>

#if __has_include(<source_location>) && __cpp_lib_source_location
#  include <source_location>
#endif

namespace locus
{
    /**
     * \brief Thrown if something has gone wrong inside the solver. This
     * usually indicates a bug, not a problem with the figure.
     *
     * \ingroup Core
     */
    class UnexpectedException : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnexpectedException(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a visit or switch is missing a case entry.
     *
     * \ingroup Core
     */
    class NonExhaustiveSwitch : public UnexpectedException
    {
    public:
#if __has_include(<source_location>) && __cpp_lib_source_location
        explicit NonExhaustiveSwitch(const std::source_location & = std::source_location::current());
#else
        explicit NonExhaustiveSwitch();
#endif
    };

    /**
     * \brief Thrown by ConstraintGraph::post() if a constraint cannot be
     * used, for example because it references the same point twice or has
     * a negative length.
     *
     * \ingroup Core
     */
    class InvalidConstraint : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit InvalidConstraint(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };

    /**
     * \brief Thrown if a PointID or ConstraintID is used with a graph that
     * did not create it.
     *
     * \ingroup Core
     */
    class UnknownID : public std::exception
    {
    private:
        std::string _wat;

    public:
        explicit UnknownID(const std::string &);

        virtual auto what() const noexcept -> const char * override;
    };
}

#endif
