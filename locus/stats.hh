/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_STATS_HH
#define LOCUS_GUARD_LOCUS_STATS_HH

#include <chrono>
#include <iosfwd>

#include <fmt/ostream.h>

namespace locus
{
    /**
     * \brief Statistics from planning and solving.
     *
     * \sa locus::solve()
     * \sa locus::solve_plan()
     * \ingroup Core
     */
    struct Stats final
    {
        unsigned long long steps = 0;
        unsigned long long backtracks = 0;
        unsigned long long failures = 0;
        unsigned long long max_depth = 0;
        unsigned long long degenerate = 0;
        unsigned long long orbiter_searches = 0;

        unsigned long long plans_tried = 0;
        unsigned long long pairs_explored = 0;
        unsigned long long pairs_skipped = 0;

        std::chrono::microseconds solve_time{};
    };

    /**
     * \brief Stats can be written to an ostream, for convenience.
     *
     * \sa Stats
     * \ingroup Core
     */
    auto operator<<(std::ostream &, const Stats &) -> std::ostream &;
}

template <>
struct fmt::formatter<locus::Stats> : ostream_formatter
{
};

#endif
