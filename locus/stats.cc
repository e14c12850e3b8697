/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/stats.hh>

#include <chrono>
#include <ostream>

using namespace locus;

using std::ostream;

auto locus::operator<<(ostream & o, const Stats & s) -> ostream &
{
    o << "plans tried: " << s.plans_tried << '\n';
    o << "pairs explored: " << s.pairs_explored << '\n';
    o << "pairs skipped: " << s.pairs_skipped << '\n';
    o << "steps: " << s.steps << '\n';
    o << "backtracks: " << s.backtracks << '\n';
    o << "failures: " << s.failures << '\n';
    o << "degenerate: " << s.degenerate << '\n';
    o << "orbiter searches: " << s.orbiter_searches << '\n';
    o << "max depth: " << s.max_depth << '\n';
    o << "solve time: " << (s.solve_time.count() / 1'000'000.0) << "s" << '\n';
    return o;
}
