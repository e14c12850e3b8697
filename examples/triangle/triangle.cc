/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraints/distance.hh>
#include <locus/constraints/side_of.hh>
#include <locus/constraint_graph.hh>
#include <locus/geometry_provider.hh>
#include <locus/solve.hh>

#include <cstdlib>
#include <iostream>

#include <fmt/core.h>
#include <fmt/ostream.h>

using namespace locus;

using std::cout;

auto main(int, char *[]) -> int
{
    ConstraintGraph g;
    auto a = g.create_origin(Vector{0.0, 0.0}, "A");
    auto b = g.create_point("B");
    auto c = g.create_point("C");

    g.post(Distance{a, b, 5.0});
    g.post(Distance{b, c, 4.0});
    g.post(Distance{a, c, 3.0});
    g.post(SideOf{c, a, b, Side::Left});

    PlanarGeometry geometry;
    auto outcome = solve(g, geometry);

    fmt::print(cout, "{}\n", outcome.status);
    if (outcome.assignment)
        for (auto & p : g.all_points())
            fmt::print(cout, "{} = {}\n", g.name_of(p), (*outcome.assignment)(p));

    cout << outcome.stats;

    return outcome.status == SolveStatus::Solved ? EXIT_SUCCESS : EXIT_FAILURE;
}
