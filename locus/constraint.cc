/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraint.hh>
#include <locus/exception.hh>

#include <algorithm>

#include <fmt/core.h>

using namespace locus;

using std::adjacent_find;
using std::sort;
using std::vector;

Constraint::~Constraint() = default;

auto Constraint::validate() const -> void
{
    auto pts = points();
    if (pts.empty())
        throw InvalidConstraint{describe() + " references no points"};

    sort(pts.begin(), pts.end());
    if (adjacent_find(pts.begin(), pts.end()) != pts.end())
        throw InvalidConstraint{fmt::format("{} references the same point more than once", describe())};
}
