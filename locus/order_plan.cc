/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/order_plan.hh>

#include <util/enumerate.hh>

#include <ostream>

using namespace locus;

using std::ostream;
using std::vector;

auto OrderPlan::points() const -> vector<PointID>
{
    vector<PointID> result;
    for (auto & e : entries)
        result.push_back(e.point);
    return result;
}

auto locus::operator<<(ostream & s, const PlanEntry & e) -> ostream &
{
    s << e.point << (e.orbiter ? " orbiting by" : " by");
    for (auto & c : e.contributing)
        s << " " << c;
    if (! e.filters.empty()) {
        s << " filtered by";
        for (auto & c : e.filters)
            s << " " << c;
    }
    return s;
}

auto locus::operator<<(ostream & s, const OrderPlan & p) -> ostream &
{
    if (p.root && p.orbiter)
        s << "root " << *p.root << " orbiter " << *p.orbiter << ":";
    else
        s << "rigid:";

    for (const auto & [idx, e] : enumerate(p.entries))
        s << (idx == 0 ? " " : ", ") << e;
    return s;
}
