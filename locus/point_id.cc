/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/point_id.hh>

#include <ostream>

using namespace locus;

using std::ostream;

auto locus::operator<<(ostream & s, const PointID & p) -> ostream &
{
    return s << "p" << p.index;
}

auto locus::operator<<(ostream & s, const ConstraintID & c) -> ostream &
{
    return s << "c" << c.index;
}
