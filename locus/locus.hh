/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#ifndef LOCUS_GUARD_LOCUS_LOCUS_HH
#define LOCUS_GUARD_LOCUS_LOCUS_HH 1

#include <locus/candidate_order.hh>
#include <locus/constraint.hh>
#include <locus/constraint_graph.hh>
#include <locus/exception.hh>
#include <locus/geometry_provider.hh>
#include <locus/order_plan.hh>
#include <locus/order_planner.hh>
#include <locus/point_id.hh>
#include <locus/positions.hh>
#include <locus/possibility_space.hh>
#include <locus/solve.hh>
#include <locus/stats.hh>
#include <locus/vector.hh>

#include <locus/constraints/alignment.hh>
#include <locus/constraints/angle.hh>
#include <locus/constraints/distance.hh>
#include <locus/constraints/incidence.hh>
#include <locus/constraints/orientation.hh>
#include <locus/constraints/side_of.hh>
#include <locus/constraints/within_distance.hh>

#endif
