/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/constraint_graph.hh>
#include <locus/exception.hh>

#include <algorithm>
#include <deque>
#include <unordered_map>

#include <fmt/core.h>

using namespace locus;

using std::deque;
using std::find;
using std::move;
using std::nullopt;
using std::optional;
using std::pair;
using std::size_t;
using std::string;
using std::unique_ptr;
using std::unordered_map;
using std::vector;

NamingError::NamingError(const string & w) :
    _wat(w)
{
}

auto NamingError::what() const noexcept -> const char *
{
    return _wat.c_str();
}

struct ConstraintGraph::Imp
{
    vector<string> names{};
    vector<optional<Vector>> fixed_positions{};
    vector<vector<ConstraintID>> referencing{};
    deque<unique_ptr<Constraint>> constraints{};
    vector<vector<PointID>> constraint_points{};
    vector<PointID> origins{};
    unordered_map<string, PointID> points_by_name{};

    auto check_point(PointID p) const -> void
    {
        if (p.index >= names.size())
            throw UnknownID{fmt::format("point {} in a figure with {} points", p, names.size())};
    }

    auto check_constraint(ConstraintID c) const -> void
    {
        if (c.index >= constraints.size())
            throw UnknownID{fmt::format("constraint {} in a figure with {} constraints", c, constraints.size())};
    }

    auto add_point(const string & name, const optional<Vector> & fixed) -> PointID
    {
        PointID result{names.size()};
        names.push_back(name);
        fixed_positions.push_back(fixed);
        referencing.emplace_back();
        points_by_name.emplace(name, result);
        if (fixed)
            origins.push_back(result);
        return result;
    }
};

ConstraintGraph::ConstraintGraph() :
    _imp(new Imp{})
{
}

ConstraintGraph::~ConstraintGraph() = default;

ConstraintGraph::ConstraintGraph(ConstraintGraph &&) noexcept = default;

auto ConstraintGraph::operator=(ConstraintGraph &&) noexcept -> ConstraintGraph & = default;

auto ConstraintGraph::check_name(const string & name) -> const string &
{
    if (name.empty())
        throw NamingError{"points cannot have an empty name"};
    if (_imp->points_by_name.contains(name))
        throw NamingError{"duplicate point name '" + name + "'"};
    return name;
}

auto ConstraintGraph::create_point(const optional<string> & name) -> PointID
{
    auto n = name ? check_name(*name) : check_name(fmt::format("p{}", _imp->names.size()));
    return _imp->add_point(n, nullopt);
}

auto ConstraintGraph::create_origin(const Vector & at, const optional<string> & name) -> PointID
{
    auto n = name ? check_name(*name) : check_name(fmt::format("p{}", _imp->names.size()));
    return _imp->add_point(n, at);
}

auto ConstraintGraph::post(const Constraint & c) -> ConstraintID
{
    c.validate();

    vector<PointID> distinct;
    for (auto & p : c.points()) {
        _imp->check_point(p);
        if (distinct.end() == find(distinct.begin(), distinct.end(), p))
            distinct.push_back(p);
    }

    ConstraintID result{_imp->constraints.size()};
    _imp->constraints.push_back(c.clone());
    for (auto & p : distinct)
        _imp->referencing[p.index].push_back(result);
    _imp->constraint_points.push_back(move(distinct));
    return result;
}

auto ConstraintGraph::number_of_points() const -> size_t
{
    return _imp->names.size();
}

auto ConstraintGraph::number_of_constraints() const -> size_t
{
    return _imp->constraints.size();
}

auto ConstraintGraph::all_points() const -> vector<PointID>
{
    vector<PointID> result;
    for (size_t i = 0; i < _imp->names.size(); ++i)
        result.emplace_back(i);
    return result;
}

auto ConstraintGraph::all_constraints() const -> vector<ConstraintID>
{
    vector<ConstraintID> result;
    for (size_t i = 0; i < _imp->constraints.size(); ++i)
        result.emplace_back(i);
    return result;
}

auto ConstraintGraph::origins() const -> const vector<PointID> &
{
    return _imp->origins;
}

auto ConstraintGraph::is_origin(PointID p) const -> bool
{
    _imp->check_point(p);
    return _imp->fixed_positions[p.index].has_value();
}

auto ConstraintGraph::degrees_of_freedom(PointID p) const -> int
{
    return is_origin(p) ? 0 : 2;
}

auto ConstraintGraph::name_of(PointID p) const -> const string &
{
    _imp->check_point(p);
    return _imp->names[p.index];
}

auto ConstraintGraph::find_point(const string & name) const -> optional<PointID>
{
    auto i = _imp->points_by_name.find(name);
    if (i == _imp->points_by_name.end())
        return nullopt;
    return i->second;
}

auto ConstraintGraph::constraint(ConstraintID c) const -> const Constraint &
{
    _imp->check_constraint(c);
    return *_imp->constraints[c.index];
}

auto ConstraintGraph::constraints_referencing(PointID p) const -> const vector<ConstraintID> &
{
    _imp->check_point(p);
    return _imp->referencing[p.index];
}

auto ConstraintGraph::points_of(ConstraintID c) const -> const vector<PointID> &
{
    _imp->check_constraint(c);
    return _imp->constraint_points[c.index];
}

auto ConstraintGraph::evaluable_target(ConstraintID c, const KnownPoints & known) const -> optional<PointID>
{
    optional<PointID> unknown;
    for (auto & p : points_of(c)) {
        if (known.contains(p))
            continue;
        if (unknown)
            return nullopt;
        unknown = p;
    }

    if (unknown && ! _imp->constraints[c.index]->shape_for(*unknown))
        return nullopt;

    return unknown;
}

auto ConstraintGraph::currently_evaluable(const KnownPoints & known) const -> vector<pair<ConstraintID, PointID>>
{
    vector<pair<ConstraintID, PointID>> result;
    for (auto & c : all_constraints())
        if (auto target = evaluable_target(c, known))
            result.emplace_back(c, *target);
    return result;
}

auto ConstraintGraph::evaluable_for(PointID p, const KnownPoints & known) const -> vector<ConstraintID>
{
    vector<ConstraintID> result;
    for (auto & c : constraints_referencing(p))
        if (evaluable_target(c, known) == p)
            result.push_back(c);
    return result;
}

auto ConstraintGraph::fully_fixed_constraints() const -> vector<ConstraintID>
{
    vector<ConstraintID> result;
    for (auto & c : all_constraints()) {
        bool all_fixed = true;
        for (auto & p : points_of(c))
            if (! is_origin(p))
                all_fixed = false;
        if (all_fixed)
            result.push_back(c);
    }
    return result;
}

auto ConstraintGraph::initial_positions() const -> Positions
{
    Positions result{number_of_points()};
    for (auto & p : _imp->origins)
        result.place(p, *_imp->fixed_positions[p.index]);
    return result;
}
