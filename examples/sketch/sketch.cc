/* vim: set sw=4 sts=4 et foldmethod=syntax : */

#include <locus/locus.hh>

#include <nlohmann/json.hpp>

#include <boost/program_options.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace locus;

using std::atomic;
using std::cerr;
using std::condition_variable;
using std::cout;
using std::cv_status;
using std::exception;
using std::flush;
using std::ifstream;
using std::mutex;
using std::size_t;
using std::string;
using std::thread;
using std::unique_lock;
using std::vector;
using std::chrono::milliseconds;
using std::chrono::system_clock;

using fmt::print;

namespace po = boost::program_options;

class SketchError : public exception
{
private:
    std::string _wat;

public:
    explicit SketchError(const std::string & w) :
        _wat(w)
    {
    }

    virtual auto what() const noexcept -> const char * override
    {
        return _wat.c_str();
    }
};

namespace
{
    static atomic<bool> abort_flag{false}, was_terminated{false};

    auto sig_int_or_term_handler(int) -> void
    {
        abort_flag.store(true);
        was_terminated.store(true);
    }

    auto create_point(ConstraintGraph & graph, const string & name, const nlohmann::json & data) -> void
    {
        if (data.contains("origin")) {
            auto & at = data.at("origin");
            if ((! at.is_array()) || at.size() != 2)
                throw SketchError{fmt::format("Origin for point {} should be an [x, y] pair", name)};
            (void)graph.create_origin(Vector{at[0].get<double>(), at[1].get<double>()}, name);
        }
        else
            (void)graph.create_point(name);
    }

    // Points can be given either as an object keyed by name, in which case
    // they are created in name order, or as an array of objects with a
    // "name" field, in which case they are created in the order listed.
    auto create_points(ConstraintGraph & graph, const nlohmann::json & points) -> void
    {
        if (points.is_object()) {
            for (auto p = points.begin(), p_end = points.end(); p != p_end; ++p)
                create_point(graph, p.key(), p.value());
        }
        else if (points.is_array()) {
            for (const auto & p : points) {
                if (! p.contains("name"))
                    throw SketchError{fmt::format("Point {} has no name", p.dump())};
                create_point(graph, p.at("name").get<string>(), p);
            }
        }
        else
            throw SketchError{"Expected \"points\" to be an object or an array"};
    }

    auto arg_as_point(const ConstraintGraph & graph, const nlohmann::json & constraint, size_t idx) -> PointID
    {
        string name = constraint.at("points").at(idx);
        auto p = graph.find_point(name);
        if (! p)
            throw SketchError{fmt::format("Can't find point named {}", name)};
        return *p;
    }

    auto arg_as_side(const nlohmann::json & constraint) -> Side
    {
        string side = constraint.at("side");
        if (side == "left")
            return Side::Left;
        else if (side == "right")
            return Side::Right;
        else
            throw SketchError{fmt::format("Unknown side {}, expected left or right", side)};
    }

    auto post_constraint(ConstraintGraph & graph, const nlohmann::json & c) -> void
    {
        string kind = c.at("kind");

        auto expect_points = [&](size_t n) {
            if ((! c.contains("points")) || (! c.at("points").is_array()) || c.at("points").size() != n)
                throw SketchError{fmt::format("Constraint {} should reference {} points", c.dump(), n)};
        };

        auto value = [&]() -> double { return c.at("value").get<double>(); };

        if (kind == "distance") {
            expect_points(2);
            graph.post(Distance{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), value()});
        }
        else if (kind == "orientation") {
            expect_points(2);
            graph.post(Orientation{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), value()});
        }
        else if (kind == "horizontal") {
            expect_points(2);
            graph.post(Horizontal{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1)});
        }
        else if (kind == "vertical") {
            expect_points(2);
            graph.post(Vertical{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1)});
        }
        else if (kind == "on_line") {
            expect_points(3);
            graph.post(OnLine{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), arg_as_point(graph, c, 2)});
        }
        else if (kind == "angle") {
            expect_points(3);
            graph.post(Angle{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), arg_as_point(graph, c, 2), value()});
        }
        else if (kind == "within_distance") {
            expect_points(2);
            graph.post(WithinDistance{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), value()});
        }
        else if (kind == "side_of") {
            expect_points(3);
            graph.post(SideOf{arg_as_point(graph, c, 0), arg_as_point(graph, c, 1), arg_as_point(graph, c, 2), arg_as_side(c)});
        }
        else
            throw SketchError{fmt::format("Unknown constraint kind {}", kind)};
    }

    auto stop_timeout_thread(thread & timeout_thread, mutex & timeout_mutex, condition_variable & timeout_cv) -> void
    {
        if (timeout_thread.joinable()) {
            {
                unique_lock<mutex> guard(timeout_mutex);
                abort_flag.store(true);
                timeout_cv.notify_all();
            }
            timeout_thread.join();
        }
    }
}

auto main(int argc, char * argv[]) -> int
{
    po::options_description display_options{"Program options"};
    display_options.add_options()                                                                     //
        ("help", "Display help information")                                                          //
        ("statistics,s", "Print statistics")                                                          //
        ("timeout,t", po::value<unsigned long long>(), "Timeout in ms")                               //
        ("trace", "Print every resolution and backtrack step")                                        //
        ("show-plans", "Print the order plans that are tried")                                        //
        ("heuristic", po::value<string>()->default_value("as-listed"), "Candidate order: as-listed or closest") //
        ("orbiter-samples", po::value<unsigned>()->default_value(8), "Positions to try for an orbiter")        //
        ("orbiter-search-steps", po::value<unsigned>()->default_value(64), "How finely to search for a pinned orbiter") //
        ("plan-limit", po::value<unsigned long long>(), "Give up after trying this many plans")       //
        ("step-limit", po::value<unsigned long long>(), "Give up after this many resolution steps");  //
    po::options_description all_options{"All options"};
    all_options.add_options() //
        ("file", po::value<string>(), "JSON sketch file used as input");

    all_options.add(display_options);

    po::positional_options_description positional_options;
    positional_options
        .add("file", 1);

    po::variables_map options_vars;

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all_options)
                      .positional(positional_options)
                      .run(),
            options_vars);
        po::notify(options_vars);
    }
    catch (const po::error & e) {
        print(cerr, "Error: {}\n", e.what());
        print(cerr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    if (options_vars.contains("help")) {
        print("Usage: {} [options] sketch.json\n", argv[0]);
        print("\n");
        display_options.print(cout);
        return EXIT_SUCCESS;
    }

    if (! options_vars.contains("file")) {
        print(cerr, "Error: no sketch file given\n");
        print(cerr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    SolveOptions solve_options;

    auto heuristic = options_vars["heuristic"].as<string>();
    if (heuristic == "as-listed")
        solve_options.candidate_order = candidate_order::as_listed();
    else if (heuristic == "closest")
        solve_options.candidate_order = candidate_order::closest_to_future();
    else {
        print(cerr, "Error: unknown heuristic {}\n", heuristic);
        print(cerr, "Try {} --help\n", argv[0]);
        return EXIT_FAILURE;
    }

    solve_options.orbiter_samples = options_vars["orbiter-samples"].as<unsigned>();
    solve_options.orbiter_search_steps = options_vars["orbiter-search-steps"].as<unsigned>();
    if (options_vars.contains("plan-limit"))
        solve_options.plan_limit = options_vars["plan-limit"].as<unsigned long long>();
    if (options_vars.contains("step-limit"))
        solve_options.step_limit = options_vars["step-limit"].as<unsigned long long>();
    if (options_vars.contains("timeout"))
        solve_options.time_limit = milliseconds{options_vars["timeout"].as<unsigned long long>()};

    signal(SIGINT, &sig_int_or_term_handler);
    signal(SIGTERM, &sig_int_or_term_handler);

    thread timeout_thread;
    mutex timeout_mutex;
    condition_variable timeout_cv;
    bool actually_timed_out = false;

    if (options_vars.contains("timeout")) {
        milliseconds limit{options_vars["timeout"].as<unsigned long long>()};

        timeout_thread = thread([limit = limit, &timeout_mutex, &timeout_cv, &actually_timed_out] {
            auto abort_time = system_clock::now() + limit;
            {
                /* Sleep until either we've reached the time limit,
                 * or we've finished all the work. */
                unique_lock<mutex> guard(timeout_mutex);
                while (! abort_flag.load()) {
                    if (cv_status::timeout == timeout_cv.wait_until(guard, abort_time)) {
                        /* We've woken up, and it's due to a timeout. */
                        actually_timed_out = true;
                        break;
                    }
                }
            }
            abort_flag.store(true);
        });
    }

    try {
        auto sketch_name = options_vars["file"].as<string>();
        ifstream infile{sketch_name};
        if (! infile)
            throw SketchError{fmt::format("Error reading from {}", sketch_name)};

        auto sketch = nlohmann::json::parse(infile);
        if (! sketch.contains("points"))
            throw SketchError{fmt::format("No points in {}", sketch_name)};

        ConstraintGraph graph;
        create_points(graph, sketch.at("points"));
        if (sketch.contains("constraints"))
            for (const auto & c : sketch.at("constraints"))
                post_constraint(graph, c);

        PlanarGeometry geometry;

        if (options_vars.contains("trace"))
            solve_options.trace = [&](TraceEvent event, PointID p, size_t depth) -> bool {
                print(cerr, "{:>{}}{} {}\n", "", depth * 2, event, graph.name_of(p));
                return true;
            };

        if (options_vars.contains("show-plans")) {
            auto planner = plan_orders(graph, geometry);
            while (auto plan = planner.next())
                print(cout, "plan {}\n", *plan);
        }

        auto outcome = solve(graph, geometry, solve_options, &abort_flag);

        stop_timeout_thread(timeout_thread, timeout_mutex, timeout_cv);

        // The watchdog only wins if a single step overruns the time limit,
        // and that is still running out of budget rather than being stopped.
        bool timed_out = actually_timed_out
            || (solve_options.time_limit && outcome.stats.solve_time >= *solve_options.time_limit);
        if (outcome.status == SolveStatus::Cancelled && timed_out && ! was_terminated.load())
            outcome.status = SolveStatus::NotFoundWithinBudget;

        print(cout, "status: {}\n", outcome.status);
        if (outcome.status == SolveStatus::NotFoundWithinBudget && timed_out)
            print(cout, "reason: timed out\n");
        else if (outcome.status == SolveStatus::Cancelled && was_terminated.load())
            print(cout, "reason: interrupted\n");

        if (outcome.assignment)
            for (auto & p : graph.all_points())
                print(cout, "{} = {}\n", graph.name_of(p), (*outcome.assignment)(p));
        cout << flush;

        if (options_vars.contains("statistics")) {
            cout << outcome.stats;
            cout << flush;
        }

        if (outcome.status != SolveStatus::Solved)
            return EXIT_FAILURE;
    }
    catch (const exception & e) {
        print(cerr, "{}: error: {}\n", argv[0], e.what());
        stop_timeout_thread(timeout_thread, timeout_mutex, timeout_cv);
        return EXIT_FAILURE;
    }

    stop_timeout_thread(timeout_thread, timeout_mutex, timeout_cv);

    return EXIT_SUCCESS;
}
