#include <jobsched/core/error.hpp>
#include <jobsched/core/schedule.hpp>

#include <jobsched/algo/error.hpp>
#include <jobsched/algo/job_scheduler.hpp>
#include <jobsched/algo/schedule_verifier.hpp>

#include <jobsched/io/error.hpp>
#include <jobsched/io/metrics.hpp>
#include <jobsched/io/problem_loader.hpp>
#include <jobsched/io/schedule_writer.hpp>
#include <jobsched/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

namespace core = jobsched::core;
namespace algo = jobsched::algo;
namespace io = jobsched::io;

struct Config {
    std::string input_file;
    std::string solver{"list"};
    std::string output_file{"-"};
    std::string format{"json"};
    std::string trace_file;
    std::string trace_format{"json"};
    bool metrics{false};
    bool verify{false};
    bool verbose{false};
    cxxopts::ParseResult args;
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("jobsched", "Job-shop scheduler with precedence constraints");

    options.add_options()
        ("i,input", "Problem file (JSON)", cxxopts::value<std::string>())
        ("s,solver", "Solver: list|genetic|backtracking|all (default: list)", cxxopts::value<std::string>()->default_value("list"))
        ("population", "Genetic population size (default: 50)", cxxopts::value<std::size_t>())
        ("generations", "Genetic generation count (default: 100)", cxxopts::value<std::size_t>())
        ("mutation-rate", "Genetic mutation rate in [0, 1] (default: 0.1)", cxxopts::value<double>())
        ("seed", "Genetic RNG seed (default: 0)", cxxopts::value<uint32_t>())
        ("horizon", "Backtracking time horizon (default: 100)", cxxopts::value<int64_t>())
        ("precedence", "Precedence rule: completion|placed_earlier (default: completion)", cxxopts::value<std::string>())
        ("o,output", "Schedule output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("trace", "Write a solver trace to this file ('-' = stderr)", cxxopts::value<std::string>())
        ("trace-format", "Trace format: json|text (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("metrics", "Print metrics to stderr")
        ("verify", "Check each schedule against the problem")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.input_file = result["input"].as<std::string>();
    config.solver = result["solver"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.trace_format = result["trace-format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.verify = result.count("verify") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.solver != "list" && config.solver != "genetic" && config.solver != "backtracking" &&
        config.solver != "all") {
        std::cerr << "Error: unknown solver '" << config.solver << "'" << std::endl;
        std::exit(64);
    }
    if (config.format != "json" && config.format != "text") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }
    if (config.trace_format != "json" && config.trace_format != "text") {
        std::cerr << "Error: unknown trace format '" << config.trace_format << "'" << std::endl;
        std::exit(64);
    }

    config.args = std::move(result);
    return config;
}

// Command-line values override the "solver" object of the problem file
void apply_overrides(io::SolverConfig& solver, const cxxopts::ParseResult& args) {
    if (args.count("population") != 0U) {
        solver.genetic.population_size = args["population"].as<std::size_t>();
    }
    if (args.count("generations") != 0U) {
        solver.genetic.generations = args["generations"].as<std::size_t>();
    }
    if (args.count("mutation-rate") != 0U) {
        solver.genetic.mutation_rate = args["mutation-rate"].as<double>();
    }
    if (args.count("seed") != 0U) {
        solver.seed = args["seed"].as<uint32_t>();
    }
    if (args.count("horizon") != 0U) {
        solver.time_horizon = core::Duration{args["horizon"].as<int64_t>()};
    }
    if (args.count("precedence") != 0U) {
        try {
            solver.precedence = io::parse_precedence_rule(args["precedence"].as<std::string>());
        } catch (const io::LoaderError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            std::exit(64);
        }
    }
}

algo::SolveOutcome run_solver(const algo::JobScheduler& scheduler, const std::string& name,
                              const io::SolverConfig& solver, core::TraceWriter* trace) {
    if (name == "genetic") {
        auto outcome = scheduler.run_genetic(solver.genetic, solver.seed, solver.precedence, trace);
        if (auto* failure = std::get_if<algo::SolveFailure>(&outcome)) {
            return std::move(*failure);
        }
        return std::move(std::get<algo::GeneticResult>(outcome).schedule);
    }
    if (name == "backtracking") {
        return scheduler.run_backtracking(algo::BacktrackingOptions{solver.time_horizon, true}, trace);
    }
    return scheduler.run_list_schedule(solver.precedence, trace);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading problem from: " << config.input_file << std::endl;
        }

        // 1. Load problem and merge solver settings
        auto data = io::load_problem(config.input_file);
        apply_overrides(data.solver, config.args);

        // 2. Validate input and build the dependency graph
        algo::JobScheduler scheduler(std::move(data.jobs), std::move(data.dependencies),
                                     std::move(data.machines));

        if (config.verbose) {
            std::cerr << "Loaded " << scheduler.problem().job_count() << " jobs on "
                      << scheduler.problem().machine_count() << " machines" << std::endl;
        }

        // 3. Setup trace writer
        std::ofstream tracefile;
        std::unique_ptr<core::TraceWriter> trace;
        if (!config.trace_file.empty()) {
            std::ostream* trace_out = &std::cerr;
            if (config.trace_file != "-") {
                tracefile.open(config.trace_file);
                if (!tracefile) {
                    std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                    return 1;
                }
                trace_out = &tracefile;
            }
            if (config.trace_format == "text") {
                trace = std::make_unique<io::TextualTraceWriter>(*trace_out, trace_out == &std::cerr);
            } else {
                trace = std::make_unique<io::JsonTraceWriter>(*trace_out);
            }
        }

        // 4. Setup schedule output
        std::ofstream outfile;
        std::ostream* out = &std::cout;
        if (config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        std::vector<std::string> solvers;
        if (config.solver == "all") {
            solvers = {"list", "genetic", "backtracking"};
        } else {
            solvers = {config.solver};
        }

        // 5. Run each requested solver
        bool failed = false;
        bool invalid = false;
        std::vector<io::SolverRun> runs;
        for (const auto& name : solvers) {
            if (config.verbose) {
                std::cerr << "Running solver: " << name << std::endl;
            }

            runs.push_back({name, run_solver(scheduler, name, data.solver, trace.get())});
            const auto& outcome = runs.back().outcome;
            if (const auto* failure = std::get_if<algo::SolveFailure>(&outcome)) {
                std::cerr << name << ": " << algo::to_string(failure->kind) << ": " << failure->message
                          << std::endl;
                failed = true;
                continue;
            }

            const auto& schedule = std::get<core::Schedule>(outcome);
            if (config.format == "text") {
                *out << "== " << name << " ==\n";
                io::write_schedule_table(scheduler.problem(), schedule, *out);
            } else if (solvers.size() == 1) {
                io::write_schedule_json(name, schedule, *out);
            }

            if (config.verify) {
                auto violations = algo::verify_schedule(scheduler.problem(), schedule, data.solver.precedence);
                for (const auto& violation : violations) {
                    std::cerr << name << ": violation: " << violation.message << std::endl;
                }
                invalid = invalid || !violations.empty();
            }

            if (config.metrics) {
                std::cerr << "== " << name << " metrics ==\n";
                io::write_metrics(
                    io::compute_schedule_metrics(scheduler.problem(), schedule, data.solver.precedence),
                    std::cerr);
            }
        }

        // Several solvers share one JSON document
        if (config.format == "json" && solvers.size() > 1) {
            io::write_schedules_json(runs, *out);
        }

        // 6. Finalize output
        trace.reset();
        out->flush();

        if (failed) {
            return 2;
        }
        return invalid ? 1 : 0;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 65;
    }
    catch (const core::SchedulingError& e) {
        std::cerr << "Invalid problem: " << e.what() << std::endl;
        return 66;
    }
    catch (const algo::InvalidParameterError& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
