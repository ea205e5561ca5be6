#pragma once

/// @file problem_loader.hpp
/// @brief Loading and writing JSON problem files.
/// @ingroup io_loaders

#include <jobsched/algo/backtracking_solver.hpp>
#include <jobsched/algo/genetic_optimizer.hpp>
#include <jobsched/algo/solver.hpp>

#include <jobsched/core/job.hpp>
#include <jobsched/core/types.hpp>

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <vector>

namespace jobsched::io {

/// @brief Solver settings carried in the optional "solver" object of a problem file.
///
/// Defaults match the command-line defaults; values given on the command
/// line take precedence over the file.
///
/// @ingroup io_loaders
struct SolverConfig {
    algo::GeneticParams genetic{};                             ///< Population, generations, mutation rate.
    std::uint32_t seed{0};                                     ///< Genetic optimizer seed.
    core::Duration time_horizon{100};                          ///< Backtracking horizon.
    algo::PrecedenceRule precedence{algo::PrecedenceRule::Completion}; ///< Precedence rule.
};

/// @brief Raw content of a problem file, ready for algo::JobScheduler.
///
/// Dependencies given per job ("depends_on") and at top level
/// ("dependencies") are merged into one list, per-job entries first.
///
/// @ingroup io_loaders
/// @see load_problem, algo::JobScheduler
struct ProblemData {
    std::vector<core::Job> jobs;                 ///< Jobs in file order.
    std::vector<core::Machine> machines;         ///< Machines in file order.
    std::vector<core::Dependency> dependencies;  ///< All precedence pairs.
    SolverConfig solver;                         ///< Solver settings.
};

/// @brief Load a problem from a JSON file.
///
/// @param path  Filesystem path to the JSON problem file.
/// @return Parsed problem data.
///
/// @throws LoaderError  If the file cannot be read, contains invalid JSON,
///                      or describes an invalid job or machine.
///
/// @see load_problem_from_string
ProblemData load_problem(const std::filesystem::path& path);

/// @brief Load a problem from a JSON string.
///
/// @param json  JSON content describing the problem.
/// @return Parsed problem data.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ProblemData load_problem_from_string(std::string_view json);

/// @brief Parse a precedence rule name ("completion" or "placed_earlier").
/// @throws LoaderError If @p name is not a known rule.
algo::PrecedenceRule parse_precedence_rule(std::string_view name);

/// @brief Canonical name of a precedence rule.
std::string_view precedence_rule_name(algo::PrecedenceRule rule) noexcept;

/// @brief Write a problem to an output stream in canonical JSON form.
///
/// Dependencies are written as top-level pairs; the solver object is
/// always present.
///
/// @param problem  The problem data to serialise.
/// @param out      Output stream.
void write_problem_to_stream(const ProblemData& problem, std::ostream& out);

/// @brief Write a problem to a JSON file.
/// @throws LoaderError If the file cannot be opened.
void write_problem(const ProblemData& problem, const std::filesystem::path& path);

} // namespace jobsched::io
