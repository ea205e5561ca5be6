#include <jobsched/io/problem_loader.hpp>
#include <jobsched/io/error.hpp>

#include <jobsched/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <sstream>
#include <string>

namespace jobsched::io {

namespace {

using namespace jobsched::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

int64_t get_int64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

JobId as_job_id(const rapidjson::Value& val, const std::string& context) {
    if (!val.IsUint64()) {
        throw LoaderError("job reference must be a non-negative integer", context);
    }
    return val.GetUint64();
}

Machine parse_machine(const rapidjson::Value& obj, const std::string& ctx) {
    try {
        // Shorthand: a bare name means capacity 1
        if (obj.IsString()) {
            return Machine(obj.GetString());
        }
        if (!obj.IsObject()) {
            throw LoaderError("machine must be an object or a name", ctx);
        }
        const auto& id = get_member(obj, "id", ctx);
        if (!id.IsString()) {
            throw LoaderError("field 'id' must be a string", ctx);
        }
        int64_t capacity = obj.HasMember("capacity") ? get_int64(obj, "capacity", ctx) : 1;
        return Machine(id.GetString(), capacity);
    } catch (const InvalidInputError& e) {
        throw LoaderError(e.what(), ctx);
    }
}

Job parse_job(const rapidjson::Value& obj, const std::string& ctx, std::vector<Dependency>& dependencies) {
    if (!obj.IsObject()) {
        throw LoaderError("job must be an object", ctx);
    }
    JobId id = get_uint64(obj, "id", ctx);
    int64_t processing_time = get_int64(obj, "processing_time", ctx);

    std::vector<MachineId> machines;
    const auto& machine_list = get_array(obj, "machines", ctx);
    for (rapidjson::SizeType midx = 0; midx < machine_list.Size(); ++midx) {
        if (!machine_list[midx].IsString()) {
            throw LoaderError("machine names must be strings", ctx + ".machines[" + std::to_string(midx) + "]");
        }
        machines.emplace_back(machine_list[midx].GetString());
    }

    // Jobs listed before their "depends_on" entries are resolved by Problem
    if (obj.HasMember("depends_on")) {
        const auto& deps = get_array(obj, "depends_on", ctx);
        for (rapidjson::SizeType didx = 0; didx < deps.Size(); ++didx) {
            std::string dctx = ctx + ".depends_on[" + std::to_string(didx) + "]";
            dependencies.push_back(Dependency{as_job_id(deps[didx], dctx), id});
        }
    }

    try {
        return Job(id, Duration{processing_time}, std::move(machines));
    } catch (const InvalidInputError& e) {
        throw LoaderError(e.what(), ctx);
    }
}

Dependency parse_dependency(const rapidjson::Value& val, const std::string& ctx) {
    if (val.IsArray()) {
        if (val.Size() != 2) {
            throw LoaderError("dependency pair must have exactly two entries", ctx);
        }
        return Dependency{as_job_id(val[0], ctx), as_job_id(val[1], ctx)};
    }
    if (val.IsObject()) {
        return Dependency{get_uint64(val, "predecessor", ctx), get_uint64(val, "successor", ctx)};
    }
    throw LoaderError("dependency must be a [predecessor, successor] pair or an object", ctx);
}

void parse_solver_config(SolverConfig& config, const rapidjson::Value& obj) {
    const std::string ctx = "solver";
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }
    if (obj.HasMember("population_size")) {
        config.genetic.population_size = get_uint64(obj, "population_size", ctx);
    }
    if (obj.HasMember("generations")) {
        config.genetic.generations = get_uint64(obj, "generations", ctx);
    }
    if (obj.HasMember("mutation_rate")) {
        const auto& rate = obj["mutation_rate"];
        if (!rate.IsNumber()) {
            throw LoaderError("field 'mutation_rate' must be a number", ctx);
        }
        config.genetic.mutation_rate = rate.GetDouble();
    }
    if (obj.HasMember("seed")) {
        const auto& seed = obj["seed"];
        if (!seed.IsUint()) {
            throw LoaderError("field 'seed' must be a 32-bit unsigned integer", ctx);
        }
        config.seed = seed.GetUint();
    }
    if (obj.HasMember("time_horizon")) {
        int64_t horizon = get_int64(obj, "time_horizon", ctx);
        if (horizon <= 0) {
            throw LoaderError("time_horizon must be positive", ctx);
        }
        config.time_horizon = Duration{horizon};
    }
    if (obj.HasMember("precedence")) {
        const auto& rule = obj["precedence"];
        if (!rule.IsString()) {
            throw LoaderError("field 'precedence' must be a string", ctx);
        }
        config.precedence = parse_precedence_rule(rule.GetString());
    }
}

void parse_problem_impl(ProblemData& result, const rapidjson::Document& doc) {
    if (doc.HasMember("machines")) {
        const auto& machines = get_array(doc, "machines", "problem");
        for (rapidjson::SizeType midx = 0; midx < machines.Size(); ++midx) {
            result.machines.push_back(parse_machine(machines[midx], "machines[" + std::to_string(midx) + "]"));
        }
    }

    if (doc.HasMember("jobs")) {
        const auto& jobs = get_array(doc, "jobs", "problem");
        for (rapidjson::SizeType jidx = 0; jidx < jobs.Size(); ++jidx) {
            result.jobs.push_back(parse_job(jobs[jidx], "jobs[" + std::to_string(jidx) + "]", result.dependencies));
        }
    }

    if (doc.HasMember("dependencies")) {
        const auto& deps = get_array(doc, "dependencies", "problem");
        for (rapidjson::SizeType didx = 0; didx < deps.Size(); ++didx) {
            result.dependencies.push_back(parse_dependency(deps[didx], "dependencies[" + std::to_string(didx) + "]"));
        }
    }

    if (doc.HasMember("solver")) {
        parse_solver_config(result.solver, doc["solver"]);
    }
}

} // anonymous namespace

algo::PrecedenceRule parse_precedence_rule(std::string_view name) {
    if (name == "completion") {
        return algo::PrecedenceRule::Completion;
    }
    if (name == "placed_earlier") {
        return algo::PrecedenceRule::PlacedEarlier;
    }
    throw LoaderError("unknown precedence rule '" + std::string(name) + "'", "precedence");
}

std::string_view precedence_rule_name(algo::PrecedenceRule rule) noexcept {
    return rule == algo::PrecedenceRule::Completion ? "completion" : "placed_earlier";
}

ProblemData load_problem(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_problem_from_string(oss.str());
}

ProblemData load_problem_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "problem");
    }

    ProblemData result;
    parse_problem_impl(result, doc);
    return result;
}

void write_problem_to_stream(const ProblemData& problem, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("machines");
    writer.StartArray();
    for (const auto& machine : problem.machines) {
        writer.StartObject();
        writer.Key("id");
        writer.String(machine.id().c_str());
        writer.Key("capacity");
        writer.Int64(machine.capacity());
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("jobs");
    writer.StartArray();
    for (const auto& job : problem.jobs) {
        writer.StartObject();
        writer.Key("id");
        writer.Uint64(job.id());
        writer.Key("processing_time");
        writer.Int64(job.processing_time().count());
        writer.Key("machines");
        writer.StartArray();
        for (const auto& machine : job.required_machines()) {
            writer.String(machine.c_str());
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("dependencies");
    writer.StartArray();
    for (const auto& dep : problem.dependencies) {
        writer.StartArray();
        writer.Uint64(dep.predecessor);
        writer.Uint64(dep.successor);
        writer.EndArray();
    }
    writer.EndArray();

    writer.Key("solver");
    writer.StartObject();
    writer.Key("population_size");
    writer.Uint64(problem.solver.genetic.population_size);
    writer.Key("generations");
    writer.Uint64(problem.solver.genetic.generations);
    writer.Key("mutation_rate");
    writer.Double(problem.solver.genetic.mutation_rate);
    writer.Key("seed");
    writer.Uint(problem.solver.seed);
    writer.Key("time_horizon");
    writer.Int64(problem.solver.time_horizon.count());
    writer.Key("precedence");
    std::string_view rule = precedence_rule_name(problem.solver.precedence);
    writer.String(rule.data(), static_cast<rapidjson::SizeType>(rule.size()));
    writer.EndObject();

    writer.EndObject();

    out << buffer.GetString();
}

void write_problem(const ProblemData& problem, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_problem_to_stream(problem, file);
}

} // namespace jobsched::io
