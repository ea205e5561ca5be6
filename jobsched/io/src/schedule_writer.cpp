#include <jobsched/io/schedule_writer.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <iomanip>
#include <variant>

namespace jobsched::io {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_schedule_object(JsonWriter& writer, std::string_view solver, const core::Schedule& schedule) {
    writer.StartObject();
    writer.Key("solver");
    write_string(writer, solver);
    writer.Key("makespan");
    writer.Int64(schedule.makespan().count());

    writer.Key("assignments");
    writer.StartArray();
    for (const auto& assignment : schedule.assignments()) {
        writer.StartObject();
        writer.Key("job");
        writer.Uint64(assignment.job);
        writer.Key("start");
        writer.Int64(assignment.start.count());
        writer.Key("end");
        writer.Int64(assignment.end.count());
        writer.Key("machines");
        writer.StartArray();
        for (const auto& machine : assignment.machines) {
            write_string(writer, machine);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();
}

void write_failure_object(JsonWriter& writer, std::string_view solver, const algo::SolveFailure& failure) {
    writer.StartObject();
    writer.Key("solver");
    write_string(writer, solver);
    writer.Key("failure");
    write_string(writer, algo::to_string(failure.kind));
    writer.Key("message");
    write_string(writer, failure.message);
    writer.EndObject();
}

} // anonymous namespace

void write_schedule_json(std::string_view solver, const core::Schedule& schedule, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_schedule_object(writer, solver, schedule);
    out << buffer.GetString() << "\n";
}

void write_schedules_json(const std::vector<SolverRun>& runs, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartArray();
    for (const auto& run : runs) {
        if (const auto* schedule = std::get_if<core::Schedule>(&run.outcome)) {
            write_schedule_object(writer, run.solver, *schedule);
        } else {
            write_failure_object(writer, run.solver, std::get<algo::SolveFailure>(run.outcome));
        }
    }
    writer.EndArray();

    out << buffer.GetString() << "\n";
}

void write_schedule_table(const core::Problem& problem, const core::Schedule& schedule, std::ostream& out) {
    std::size_t width = 0;
    for (const auto& machine : problem.machines()) {
        width = std::max(width, machine.id().size());
    }

    for (const auto& machine : problem.machines()) {
        out << std::setw(static_cast<int>(width)) << std::left << machine.id() << " |";
        auto timeline = schedule.machine_timeline(machine.id());
        if (timeline.empty()) {
            out << " (idle)";
        }
        for (const auto* assignment : timeline) {
            out << " " << assignment->job << "@[" << assignment->start.count() << ","
                << assignment->end.count() << ")";
        }
        out << "\n";
    }
    out << "makespan: " << schedule.makespan().count() << "\n";
}

} // namespace jobsched::io
