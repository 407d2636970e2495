#include "judge/submission.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

template <typename T>
static void put_optional(json &j, const char *key, const optional<T> &value) {
    if (value)
        j[key] = *value;
    else
        j[key] = nullptr;
}

template <typename T>
static void assign_optional(const json &j, const char *key, optional<T> &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = j.at(key).get<T>();
}

static json time_to_json(const optional<chrono::system_clock::time_point> &tp) {
    if (!tp) return nullptr;
    return format_iso8601(*tp);
}

void to_json(json &j, const submission &submit) {
    j = {{"id", submit.id},
         {"source_code", submit.source_code},
         {"language_id", submit.language_id},
         {"time_limit", submit.time_limit},
         {"memory_limit", submit.memory_limit},
         {"status_id", status_id(submit.status)},
         {"status", get_display_message(submit.status)},
         {"created_at", format_iso8601(submit.created_at)},
         {"started_at", time_to_json(submit.started_at)},
         {"finished_at", time_to_json(submit.finished_at)}};
    put_optional(j, "stdin", submit.stdin_text);
    put_optional(j, "expected_output", submit.expected_output);
    put_optional(j, "stdout", submit.stdout_text);
    put_optional(j, "stderr", submit.stderr_text);
    put_optional(j, "compile_output", submit.compile_output);
    put_optional(j, "exit_code", submit.exit_code);
    put_optional(j, "signal", submit.signal);
    put_optional(j, "wall_time", submit.wall_time);
    put_optional(j, "cpu_time", submit.cpu_time);
    put_optional(j, "memory_peak", submit.memory_peak_kb);
    put_optional(j, "error_message", submit.error_message);
    put_optional(j, "execution_metadata", submit.execution_metadata);
}

void from_json(const json &j, new_submission &request) {
    j.at("source_code").get_to(request.source_code);
    j.at("language_id").get_to(request.language_id);
    assign_optional(j, "stdin", request.stdin_text);
    assign_optional(j, "expected_output", request.expected_output);
    assign_optional(j, "time_limit", request.time_limit);
    assign_optional(j, "memory_limit", request.memory_limit);
}

void from_json(const json &j, submission_edit &edit) {
    assign_optional(j, "stdin", edit.stdin_text);
    assign_optional(j, "expected_output", edit.expected_output);
    assign_optional(j, "time_limit", edit.time_limit);
    assign_optional(j, "memory_limit", edit.memory_limit);
}

}  // namespace codejudge
