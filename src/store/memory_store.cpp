#include "store/memory_store.hpp"

namespace codejudge::store {
using namespace std;

memory_store::memory_store(clock_type clock) : clock(move(clock)) {}

submission memory_store::create(const submission &draft) {
    scoped_lock guard(mut);
    submission record = draft;
    record.id = next_id++;
    record.status = status::QUEUED;
    record.created_at = clock();
    record.started_at.reset();
    record.finished_at.reset();
    submissions[record.id] = record;
    return record;
}

optional<submission> memory_store::find(long long id) {
    scoped_lock guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end()) return nullopt;
    return it->second;
}

bool memory_store::try_claim(long long id) {
    scoped_lock guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end() || it->second.status != status::QUEUED) return false;
    it->second.status = status::PROCESSING;
    it->second.started_at = clock();
    return true;
}

bool memory_store::complete(long long id, const submission_outcome &outcome) {
    scoped_lock guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end() || it->second.status != status::PROCESSING) return false;
    submission &record = it->second;
    record.status = outcome.status;
    record.stdout_text = outcome.stdout_text;
    record.stderr_text = outcome.stderr_text;
    record.compile_output = outcome.compile_output;
    record.exit_code = outcome.exit_code;
    record.signal = outcome.signal;
    record.wall_time = outcome.wall_time;
    record.cpu_time = outcome.cpu_time;
    record.memory_peak_kb = outcome.memory_peak_kb;
    record.error_message = outcome.error_message;
    record.execution_metadata = outcome.execution_metadata;
    record.finished_at = clock();
    return true;
}

bool memory_store::force_internal_error(long long id, const string &error_message) {
    scoped_lock guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end() || is_terminal(it->second.status)) return false;
    it->second.status = status::INTERNAL_ERROR;
    it->second.error_message = error_message;
    it->second.finished_at = clock();
    return true;
}

bool memory_store::update_if_queued(long long id, const submission_edit &edit) {
    scoped_lock guard(mut);
    auto it = submissions.find(id);
    if (it == submissions.end() || it->second.status != status::QUEUED) return false;
    submission &record = it->second;
    if (edit.stdin_text) record.stdin_text = edit.stdin_text;
    if (edit.expected_output) record.expected_output = edit.expected_output;
    if (edit.time_limit) record.time_limit = *edit.time_limit;
    if (edit.memory_limit) record.memory_limit = *edit.memory_limit;
    return true;
}

map<status, size_t> memory_store::count_by_status() {
    scoped_lock guard(mut);
    map<status, size_t> counts;
    for (auto &[id, record] : submissions) ++counts[record.status];
    return counts;
}

bool memory_store::remove(long long id) {
    scoped_lock guard(mut);
    return submissions.erase(id) > 0;
}

}  // namespace codejudge::store
