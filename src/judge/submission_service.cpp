#include "judge/submission_service.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/language.hpp"
#include "judge/verdict.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

// execute_now 写入 execution_metadata 时使用的执行者
static const char *IMMEDIATE_EXECUTOR = "immediate";

submission_service::submission_service(broker::broker &job_queue, sandbox::sandbox_adapter &adapter,
                                       store::submission_store &submissions, const limits_config &limits)
    : job_queue(job_queue), adapter(adapter), submissions(submissions), lifecycle(submissions), limits(limits) {}

void submission_service::check_limits(int time_limit, int memory_limit) const {
    if (time_limit <= 0)
        BOOST_THROW_EXCEPTION(validation_error("Time limit must be positive"));
    if (time_limit > limits.max_time_limit)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("Time limit cannot exceed {} seconds", limits.max_time_limit)));
    if (memory_limit <= 0)
        BOOST_THROW_EXCEPTION(validation_error("Memory limit must be positive"));
    if (memory_limit > limits.max_memory_limit)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("Memory limit cannot exceed {} MB", limits.max_memory_limit)));
}

void submission_service::check_priority(int priority) const {
    if (priority < 0 || priority > limits.max_priority)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("Priority must be between 0 and {}", limits.max_priority)));
}

submission submission_service::prepare(const new_submission &request) const {
    get_language(request.language_id);

    submission draft;
    draft.source_code = request.source_code;
    draft.language_id = request.language_id;
    draft.stdin_text = request.stdin_text;
    draft.expected_output = request.expected_output;
    draft.time_limit = request.time_limit.value_or(limits.default_time_limit);
    draft.memory_limit = request.memory_limit.value_or(limits.default_memory_limit);
    check_limits(draft.time_limit, draft.memory_limit);
    return draft;
}

created_submission submission_service::create_submission(const new_submission &request, int priority) {
    check_priority(priority);
    submission draft = prepare(request);

    created_submission created;
    created.record = submissions.create(draft);
    created.job_id = job_queue.enqueue(created.record.id, priority);
    job_queue.publish_event("submission_created", {{"submission_id", created.record.id},
                                                   {"job_id", created.job_id},
                                                   {"priority", priority}});
    LOG(INFO) << "Created submission " << created.record.id;
    return created;
}

vector<created_submission> submission_service::create_batch(const vector<new_submission> &requests, int priority) {
    check_priority(priority);
    vector<submission> drafts;
    for (auto &request : requests) drafts.push_back(prepare(request));

    vector<created_submission> result;
    for (auto &draft : drafts) {
        created_submission created;
        created.record = submissions.create(draft);
        result.push_back(move(created));
    }
    for (auto &created : result) {
        created.job_id = job_queue.enqueue(created.record.id, priority);
        job_queue.publish_event("submission_created", {{"submission_id", created.record.id},
                                                       {"job_id", created.job_id},
                                                       {"priority", priority}});
    }
    LOG(INFO) << "Created " << result.size() << " batch submissions";
    return result;
}

bool submission_service::update_submission(long long submission_id, const submission_edit &edit) {
    auto current = submissions.find(submission_id);
    if (!current) BOOST_THROW_EXCEPTION(submission_not_found(submission_id));
    check_limits(edit.time_limit.value_or(current->time_limit), edit.memory_limit.value_or(current->memory_limit));
    return lifecycle.edit(submission_id, edit);
}

optional<submission> submission_service::find(long long submission_id) {
    return submissions.find(submission_id);
}

submission submission_service::execute_now(const new_submission &request) {
    // 先检查沙箱，避免创建出一个不在队列中、永远不会被执行的提交
    if (!adapter.is_available())
        BOOST_THROW_EXCEPTION(internal_error("Sandbox is not available"));
    submission record = submissions.create(prepare(request));
    LOG(INFO) << "Created submission " << record.id << " for immediate execution";
    return execute_now(record.id);
}

submission submission_service::execute_now(long long submission_id) {
    auto submit = submissions.find(submission_id);
    if (!submit) BOOST_THROW_EXCEPTION(submission_not_found(submission_id));
    if (submit->status != status::QUEUED)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("Submission {} is already {}", submission_id, get_display_message(submit->status))));
    if (!adapter.is_available())
        BOOST_THROW_EXCEPTION(internal_error("Sandbox is not available"));
    if (!lifecycle.claim(submission_id))
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("Submission {} was claimed by another worker", submission_id)));

    try {
        sandbox::execution_request request;
        request.source_code = submit->source_code;
        request.language_id = submit->language_id;
        request.stdin_text = submit->stdin_text;
        request.time_limit = submit->time_limit;
        request.memory_limit = submit->memory_limit;
        sandbox::execution_result result = adapter.execute(request);

        json metadata = {{"worker_id", IMMEDIATE_EXECUTOR},
                         {"execution_time", format_iso8601(chrono::system_clock::now())},
                         {"success", result.success}};
        lifecycle.finish(submission_id, make_outcome(result, submit->expected_output, metadata));
    } catch (std::exception &ex) {
        LOG(ERROR) << "Failed to execute submission " << submission_id << ": " << ex.what();
        lifecycle.fail(submission_id, ex.what());
    }

    auto finished = submissions.find(submission_id);
    if (!finished) BOOST_THROW_EXCEPTION(submission_not_found(submission_id));
    return *finished;
}

}  // namespace codejudge
