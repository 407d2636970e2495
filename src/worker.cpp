#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include <condition_variable>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/verdict.hpp"
#include "worker_pool.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;
using broker::job_envelope;
using broker::worker_phase;

string make_worker_id() {
    string uuid = random_uuid();
    return "worker-" + uuid.substr(0, 8);
}

dispatcher::dispatcher(string worker_id, broker::broker &job_queue, sandbox::sandbox_adapter &adapter,
                       store::submission_store &submissions, const worker_config &config)
    : worker_id(move(worker_id)), job_queue(job_queue), adapter(adapter), submissions(submissions), lifecycle(submissions), config(config),
      start_metadata({{"concurrency", config.concurrency}}) {}

const string &dispatcher::id() const {
    return worker_id;
}

void dispatcher::stop() noexcept {
    stop_requested = true;
}

bool dispatcher::stopping() const noexcept {
    return stop_requested;
}

void dispatcher::heartbeat(worker_phase phase, const json &metadata) noexcept {
    try {
        job_queue.register_worker_heartbeat(worker_id, phase, metadata);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Worker " << worker_id << " failed to update heartbeat: " << ex.what();
    }
}

void dispatcher::report_heartbeat() noexcept {
    scoped_lock guard(heartbeat_mut);
    json metadata = start_metadata;
    if (running_jobs.empty()) {
        heartbeat(worker_phase::IDLE, metadata);
        return;
    }
    const job_envelope &current = running_jobs.back();
    metadata["submission_id"] = current.submission_id;
    metadata["job_id"] = current.job_id;
    metadata["in_flight"] = running_jobs.size();
    heartbeat(worker_phase::RUNNING, metadata);
}

void dispatcher::begin_job(const job_envelope &job) noexcept {
    {
        scoped_lock guard(heartbeat_mut);
        running_jobs.push_back(job);
    }
    report_heartbeat();
}

void dispatcher::end_job(const job_envelope &job) noexcept {
    {
        scoped_lock guard(heartbeat_mut);
        auto it = find_if(running_jobs.begin(), running_jobs.end(),
                          [&](const job_envelope &running) { return running.job_id == job.job_id; });
        if (it != running_jobs.end()) running_jobs.erase(it);
    }
    report_heartbeat();
}

void dispatcher::sleep_unless_stopped(chrono::milliseconds duration) {
    static const chrono::milliseconds slice(100);
    auto deadline = chrono::steady_clock::now() + duration;
    while (!stopping()) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        this_thread::sleep_for(min(remaining, slice));
    }
}

void dispatcher::run() {
    LOG(INFO) << "Starting worker " << worker_id << " with concurrency " << config.concurrency;
    {
        scoped_lock guard(heartbeat_mut);
        start_metadata["started_at"] = format_iso8601(chrono::system_clock::now());
    }
    report_heartbeat();

    // 拉取循环可能长时间阻塞在空队列轮询或者 pool.submit 上，心跳由单独的线程刷新
    mutex beat_mut;
    condition_variable beat_cv;
    bool finished = false;
    thread beat([&] {
        unique_lock<mutex> lock(beat_mut);
        while (!beat_cv.wait_for(lock, chrono::milliseconds(config.heartbeat_interval), [&] { return finished; }))
            report_heartbeat();
    });

    {
        // 线程池析构之后才停止心跳线程，排空在途任务期间心跳仍然有效
        defer {
            {
                scoped_lock guard(beat_mut);
                finished = true;
            }
            beat_cv.notify_all();
            beat.join();
        };

        worker_pool pool(config.concurrency);
        while (!stopping()) {
            try {
                auto job = job_queue.dequeue();
                if (!job) {
                    sleep_unless_stopped(chrono::milliseconds(config.idle_interval));
                    continue;
                }
                // 线程池满时阻塞，直到有任务执行完成
                if (!pool.submit([this, job = *job] { handle_job(job); })) {
                    LOG(ERROR) << "Worker pool refused job " << job->job_id << ", marking submission as failed";
                    lifecycle.fail(job->submission_id, "Worker is shutting down");
                }
            } catch (std::exception &ex) {
                LOG(ERROR) << "Error in worker main loop: " << ex.what() << endl
                           << boost::diagnostic_information(ex);
                sleep_unless_stopped(chrono::milliseconds(config.error_backoff));
            }
        }
        LOG(INFO) << "Worker " << worker_id << " waiting for " << pool.in_flight() << " in-flight jobs";
        pool.shutdown();
    }

    {
        scoped_lock guard(heartbeat_mut);
        heartbeat(worker_phase::STOPPED, start_metadata);
    }
    try {
        job_queue.deregister_worker(worker_id);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Worker " << worker_id << " failed to deregister: " << ex.what();
    }
    LOG(INFO) << "Worker " << worker_id << " stopped";
}

void dispatcher::handle_job(const job_envelope &job) noexcept {
    long long submission_id = job.submission_id;
    LOG(INFO) << "Processing submission " << submission_id << " (job " << job.job_id << ")";

    begin_job(job);
    defer {
        end_job(job);
    };

    try {
        execute_submission(job);
        LOG(INFO) << "Completed processing submission " << submission_id;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Failed to process submission " << submission_id << ": " << ex.what();
        string message = ex.what();
        try {
            lifecycle.fail(submission_id, message);
        } catch (std::exception &db_ex) {
            LOG(ERROR) << "Failed to update submission status: " << db_ex.what();
        }
        job_queue.publish_event("job_failed", {{"submission_id", submission_id},
                                               {"job_id", job.job_id},
                                               {"worker_id", worker_id},
                                               {"error", message}});
    }
}

void dispatcher::execute_submission(const job_envelope &job) {
    long long submission_id = job.submission_id;
    auto submit = submissions.find(submission_id);
    if (!submit) BOOST_THROW_EXCEPTION(submission_not_found(submission_id));

    if (!lifecycle.claim(submission_id)) {
        LOG(WARNING) << "Submission " << submission_id << " already processed";
        return;
    }
    job_queue.publish_event("job_started", {{"submission_id", submission_id},
                                            {"job_id", job.job_id},
                                            {"worker_id", worker_id}});

    if (!adapter.is_available())
        BOOST_THROW_EXCEPTION(internal_error("Sandbox is not available"));

    sandbox::execution_request request;
    request.source_code = submit->source_code;
    request.language_id = submit->language_id;
    request.stdin_text = submit->stdin_text;
    if (submit->time_limit > 0) request.time_limit = submit->time_limit;
    if (submit->memory_limit > 0) request.memory_limit = submit->memory_limit;

    sandbox::execution_result result = adapter.execute(request);

    json metadata = {{"worker_id", worker_id},
                     {"execution_time", format_iso8601(chrono::system_clock::now())},
                     {"success", result.success}};
    submission_outcome outcome = make_outcome(result, submit->expected_output, metadata);
    lifecycle.finish(submission_id, outcome);

    job_queue.publish_event("job_finished", {{"submission_id", submission_id},
                                             {"job_id", job.job_id},
                                             {"worker_id", worker_id},
                                             {"status", get_display_message(outcome.status)},
                                             {"success", result.success}});
}

}  // namespace codejudge
