#include "broker/broker.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codejudge::broker {
using namespace std;
using namespace nlohmann;

bool record_job_index(const string &job_id, const function<void()> &update) noexcept {
    try {
        update();
        return true;
    } catch (std::exception &ex) {
        LOG(WARNING) << "Failed to record job " << job_id << " in job index: " << ex.what();
        return false;
    }
}

static json time_to_json(chrono::system_clock::time_point tp) {
    return format_iso8601(tp);
}

static chrono::system_clock::time_point time_from_json(const json &j) {
    auto tp = parse_iso8601(j.get<string>());
    if (!tp) throw invalid_argument("Malformed timestamp " + j.dump());
    return *tp;
}

void to_json(json &j, const job_envelope &job) {
    j = {{"job_id", job.job_id},
         {"submission_id", job.submission_id},
         {"priority", job.priority},
         {"created_at", time_to_json(job.created_at)},
         {"type", "submission"}};
}

void from_json(const json &j, job_envelope &job) {
    j.at("job_id").get_to(job.job_id);
    j.at("submission_id").get_to(job.submission_id);
    j.at("priority").get_to(job.priority);
    job.created_at = time_from_json(j.at("created_at"));
}

const char *to_string(worker_phase phase) {
    switch (phase) {
        case worker_phase::IDLE: return "idle";
        case worker_phase::RUNNING: return "running";
        case worker_phase::STOPPED: return "stopped";
    }
    return "unknown";
}

worker_phase worker_phase_from_string(const string &phase) {
    if (phase == "idle") return worker_phase::IDLE;
    if (phase == "running") return worker_phase::RUNNING;
    if (phase == "stopped") return worker_phase::STOPPED;
    throw invalid_argument("Unrecognized worker phase " + phase);
}

void to_json(json &j, const worker_descriptor &worker) {
    j = {{"worker_id", worker.worker_id},
         {"status", to_string(worker.phase)},
         {"last_seen", time_to_json(worker.last_seen)},
         {"metadata", worker.metadata.is_null() ? json::object() : worker.metadata}};
    if (worker.job_id) j["job_id"] = *worker.job_id;
    if (worker.submission_id) j["submission_id"] = *worker.submission_id;
}

void from_json(const json &j, worker_descriptor &worker) {
    j.at("worker_id").get_to(worker.worker_id);
    worker.phase = worker_phase_from_string(j.at("status").get<string>());
    worker.last_seen = time_from_json(j.at("last_seen"));
    worker.metadata = j.count("metadata") ? j.at("metadata") : json::object();
    if (j.count("job_id")) worker.job_id = j.at("job_id").get<string>();
    if (j.count("submission_id")) worker.submission_id = j.at("submission_id").get<long long>();
}

void to_json(json &j, const event &e) {
    j = {{"type", e.type},
         {"data", e.data},
         {"timestamp", time_to_json(e.timestamp)}};
}

void from_json(const json &j, event &e) {
    j.at("type").get_to(e.type);
    e.data = j.count("data") ? j.at("data") : json::object();
    e.timestamp = time_from_json(j.at("timestamp"));
}

subscription::~subscription() {}

broker::broker(const limits_config &limits, const worker_config &worker)
    : limits(limits), worker(worker) {}

broker::~broker() {}

int broker::max_priority() const {
    return limits.max_priority;
}

void broker::check_priority(int priority) const {
    if (priority < 0 || priority > limits.max_priority)
        BOOST_THROW_EXCEPTION(validation_error("Priority " + std::to_string(priority) +
                                               " is out of range [0, " + std::to_string(limits.max_priority) + "]"));
}

job_envelope broker::make_envelope(long long submission_id, int priority, chrono::system_clock::time_point now) const {
    job_envelope job;
    job.job_id = random_uuid();
    job.submission_id = submission_id;
    job.priority = priority;
    job.created_at = now;
    return job;
}

worker_descriptor broker::make_descriptor(const string &worker_id, worker_phase phase, const json &metadata,
                                          chrono::system_clock::time_point now) const {
    worker_descriptor descriptor;
    descriptor.worker_id = worker_id;
    descriptor.phase = phase;
    descriptor.last_seen = now;
    descriptor.metadata = metadata.is_object() ? metadata : json::object();
    if (phase == worker_phase::RUNNING) {
        if (metadata.count("job_id")) descriptor.job_id = metadata.at("job_id").get<string>();
        if (metadata.count("submission_id")) descriptor.submission_id = metadata.at("submission_id").get<long long>();
    }
    return descriptor;
}

bool broker::is_active(const worker_descriptor &descriptor, chrono::system_clock::time_point now) const {
    return now - descriptor.last_seen < chrono::seconds(worker.active_window);
}

bool broker::is_expired(const worker_descriptor &descriptor, chrono::system_clock::time_point now) const {
    return now - descriptor.last_seen >= chrono::seconds(worker.heartbeat_ttl);
}

}  // namespace codejudge::broker
