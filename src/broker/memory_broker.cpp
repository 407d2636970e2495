#include "broker/memory_broker.hpp"
#include <glog/logging.h>

namespace codejudge::broker {
using namespace std;
using namespace nlohmann;

struct memory_broker::memory_subscription : public subscription {
    memory_subscription(memory_broker &owner, size_t id) : owner(owner), id(id) {}

    ~memory_subscription() override {
        owner.unsubscribe(id);
    }

    memory_broker &owner;
    size_t id;
};

memory_broker::memory_broker(const limits_config &limits, const worker_config &worker, clock_type clock, size_t job_index_size)
    : broker(limits, worker), clock(move(clock)), job_index_size(job_index_size) {}

string memory_broker::enqueue(long long submission_id, int priority) {
    check_priority(priority);
    scoped_lock guard(mut);
    job_envelope job = make_envelope(submission_id, priority, clock());
    partitions[priority].push_back(job);
    jobs.push_back(job.job_id);
    while (jobs.size() > job_index_size) jobs.pop_front();
    DLOG(INFO) << "Enqueued submission " << submission_id << " with job_id " << job.job_id << " at priority " << priority;
    return job.job_id;
}

optional<job_envelope> memory_broker::dequeue() {
    scoped_lock guard(mut);
    // map 按优先级升序排列，反向遍历即从最高优先级开始，基准队列 0 最后检查
    for (auto it = partitions.rbegin(); it != partitions.rend(); ++it) {
        auto &partition = it->second;
        if (partition.empty()) continue;
        job_envelope job = move(partition.front());
        partition.pop_front();
        return job;
    }
    return nullopt;
}

size_t memory_broker::queue_depth(int priority) {
    scoped_lock guard(mut);
    auto it = partitions.find(priority);
    return it == partitions.end() ? 0 : it->second.size();
}

size_t memory_broker::total_depth() {
    scoped_lock guard(mut);
    size_t total = 0;
    for (auto &[priority, partition] : partitions) total += partition.size();
    return total;
}

size_t memory_broker::clear_all() {
    scoped_lock guard(mut);
    size_t cleared = 0;
    for (auto &[priority, partition] : partitions) {
        cleared += partition.size();
        partition.clear();
    }
    return cleared;
}

void memory_broker::register_worker_heartbeat(const string &worker_id, worker_phase phase, const json &metadata) {
    scoped_lock guard(mut);
    auto now = clock();
    purge_expired(now);
    workers[worker_id] = make_descriptor(worker_id, phase, metadata, now);
}

void memory_broker::deregister_worker(const string &worker_id) {
    scoped_lock guard(mut);
    workers.erase(worker_id);
}

size_t memory_broker::live_worker_count() {
    scoped_lock guard(mut);
    auto now = clock();
    purge_expired(now);
    size_t count = 0;
    for (auto &[worker_id, descriptor] : workers)
        if (is_active(descriptor, now)) ++count;
    return count;
}

vector<worker_descriptor> memory_broker::list_workers() {
    scoped_lock guard(mut);
    purge_expired(clock());
    vector<worker_descriptor> result;
    for (auto &[worker_id, descriptor] : workers) result.push_back(descriptor);
    return result;
}

void memory_broker::purge_expired(chrono::system_clock::time_point now) {
    for (auto it = workers.begin(); it != workers.end();) {
        if (is_expired(it->second, now))
            it = workers.erase(it);
        else
            ++it;
    }
}

void memory_broker::publish_event(const string &type, const json &payload) noexcept {
    event e{type, payload, clock()};
    vector<event_callback> callbacks;
    {
        scoped_lock guard(subscribers_mut);
        for (auto &[id, callback] : subscribers) callbacks.push_back(callback);
    }
    for (auto &callback : callbacks) {
        try {
            callback(e);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Event subscriber failed to handle " << type << ": " << ex.what();
        }
    }
}

unique_ptr<subscription> memory_broker::subscribe(event_callback callback) {
    scoped_lock guard(subscribers_mut);
    size_t id = next_subscriber++;
    subscribers[id] = move(callback);
    return make_unique<memory_subscription>(*this, id);
}

void memory_broker::unsubscribe(size_t id) {
    scoped_lock guard(subscribers_mut);
    subscribers.erase(id);
}

bool memory_broker::ping() {
    return true;
}

vector<string> memory_broker::job_index() {
    scoped_lock guard(mut);
    return vector<string>(jobs.begin(), jobs.end());
}

}  // namespace codejudge::broker
