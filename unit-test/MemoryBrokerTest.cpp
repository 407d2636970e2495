#include <algorithm>
#include <set>
#include <boost/throw_exception.hpp>
#include <thread>
#include "broker/memory_broker.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "test/fakes.hpp"

using namespace std;
using namespace nlohmann;
using namespace codejudge;
using namespace codejudge::broker;

TEST(MemoryBrokerTest, HigherPriorityFirst) {
    memory_broker queue{limits_config(), worker_config()};
    queue.enqueue(1, 0);
    queue.enqueue(2, 5);
    queue.enqueue(3, 9);

    EXPECT_EQ(queue.total_depth(), 3u);
    EXPECT_EQ(queue.dequeue()->submission_id, 3);
    EXPECT_EQ(queue.dequeue()->submission_id, 2);
    EXPECT_EQ(queue.dequeue()->submission_id, 1);
    EXPECT_FALSE(queue.dequeue());
}

TEST(MemoryBrokerTest, FifoWithinPriority) {
    memory_broker queue{limits_config(), worker_config()};
    for (long long id = 1; id <= 5; ++id) queue.enqueue(id, 3);

    for (long long id = 1; id <= 5; ++id) {
        auto job = queue.dequeue();
        ASSERT_TRUE(job);
        EXPECT_EQ(job->submission_id, id);
        EXPECT_EQ(job->priority, 3);
    }
}

TEST(MemoryBrokerTest, BaselineStarvesWhileHigherPriorityNonEmpty) {
    memory_broker queue{limits_config(), worker_config()};
    queue.enqueue(100, 0);
    for (long long id = 1; id <= 10; ++id) {
        queue.enqueue(id, 1);
        EXPECT_EQ(queue.dequeue()->submission_id, id);
    }
    EXPECT_EQ(queue.queue_depth(0), 1u);
    EXPECT_EQ(queue.dequeue()->submission_id, 100);
}

TEST(MemoryBrokerTest, RejectsInvalidPriority) {
    memory_broker queue{limits_config(), worker_config()};
    EXPECT_THROW(queue.enqueue(1, -1), validation_error);
    EXPECT_THROW(queue.enqueue(1, 10), validation_error);
    EXPECT_EQ(queue.total_depth(), 0u);
    EXPECT_TRUE(queue.job_index().empty());
}

TEST(MemoryBrokerTest, JobDeliveredToOneConsumer) {
    memory_broker queue{limits_config(), worker_config()};
    const int JOBS = 1000;
    for (int i = 0; i < JOBS; ++i) queue.enqueue(i, i % 10);

    mutex mut;
    vector<long long> consumed;
    vector<thread> consumers;
    for (int i = 0; i < 8; ++i) {
        consumers.emplace_back([&] {
            while (auto job = queue.dequeue()) {
                scoped_lock guard(mut);
                consumed.push_back(job->submission_id);
            }
        });
    }
    for (auto &consumer : consumers) consumer.join();

    EXPECT_EQ(consumed.size(), (size_t)JOBS);
    set<long long> unique(consumed.begin(), consumed.end());
    EXPECT_EQ(unique.size(), (size_t)JOBS);
}

TEST(MemoryBrokerTest, EnqueueRecordsJobIndex) {
    memory_broker queue{limits_config(), worker_config()};
    string first = queue.enqueue(1, 0);
    string second = queue.enqueue(2, 4);
    EXPECT_NE(first, second);
    EXPECT_EQ(queue.job_index(), vector<string>({first, second}));
}

TEST(MemoryBrokerTest, JobIndexKeepsNewestEntries) {
    memory_broker queue(limits_config(), worker_config(), chrono::system_clock::now, 2);
    queue.enqueue(1, 0);
    string second = queue.enqueue(2, 0);
    string third = queue.enqueue(3, 1);
    EXPECT_EQ(queue.job_index(), vector<string>({second, third}));
    EXPECT_EQ(queue.total_depth(), 3u);
}

TEST(MemoryBrokerTest, JobIndexFailureIsNotPropagated) {
    int attempts = 0;
    EXPECT_FALSE(record_job_index("job-1", [&] {
        ++attempts;
        BOOST_THROW_EXCEPTION(broker_error("LTRIM failed"));
    }));
    EXPECT_EQ(attempts, 1);

    EXPECT_TRUE(record_job_index("job-2", [&] { ++attempts; }));
    EXPECT_EQ(attempts, 2);
}

TEST(MemoryBrokerTest, ClearAllIsIdempotent) {
    memory_broker queue{limits_config(), worker_config()};
    queue.enqueue(1, 0);
    queue.enqueue(2, 1);
    queue.enqueue(3, 9);

    EXPECT_EQ(queue.clear_all(), 3u);
    EXPECT_EQ(queue.clear_all(), 0u);
    EXPECT_EQ(queue.total_depth(), 0u);
    EXPECT_FALSE(queue.dequeue());
}

TEST(MemoryBrokerTest, WorkerLivenessFollowsHeartbeat) {
    test::manual_clock clock;
    worker_config config;
    config.heartbeat_ttl = 300;
    config.active_window = 120;
    memory_broker queue(limits_config(), config, clock.function());

    queue.register_worker_heartbeat("worker-1", worker_phase::IDLE, {{"concurrency", 4}});
    EXPECT_EQ(queue.live_worker_count(), 1u);

    // 超出 active_window 后不再计入存活数，但心跳仍然存在
    clock.advance(chrono::seconds(121));
    EXPECT_EQ(queue.live_worker_count(), 0u);
    EXPECT_EQ(queue.list_workers().size(), 1u);

    clock.advance(chrono::seconds(180));
    EXPECT_TRUE(queue.list_workers().empty());
}

TEST(MemoryBrokerTest, RunningHeartbeatCarriesJob) {
    memory_broker queue{limits_config(), worker_config()};
    queue.register_worker_heartbeat("worker-1", worker_phase::RUNNING, {{"submission_id", 7}, {"job_id", "job-7"}});

    auto workers = queue.list_workers();
    ASSERT_EQ(workers.size(), 1u);
    EXPECT_EQ(workers[0].phase, worker_phase::RUNNING);
    EXPECT_EQ(workers[0].job_id, optional<string>("job-7"));
    EXPECT_EQ(workers[0].submission_id, optional<long long>(7));

    queue.register_worker_heartbeat("worker-1", worker_phase::IDLE, json::object());
    workers = queue.list_workers();
    ASSERT_EQ(workers.size(), 1u);
    EXPECT_EQ(workers[0].phase, worker_phase::IDLE);
    EXPECT_FALSE(workers[0].job_id);

    queue.deregister_worker("worker-1");
    EXPECT_TRUE(queue.list_workers().empty());
}

TEST(MemoryBrokerTest, SubscriptionEndsWhenDestroyed) {
    memory_broker queue{limits_config(), worker_config()};
    test::event_recorder recorder;
    {
        auto sub = queue.subscribe([&](const event &e) { recorder(e); });
        queue.publish_event("job_started", {{"submission_id", 1}});
    }
    queue.publish_event("job_finished", {{"submission_id", 1}});

    ASSERT_EQ(recorder.types(), vector<string>({"job_started"}));
    EXPECT_JSON_EQ(recorder.events[0].data, json({{"submission_id", 1}}));
}

TEST(MemoryBrokerTest, EnvelopeSerialization) {
    memory_broker queue{limits_config(), worker_config()};
    string job_id = queue.enqueue(42, 2);
    auto job = queue.dequeue();
    ASSERT_TRUE(job);

    json j = *job;
    EXPECT_EQ(j.at("type"), "submission");
    EXPECT_EQ(j.at("job_id"), job_id);
    EXPECT_EQ(j.at("submission_id"), 42);

    job_envelope parsed = j.get<job_envelope>();
    EXPECT_EQ(parsed.priority, 2);
    EXPECT_EQ(chrono::duration_cast<chrono::microseconds>(parsed.created_at.time_since_epoch()),
              chrono::duration_cast<chrono::microseconds>(job->created_at.time_since_epoch()));
}
