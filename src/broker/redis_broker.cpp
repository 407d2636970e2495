#include "broker/redis_broker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"

namespace codejudge::broker {
using namespace std;
using namespace nlohmann;

using replies_t = vector<future<cpp_redis::reply>>;

static size_t as_size(const cpp_redis::reply &reply) {
    return reply.is_integer() ? (size_t)reply.as_integer() : 0;
}

/**
 * @brief 持有一个独立的 subscriber 连接，析构时取消订阅并断开连接
 */
struct redis_subscription : public subscription {
    redis_subscription(const redis_config &redis, event_callback callback) : channel(redis.channel) {
        subscriber.connect(redis.host, redis.port,
                           [](const std::string &host, std::size_t port, cpp_redis::connect_state status) {
                               if (status == cpp_redis::connect_state::dropped)
                                   LOG(INFO) << "Redis: subscriber disconnected from " << host << ":" << port;
                           });
        if (!redis.password.empty())
            subscriber.auth(redis.password);
        subscriber.subscribe(channel, [callback](const std::string &, const std::string &message) {
            try {
                callback(json::parse(message).get<event>());
            } catch (std::exception &ex) {
                LOG(WARNING) << "Redis: dropping malformed event " << message << ": " << ex.what();
            }
        });
        subscriber.commit();
    }

    ~redis_subscription() override {
        try {
            subscriber.unsubscribe(channel);
            subscriber.commit();
            subscriber.disconnect(true);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Redis: unable to unsubscribe from " << channel << ": " << ex.what();
        }
    }

    std::string channel;
    cpp_redis::subscriber subscriber;
};

redis_broker::redis_broker(const redis_config &redis, const limits_config &limits, const worker_config &worker)
    : broker(limits, worker), conn(redis) {}

string redis_broker::partition_key(int priority) const {
    return conn.config().prefix + ":submissions:priority:" + std::to_string(priority);
}

string redis_broker::job_index_key() const {
    return conn.config().prefix + ":submissions:all";
}

string redis_broker::worker_key(const string &worker_id) const {
    return conn.config().prefix + ":worker:" + worker_id;
}

string redis_broker::workers_key() const {
    return conn.config().prefix + ":workers";
}

string redis_broker::enqueue(long long submission_id, int priority) {
    check_priority(priority);
    job_envelope job = make_envelope(submission_id, priority, chrono::system_clock::now());
    string body = json(job).dump();
    int index_size = (int)conn.config().job_index_size;

    // LPUSH 不可以重复执行，否则同一个提交会被入队多次
    conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.lpush(partition_key(priority), {body}));
    },
                 /* idempotent */ false);

    record_job_index(job.job_id, [&] {
        conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
            replies.push_back(redis.lpush(job_index_key(), {job.job_id}));
            replies.push_back(redis.ltrim(job_index_key(), 0, index_size - 1));
        },
                     /* idempotent */ false);
    });

    LOG(INFO) << "Enqueued submission " << submission_id << " with job_id " << job.job_id << " at priority " << priority;
    return job.job_id;
}

optional<job_envelope> redis_broker::dequeue() {
    for (int priority = max_priority(); priority >= 0; --priority) {
        auto replies = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
            replies.push_back(redis.rpop(partition_key(priority)));
        },
                                    /* idempotent */ false);
        const cpp_redis::reply &reply = replies.at(0);
        if (!reply.is_string()) continue;

        try {
            job_envelope job = json::parse(reply.as_string()).get<job_envelope>();
            LOG(INFO) << "Dequeued submission " << job.submission_id << " (job " << job.job_id << ")";
            return job;
        } catch (std::exception &ex) {
            // 任务已经被弹出，无法放回，只能记录下来
            LOG(ERROR) << "Discarding malformed job envelope from " << partition_key(priority) << ": "
                       << reply.as_string() << ", " << ex.what();
        }
    }
    return nullopt;
}

size_t redis_broker::queue_depth(int priority) {
    auto replies = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.llen(partition_key(priority)));
    });
    return as_size(replies.at(0));
}

size_t redis_broker::total_depth() {
    auto replies = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        for (int priority = 0; priority <= max_priority(); ++priority)
            replies.push_back(redis.llen(partition_key(priority)));
    });
    size_t total = 0;
    for (auto &reply : replies) total += as_size(reply);
    return total;
}

size_t redis_broker::clear_all() {
    vector<string> keys;
    for (int priority = 0; priority <= max_priority(); ++priority)
        keys.push_back(partition_key(priority));

    // 在事务中先统计长度再删除，避免统计与删除之间有新任务入队
    auto replies = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.multi());
        for (auto &key : keys) replies.push_back(redis.llen(key));
        replies.push_back(redis.del(keys));
        replies.push_back(redis.exec());
    },
                                /* idempotent */ false);

    const cpp_redis::reply &result = replies.back();
    if (!result.is_array())
        BOOST_THROW_EXCEPTION(broker_error("Redis: unexpected reply to EXEC while clearing queues"));
    size_t cleared = 0;
    auto &results = result.as_array();
    for (size_t i = 0; i < keys.size() && i < results.size(); ++i)
        cleared += as_size(results[i]);
    LOG(INFO) << "Cleared " << cleared << " jobs from all queues";
    return cleared;
}

void redis_broker::register_worker_heartbeat(const string &worker_id, worker_phase phase, const json &metadata) {
    worker_descriptor descriptor = make_descriptor(worker_id, phase, metadata, chrono::system_clock::now());
    string body = json(descriptor).dump();
    conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.setex(worker_key(worker_id), worker.heartbeat_ttl, body));
        replies.push_back(redis.sadd(workers_key(), {worker_id}));
        replies.push_back(redis.expire(workers_key(), worker.heartbeat_ttl));
    });
}

void redis_broker::deregister_worker(const string &worker_id) {
    conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.del({worker_key(worker_id)}));
        replies.push_back(redis.srem(workers_key(), {worker_id}));
    });
}

vector<worker_descriptor> redis_broker::list_workers() {
    auto members = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.smembers(workers_key()));
    });
    if (!members.at(0).is_array()) return {};

    vector<string> worker_ids, keys;
    for (auto &member : members.at(0).as_array()) {
        if (!member.is_string()) continue;
        worker_ids.push_back(member.as_string());
        keys.push_back(worker_key(member.as_string()));
    }
    if (keys.empty()) return {};

    auto values = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
        replies.push_back(redis.mget(keys));
    });
    if (!values.at(0).is_array()) return {};

    vector<worker_descriptor> result;
    vector<string> expired;
    auto &entries = values.at(0).as_array();
    for (size_t i = 0; i < entries.size() && i < worker_ids.size(); ++i) {
        if (!entries[i].is_string()) {
            // 心跳已经被 redis 过期删除
            expired.push_back(worker_ids[i]);
            continue;
        }
        try {
            result.push_back(json::parse(entries[i].as_string()).get<worker_descriptor>());
        } catch (std::exception &ex) {
            LOG(WARNING) << "Ignoring malformed heartbeat of worker " << worker_ids[i] << ": " << ex.what();
        }
    }

    if (!expired.empty()) {
        conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
            replies.push_back(redis.srem(workers_key(), expired));
        });
    }
    return result;
}

size_t redis_broker::live_worker_count() {
    auto now = chrono::system_clock::now();
    size_t count = 0;
    for (auto &descriptor : list_workers())
        if (is_active(descriptor, now)) ++count;
    return count;
}

void redis_broker::publish_event(const string &type, const json &payload) noexcept {
    try {
        event e{type, payload, chrono::system_clock::now()};
        string body = json(e).dump();
        conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
            replies.push_back(redis.publish(conn.config().channel, body));
        });
        DLOG(INFO) << "Published event: " << type;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Failed to publish event " << type << ": " << ex.what();
    }
}

unique_ptr<subscription> redis_broker::subscribe(event_callback callback) {
    try {
        return make_unique<redis_subscription>(conn.config(), move(callback));
    } catch (cpp_redis::redis_error &ex) {
        BOOST_THROW_EXCEPTION(broker_error(string("Redis: unable to subscribe to events: ") + ex.what()));
    }
}

bool redis_broker::ping() {
    try {
        auto replies = conn.execute([&](cpp_redis::client &redis, replies_t &replies) {
            replies.push_back(redis.ping());
        });
        return replies.at(0).is_string() && replies.at(0).as_string() == "PONG";
    } catch (broker_error &ex) {
        LOG(ERROR) << "Redis connection test failed: " << ex.what();
        return false;
    }
}

}  // namespace codejudge::broker
