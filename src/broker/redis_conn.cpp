#include "broker/redis_conn.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <thread>
#include "common/exceptions.hpp"

namespace codejudge::broker {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis_config &redis) {
    LOG(INFO) << "Redis: Setup connection with server " << redis.host << ":" << redis.port;
    try {
        redis_client.connect(redis.host, redis.port,
                             [](const std::string &host, std::size_t port,
                                cpp_redis::connect_state status) {
                                 if (status == cpp_redis::connect_state::dropped) {
                                     LOG(INFO) << "Redis: client disconnected from " << host
                                               << ":" << port;
                                 }
                             });
    } catch (cpp_redis::redis_error &ex) {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis.host << ":" << redis.port << ", " << ex.what();
        return false;
    }
    if (!redis.password.empty()) {
        LOG(INFO) << "Redis: Trying to Auth";
        auto future = redis_client.auth(redis.password);
        redis_client.sync_commit();
        LOG(INFO) << "Redis: Auth Reply: " << future.get();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << redis.host << ":" << redis.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis.host << ":" << redis.port;
        return false;
    }
}

redis_conn::redis_conn(const redis_config &config) : redis(config) {}

const redis_config &redis_conn::config() const {
    return redis;
}

void redis_conn::reconnect(bool force) {
    scoped_lock guard(mut);
    reconnect_nolock(force);
}

void redis_conn::reconnect_nolock(bool force) {
    unsigned fail = 0;
    if (force) {
        if (redis_client.is_connected()) redis_client.disconnect(true);
        connect_to_server(redis_client, redis);
    }
    for (; !redis_client.is_connected() && fail < redis.max_retries; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(redis.retry_interval));
        connect_to_server(redis_client, redis);
    }
    if (!redis_client.is_connected()) {
        BOOST_THROW_EXCEPTION(broker_error("unable to connect to redis server " + redis.host + ":" + std::to_string(redis.port)));
    }
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback, bool idempotent) {
    scoped_lock guard(mut);
    // cpp_redis 的 is_connected 似乎有问题，最后执行操作时的 reply 仍然是 network error
    // 因此这里也做个强制重连。
    reconnect_nolock(false);  // 先弱重连一次
    string message;
    unsigned attempts = idempotent ? redis.max_retries : 1;
    for (unsigned fail = 0; fail < attempts; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> futures;
        callback(redis_client, futures);
        DLOG(INFO) << "Syncing operations to server";
        redis_client.sync_commit();
        DLOG(INFO) << "Synced operations to server";
        vector<cpp_redis::reply> replies;
        for (auto &future : futures) {  // 阻塞到所有操作完成为止
            cpp_redis::reply r = future.get();
            // 如果有操作失败，则标记重试并保存错误信息
            if (r.is_error()) reconn = true, message = r.error();
            replies.push_back(move(r));
        }
        if (!reconn) return replies;
        if (fail + 1 < attempts) reconnect_nolock(true);  // 操作失败，强制重连
    }
    // 失败次数过多，取消操作
    BOOST_THROW_EXCEPTION(broker_error("Redis: unable to finish execution: " + message));
}

}  // namespace codejudge::broker
