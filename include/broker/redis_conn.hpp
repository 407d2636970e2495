#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "config.hpp"

namespace codejudge::broker {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    explicit redis_conn(const redis_config &config);

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立，多个线程可以同时调用。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出 broker_error。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将 reply 放入 replies 中
     * @param idempotent 操作是否可以重复执行。比如 RPOP 不可以重复执行，
     * 失败后直接抛出异常，由调用方决定是否重试。
     * @return 所有操作的 reply，顺序与 callback 放入的顺序一致
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback,
                                          bool idempotent = true);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

    const redis_config &config() const;

private:
    void reconnect_nolock(bool force);

    redis_config redis;
    cpp_redis::client redis_client;
    std::mutex mut;
};

}  // namespace codejudge::broker
