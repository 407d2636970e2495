#pragma once

#include "broker/broker.hpp"
#include "broker/redis_conn.hpp"

namespace codejudge::broker {

/**
 * @brief 基于 Redis 的持久化队列
 *
 * 键的组织结构（prefix 默认为 codejudge）：
 * prefix:submissions:priority:<p>  优先级 p 的队列（LIST，LPUSH 入队，RPOP 出队）
 * prefix:submissions:all           观测用的任务 id 索引（LIST，只保留最近的若干条）
 * prefix:worker:<worker_id>        worker 心跳（STRING，JSON，带过期时间）
 * prefix:workers                   所有注册过心跳的 worker id（SET）
 *
 * Redis 单线程执行命令，因此 RPOP 是原子的，多个 worker 不会拿到同一个任务。
 */
struct redis_broker : public broker {
    redis_broker(const redis_config &redis, const limits_config &limits, const worker_config &worker);

    std::string enqueue(long long submission_id, int priority) override;

    std::optional<job_envelope> dequeue() override;

    std::size_t queue_depth(int priority) override;

    std::size_t total_depth() override;

    std::size_t clear_all() override;

    void register_worker_heartbeat(const std::string &worker_id, worker_phase phase, const nlohmann::json &metadata) override;

    void deregister_worker(const std::string &worker_id) override;

    std::size_t live_worker_count() override;

    std::vector<worker_descriptor> list_workers() override;

    void publish_event(const std::string &type, const nlohmann::json &payload) noexcept override;

    std::unique_ptr<subscription> subscribe(event_callback callback) override;

    bool ping() override;

private:
    std::string partition_key(int priority) const;
    std::string job_index_key() const;
    std::string worker_key(const std::string &worker_id) const;
    std::string workers_key() const;

    redis_conn conn;
};

}  // namespace codejudge::broker
