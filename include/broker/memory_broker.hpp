#pragma once

#include <deque>
#include <map>
#include <mutex>
#include "broker/broker.hpp"

namespace codejudge::broker {

/**
 * @brief 进程内的队列实现
 * 用于单机运行（比如立即执行模式）以及测试。
 * 所有操作都由一个互斥锁保护，因此出队天然是原子的。
 */
struct memory_broker : public broker {
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param clock 获取当前时间的函数，测试时可以替换来模拟心跳过期
     * @param job_index_size 观测索引最多保留的任务 id 数
     */
    memory_broker(const limits_config &limits, const worker_config &worker, clock_type clock = std::chrono::system_clock::now,
                  std::size_t job_index_size = redis_config().job_index_size);

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

    /**
     * @brief 观测索引中记录的任务 id，按入队顺序排列
     */
    std::vector<std::string> job_index();

private:
    struct memory_subscription;

    /**
     * @brief 清除超过 heartbeat_ttl 的心跳，调用者必须持有 mut
     */
    void purge_expired(std::chrono::system_clock::time_point now);

    void unsubscribe(std::size_t id);

    clock_type clock;

    std::size_t job_index_size;

    std::mutex mut;

    /**
     * @brief 优先级到队列的映射，队头在 front
     */
    std::map<int, std::deque<job_envelope>> partitions;

    std::deque<std::string> jobs;

    std::map<std::string, worker_descriptor> workers;

    std::mutex subscribers_mut;
    std::size_t next_subscriber = 0;
    std::map<std::size_t, event_callback> subscribers;
};

}  // namespace codejudge::broker
