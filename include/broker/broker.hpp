#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

namespace codejudge::broker {

/**
 * @brief 队列中的任务信封
 * 入队时创建，出队时被消耗，之间不会被修改
 */
struct job_envelope {
    std::string job_id;

    long long submission_id = 0;

    /**
     * @brief 优先级，数值越大越紧急，0 为基准队列
     */
    int priority = 0;

    std::chrono::system_clock::time_point created_at;
};

void to_json(nlohmann::json &j, const job_envelope &job);
void from_json(const nlohmann::json &j, job_envelope &job);

enum class worker_phase {
    /**
     * @brief worker 正在等待任务
     */
    IDLE,

    /**
     * @brief worker 正在执行任务
     */
    RUNNING,

    STOPPED
};

const char *to_string(worker_phase phase);
worker_phase worker_phase_from_string(const std::string &phase);

/**
 * @brief worker 的心跳信息
 */
struct worker_descriptor {
    std::string worker_id;

    worker_phase phase = worker_phase::IDLE;

    std::chrono::system_clock::time_point last_seen;

    /**
     * @brief 正在执行的任务 id，只有 RUNNING 状态才有
     */
    std::optional<std::string> job_id;

    std::optional<long long> submission_id;

    /**
     * @brief 附加信息，比如并发数、启动时间
     */
    nlohmann::json metadata;
};

void to_json(nlohmann::json &j, const worker_descriptor &worker);
void from_json(const nlohmann::json &j, worker_descriptor &worker);

/**
 * @brief 事件通道中的事件
 * 事件只用于监控，不保证送达，也不保证多个订阅者之间的顺序
 */
struct event {
    std::string type;

    nlohmann::json data;

    std::chrono::system_clock::time_point timestamp;
};

void to_json(nlohmann::json &j, const event &e);
void from_json(const nlohmann::json &j, event &e);

using event_callback = std::function<void(const event &)>;

/**
 * @brief 表示一个事件订阅，析构时取消订阅
 */
struct subscription {
    virtual ~subscription();
};

/**
 * @brief 执行观测索引的更新，失败时只记录日志
 * 调用时任务已经入队，索引更新失败不能使入队失败
 * @return 索引是否更新成功
 */
bool record_job_index(const std::string &job_id, const std::function<void()> &update) noexcept;

/**
 * @brief 持久化的按优先级分区的任务队列
 * 同时负责记录 worker 心跳和发布监控事件。
 *
 * 出队操作必须是原子的：多个 worker 并发出队同一个任务时，只有一个 worker 能拿到，
 * 这是防止同一个提交被重复认领的唯一机制（数据库的条件更新是第二道防线）。
 *
 * 除 publish_event 外，所有操作在队列服务不可用时抛出 broker_error，调用方可以重试。
 */
struct broker {
    broker(const limits_config &limits, const worker_config &worker);
    virtual ~broker();

    /**
     * @brief 将提交加入 priority 对应队列的队尾
     * 同时将任务 id 记录到观测索引中，两个操作之间不保证原子性，索引更新失败不会使入队失败
     * @param submission_id 提交 id
     * @param priority 优先级，必须在 [0, max_priority] 内
     * @return 新任务的 id
     * @throw validation_error 如果优先级不合法
     */
    virtual std::string enqueue(long long submission_id, int priority) = 0;

    /**
     * @brief 从最高优先级开始扫描，弹出第一个非空队列的队头任务
     * 同一优先级内严格先进先出。高优先级队列一直非空时低优先级队列会饿死，
     * 这是预期的行为。
     * @return 所有队列都为空时返回空
     */
    virtual std::optional<job_envelope> dequeue() = 0;

    /**
     * @brief priority 对应队列中等待的任务数
     */
    virtual std::size_t queue_depth(int priority) = 0;

    /**
     * @brief 所有队列中等待的任务总数
     */
    virtual std::size_t total_depth() = 0;

    /**
     * @brief 清空所有队列，只供运维工具使用
     * @return 被删除的任务数
     */
    virtual std::size_t clear_all() = 0;

    /**
     * @brief 更新 worker 的心跳
     * 心跳在 heartbeat_ttl 之后自动过期，与 worker 是否显式注销无关
     * @param metadata 附加信息，如果包含 job_id 和 submission_id 则视为正在执行的任务
     */
    virtual void register_worker_heartbeat(const std::string &worker_id, worker_phase phase, const nlohmann::json &metadata) = 0;

    virtual void deregister_worker(const std::string &worker_id) = 0;

    /**
     * @brief 统计 active_window 内有心跳的 worker 数
     * active_window 比 heartbeat_ttl 更严格，卡住的 worker 会在被清除前退出统计
     */
    virtual std::size_t live_worker_count() = 0;

    /**
     * @brief 所有尚未过期的 worker 心跳
     */
    virtual std::vector<worker_descriptor> list_workers() = 0;

    /**
     * @brief 发布事件，失败时只记录日志，不抛出异常
     */
    virtual void publish_event(const std::string &type, const nlohmann::json &payload) noexcept = 0;

    /**
     * @brief 订阅事件
     * @param callback 收到事件时调用，可能在其他线程中调用
     * @return 订阅句柄，析构时取消订阅
     */
    virtual std::unique_ptr<subscription> subscribe(event_callback callback) = 0;

    /**
     * @brief 检查队列服务是否可用
     */
    virtual bool ping() = 0;

    int max_priority() const;

protected:
    /**
     * @throw validation_error 如果优先级不在 [0, max_priority] 内
     */
    void check_priority(int priority) const;

    job_envelope make_envelope(long long submission_id, int priority, std::chrono::system_clock::time_point now) const;

    worker_descriptor make_descriptor(const std::string &worker_id, worker_phase phase, const nlohmann::json &metadata,
                                      std::chrono::system_clock::time_point now) const;

    bool is_active(const worker_descriptor &worker, std::chrono::system_clock::time_point now) const;

    bool is_expired(const worker_descriptor &worker, std::chrono::system_clock::time_point now) const;

    limits_config limits;
    worker_config worker;
};

}  // namespace codejudge::broker
