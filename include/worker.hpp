#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "broker/broker.hpp"
#include "config.hpp"
#include "judge/lifecycle.hpp"
#include "sandbox/sandbox.hpp"
#include "store/submission_store.hpp"

/**
 * 评测 worker 相关函数
 *
 * 一个 worker 进程运行一个 dispatcher，dispatcher 在主线程中不断从队列中拉取任务，
 * 拉到任务后交给线程池执行，然后立刻继续拉取。线程池满时拉取循环阻塞，直到有任务执行完成。
 * 队列为空时等待 idle_interval 再拉取。
 * 另有一个心跳线程每隔 heartbeat_interval 刷新一次心跳，空闲或者线程池已满时 worker 也不会退出存活统计。
 *
 * 多个 worker 进程可以共用一个队列和数据库，队列的原子出队保证同一个任务只会被一个 worker 拿到，
 * 数据库的条件更新保证同一个提交只会被认领一次。
 */
namespace codejudge {

/**
 * @brief 生成 worker id，比如 worker-3f2b6c1e
 */
std::string make_worker_id();

struct dispatcher {
    dispatcher(std::string worker_id, broker::broker &job_queue, sandbox::sandbox_adapter &adapter,
               store::submission_store &submissions, const worker_config &config);

    /**
     * @brief 运行拉取循环，阻塞直到 stop 被调用
     * 单次拉取出错时等待 error_backoff 后继续，不会退出循环。
     * 退出前等待已经交给线程池的任务执行完成，然后注销心跳。
     */
    void run();

    /**
     * @brief 请求停止拉取循环，可以在信号处理函数中调用
     */
    void stop() noexcept;

    bool stopping() const noexcept;

    /**
     * @brief 执行一个任务：认领提交、调用沙箱、写回结果
     * 任何异常都会使提交被强制转为 Internal Error。
     * 执行结束后，如果没有其他任务在执行，心跳恢复为 idle，否则继续报告另一个正在执行的任务。
     * 这个函数不会抛出异常。
     */
    void handle_job(const broker::job_envelope &job) noexcept;

    const std::string &id() const;

private:
    void execute_submission(const broker::job_envelope &job);

    /**
     * @brief 更新心跳，失败时只记录日志
     */
    void heartbeat(broker::worker_phase phase, const nlohmann::json &metadata) noexcept;

    /**
     * @brief 按当前正在执行的任务上报心跳
     * 有任务在执行时为 running，附带最近开始的任务，否则为 idle。总是带上启动信息。
     */
    void report_heartbeat() noexcept;

    void begin_job(const broker::job_envelope &job) noexcept;

    void end_job(const broker::job_envelope &job) noexcept;

    /**
     * @brief 等待 duration，期间如果 stop 被调用则提前返回
     */
    void sleep_unless_stopped(std::chrono::milliseconds duration);

    std::string worker_id;
    broker::broker &job_queue;
    sandbox::sandbox_adapter &adapter;
    store::submission_store &submissions;
    submission_lifecycle lifecycle;
    worker_config config;
    std::atomic<bool> stop_requested{false};

    /**
     * @brief 保护 start_metadata 和 running_jobs，上报心跳时也持有，保证后写入的心跳反映最新状态
     */
    std::mutex heartbeat_mut;
    nlohmann::json start_metadata;
    std::vector<broker::job_envelope> running_jobs;
};

}  // namespace codejudge
