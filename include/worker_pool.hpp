#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

namespace codejudge {

/**
 * @brief 固定大小的线程池
 * 线程数与交接队列的容量都等于 concurrency，正在排队和正在执行的任务总数不超过 concurrency。
 * 池满时 submit 阻塞直到有任务执行完成。
 */
struct worker_pool {
    explicit worker_pool(std::size_t concurrency);

    /**
     * @brief 等价于 shutdown()
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 提交一个任务，池满时阻塞
     * 任务抛出的异常会被记录到日志中，不会终止线程
     * @return 若线程池已经关闭，任务不会被执行，返回 false
     */
    bool submit(std::function<void()> task);

    /**
     * @brief 阻塞直到所有已提交的任务执行完成
     */
    void wait_idle();

    /**
     * @brief 关闭线程池，不再接受新任务，已提交的任务会执行完成后再返回
     */
    void shutdown();

    /**
     * @brief 正在排队和正在执行的任务数
     */
    std::size_t in_flight() const;

    std::size_t concurrency() const;

private:
    void run();

    std::size_t capacity;
    concurrent_queue<std::function<void()>> tasks;
    std::vector<std::thread> threads;

    mutable std::mutex mut;
    std::condition_variable slot_freed;
    std::size_t active = 0;
    bool stopped = false;
};

}  // namespace codejudge
