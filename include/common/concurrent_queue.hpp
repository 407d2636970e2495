#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace codejudge {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列满时 push 阻塞直到有空位为止，队列空时 pop 阻塞直到有元素或者队列被关闭。
 * 关闭后的队列不再接受新元素，但已有元素仍然可以被取出。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(std::size_t capacity) : capacity(capacity) {}

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素为止
     * @param element 保存弹出的队头元素
     * @return 若队列已关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        not_empty.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        mlock.unlock();
        not_full.notify_one();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素，队列满时阻塞
     * @return 若队列已经关闭，元素不会被插入，返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        not_full.wait(mlock, [this] { return q.size() < capacity || closed; });
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        not_empty.notify_one();
        return true;
    }

    void close() {
        {
            std::scoped_lock lock(mut);
            closed = true;
        }
        not_empty.notify_all();
        not_full.notify_all();
    }

private:
    std::size_t capacity;
    bool closed = false;
    std::queue<T> q;
    mutable std::mutex mut;
    std::condition_variable not_empty, not_full;
};

}  // namespace codejudge
