#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_deferred_action) = ::codejudge::scoped_guard() + [&]

namespace codejudge {

/**
 * @brief 作用域结束时执行回调
 * 配合 defer 宏使用，保证即使抛出异常也会执行清理操作，比如恢复 worker 心跳。
 * 回调本身抛出的异常会被记录到日志中，不会从析构函数中传播出去。
 */
struct scoped_guard {
    std::function<void()> f;
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard operator+(const std::function<void()> &f) const;
};

}  // namespace codejudge
