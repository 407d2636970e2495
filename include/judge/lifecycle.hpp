#pragma once

#include <string>
#include "judge/submission.hpp"
#include "store/submission_store.hpp"

namespace codejudge {

/**
 * @brief 检查状态转换是否合法
 * Queued -> Processing 为认领，Processing -> 终止状态为写入结果，
 * Queued/Processing -> Internal Error 为强制失败。终止状态不能再转换。
 */
bool can_transition(status from, status to);

/**
 * @brief 提交的状态机
 *
 * 所有状态转换都委托给存储的条件更新完成，这里负责检查转换的合法性并记录日志。
 * 返回 false 表示提交不存在或者当前状态不允许该转换，这不是错误：
 * 比如同一个任务被投递了两次，第二次认领就会失败。
 */
struct submission_lifecycle {
    explicit submission_lifecycle(store::submission_store &store);

    /**
     * @brief 认领提交，Queued -> Processing
     */
    bool claim(long long submission_id);

    /**
     * @brief 写入执行结果，Processing -> outcome.status
     * @throw internal_error 如果 outcome.status 不是终止状态
     */
    bool finish(long long submission_id, const submission_outcome &outcome);

    /**
     * @brief 强制转为 Internal Error
     * @param error_message 错误信息，为空时使用默认信息
     */
    bool fail(long long submission_id, const std::string &error_message);

    /**
     * @brief 修改排队中的提交，提交离开 Queued 之后拒绝修改
     */
    bool edit(long long submission_id, const submission_edit &edit);

private:
    store::submission_store &store;
};

}  // namespace codejudge
