#pragma once

#include <map>
#include <optional>
#include <string>
#include "judge/submission.hpp"

namespace codejudge::store {

/**
 * @brief 提交记录的持久化存储
 *
 * 状态转换全部通过条件更新完成：只有当前状态满足条件时才会修改，
 * 返回值表示是否真的修改了记录。多个 worker 或者重试导致的重复写入会返回 false，
 * 而不会覆盖已有的结果。
 *
 * 存储不可用时抛出 database_error。
 */
struct submission_store {
    virtual ~submission_store();

    /**
     * @brief 创建一条 Queued 状态的提交记录
     * @param draft 新提交的内容，id、状态和时间戳会被忽略
     * @return 创建后的完整记录
     */
    virtual submission create(const submission &draft) = 0;

    /**
     * @return 提交记录，不存在时返回空
     */
    virtual std::optional<submission> find(long long id) = 0;

    /**
     * @brief 认领提交：仅当提交仍为 Queued 时转为 Processing，并记录开始时间
     * @return 是否认领成功
     */
    virtual bool try_claim(long long id) = 0;

    /**
     * @brief 写入执行结果：仅当提交为 Processing 时转为 outcome.status，并记录结束时间
     * @return 是否写入成功
     */
    virtual bool complete(long long id, const submission_outcome &outcome) = 0;

    /**
     * @brief 强制转为 Internal Error：仅当提交尚未进入终止状态时生效
     * @return 是否写入成功
     */
    virtual bool force_internal_error(long long id, const std::string &error_message) = 0;

    /**
     * @brief 修改提交的输入、期望输出或者资源限制，仅当提交仍为 Queued 时生效
     * @return 是否修改成功
     */
    virtual bool update_if_queued(long long id, const submission_edit &edit) = 0;

    /**
     * @brief 统计各个状态的提交数，没有提交的状态不出现在结果中
     */
    virtual std::map<codejudge::status, std::size_t> count_by_status() = 0;
};

}  // namespace codejudge::store
