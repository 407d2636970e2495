#pragma once

#include <string>
#include <vector>
#include "broker/broker.hpp"
#include "config.hpp"
#include "judge/lifecycle.hpp"
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"
#include "store/submission_store.hpp"

namespace codejudge {

/**
 * @brief 新创建的提交以及它在队列中的任务 id
 */
struct created_submission {
    submission record;
    std::string job_id;
};

/**
 * @brief 外部系统创建、修改、立即执行提交的入口
 *
 * 不合法的请求（语言不存在、资源限制超出系统上限、优先级不合法）在创建提交之前就会被拒绝，
 * 不会写入数据库，也不会进入队列。
 */
struct submission_service {
    submission_service(broker::broker &job_queue, sandbox::sandbox_adapter &adapter,
                       store::submission_store &submissions, const limits_config &limits);

    /**
     * @brief 检查请求并填入默认的资源限制
     * @return 可以直接交给存储创建的提交
     * @throw unsupported_language 如果语言不存在
     * @throw validation_error 如果资源限制不合法
     */
    submission prepare(const new_submission &request) const;

    /**
     * @brief 创建提交并放入 priority 对应的队列
     * @throw validation_error 如果请求或者优先级不合法
     * @throw broker_error 如果队列不可用，此时提交已经创建但是没有入队
     */
    created_submission create_submission(const new_submission &request, int priority = 0);

    /**
     * @brief 批量创建提交，所有请求都检查通过后才会开始创建
     */
    std::vector<created_submission> create_batch(const std::vector<new_submission> &requests, int priority = 0);

    /**
     * @brief 修改排队中的提交
     * @return 若提交已经离开 Queued 状态，不做修改并返回 false
     * @throw submission_not_found 如果提交不存在
     * @throw validation_error 如果资源限制不合法
     */
    bool update_submission(long long submission_id, const submission_edit &edit);

    /**
     * @brief 创建提交并立即在当前线程中执行，不经过队列
     * @return 执行结束后的提交记录
     */
    submission execute_now(const new_submission &request);

    /**
     * @brief 立即执行一个排队中的提交，不经过队列
     * 仍然通过认领来保证提交只会被执行一次
     * @throw submission_not_found 如果提交不存在
     * @throw validation_error 如果提交已经离开 Queued 状态
     * @throw internal_error 如果沙箱不可用，此时提交保持 Queued 状态
     */
    submission execute_now(long long submission_id);

    std::optional<submission> find(long long submission_id);

private:
    void check_limits(int time_limit, int memory_limit) const;
    void check_priority(int priority) const;

    broker::broker &job_queue;
    sandbox::sandbox_adapter &adapter;
    store::submission_store &submissions;
    submission_lifecycle lifecycle;
    limits_config limits;
};

}  // namespace codejudge
