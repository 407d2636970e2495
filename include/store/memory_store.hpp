#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include "store/submission_store.hpp"

namespace codejudge::store {

/**
 * @brief 进程内的提交存储，用于单机运行和测试
 * 与 mysql_store 拥有相同的条件更新语义
 */
struct memory_store : public submission_store {
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    explicit memory_store(clock_type clock = std::chrono::system_clock::now);

    submission create(const submission &draft) override;

    std::optional<submission> find(long long id) override;

    bool try_claim(long long id) override;

    bool complete(long long id, const submission_outcome &outcome) override;

    bool force_internal_error(long long id, const std::string &error_message) override;

    bool update_if_queued(long long id, const submission_edit &edit) override;

    std::map<codejudge::status, std::size_t> count_by_status() override;

    /**
     * @brief 删除提交，模拟提交在出队和认领之间被外部删除
     */
    bool remove(long long id);

private:
    std::mutex mut;
    clock_type clock;
    long long next_id = 1;
    std::map<long long, submission> submissions;
};

}  // namespace codejudge::store
