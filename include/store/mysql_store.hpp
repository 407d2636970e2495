#pragma once

#include "store/mysql_conn.hpp"
#include "store/submission_store.hpp"

namespace codejudge::store {

/**
 * @brief 基于 MySQL 的提交存储
 *
 * 提交保存在 submissions 表中，状态转换使用带条件的 UPDATE，
 * 比如认领提交：
 *   UPDATE submissions SET status_id = 2, started_at = NOW(6) WHERE id = ? AND status_id = 1
 * 受影响行数为 1 时认领成功。即使两个 worker 拿到了同一个任务，也只有一个能认领成功。
 */
struct mysql_store : public submission_store {
    explicit mysql_store(const database_config &config);

    /**
     * @brief 创建 statuses 表和 submissions 表（如果不存在），并写入状态名
     */
    void ensure_schema();

    bool ping();

    submission create(const submission &draft) override;

    std::optional<submission> find(long long id) override;

    bool try_claim(long long id) override;

    bool complete(long long id, const submission_outcome &outcome) override;

    bool force_internal_error(long long id, const std::string &error_message) override;

    bool update_if_queued(long long id, const submission_edit &edit) override;

    std::map<codejudge::status, std::size_t> count_by_status() override;

private:
    mysql_conn db;
};

}  // namespace codejudge::store
