#pragma once

#include <mysql/mysql.h>
#include <cstddef>
#include <mutex>
#include <optional>
#include <type_traits>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"

namespace codejudge::store {

/**
 * @brief 预处理语句的参数，nullptr 表示 SQL 的 NULL
 */
using sql_value = std::variant<std::nullptr_t, long long, double, std::string>;

/**
 * @brief 查询结果的一行，NULL 列为空
 */
using sql_row = std::vector<std::optional<std::string>>;

template <typename T>
sql_value to_sql_value(const std::optional<T> &value) {
    if (!value) return nullptr;
    if constexpr (std::is_integral_v<T>)
        return (long long)*value;
    else if constexpr (std::is_floating_point_v<T>)
        return (double)*value;
    else
        return sql_value(*value);
}

/**
 * @brief 表示一个 MySQL 连接
 * 多个线程可以同时调用，调用之间互斥。连接断开时会在下一次调用前重新连接。
 * 所有错误都以 database_error 抛出。
 */
struct mysql_conn {
    explicit mysql_conn(const database_config &config);
    ~mysql_conn();

    mysql_conn(const mysql_conn &) = delete;
    mysql_conn &operator=(const mysql_conn &) = delete;

    /**
     * @brief 建立连接，已有连接时先断开
     */
    void connect();

    /**
     * @brief 检查连接是否可用
     */
    bool ping();

    /**
     * @brief 以预处理语句的方式执行 INSERT/UPDATE/DELETE
     * @param sql 带有 ? 占位符的 SQL 语句
     * @param params 按顺序绑定到占位符的参数
     * @return 受影响的行数
     */
    std::size_t execute(const std::string &sql, const std::vector<sql_value> &params = {});

    /**
     * @brief 以预处理语句的方式执行 INSERT
     * @return 新插入行的自增 id
     */
    long long insert(const std::string &sql, const std::vector<sql_value> &params);

    /**
     * @brief 执行查询并以文本形式返回所有行
     * @param sql 完整的 SQL 语句，调用方负责保证其中不含有未转义的外部输入
     */
    std::vector<sql_row> query(const std::string &sql);

private:
    struct statement_result {
        std::size_t affected_rows;
        long long insert_id;
    };

    statement_result run_statement(const std::string &sql, const std::vector<sql_value> &params);

    void connect_nolock();
    void ensure_connected_nolock();

    database_config dbcfg;
    MYSQL *con = nullptr;
    std::mutex mut;
};

}  // namespace codejudge::store
