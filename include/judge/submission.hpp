#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"

/**
 * 这个头文件包含提交记录
 * 包含：
 * 1. submission 类（数据库中的一条提交记录）
 * 2. new_submission 类（创建提交的请求）
 * 3. submission_edit 类（修改排队中提交的请求）
 * 4. submission_outcome 类（提交执行结束后写回的结果）
 */
namespace codejudge {

/**
 * @brief 一个代码提交，由数据库持久化
 * 只有认领了该提交的 worker 才会修改它，输出字段只在提交离开 Queued 状态后才会被填充
 */
struct submission {
    long long id = 0;

    std::string source_code;

    int language_id = 0;

    std::optional<std::string> stdin_text;

    /**
     * @brief 期望的标准输出，存在时执行成功的提交还需要比对输出
     */
    std::optional<std::string> expected_output;

    /**
     * @brief 时间限制（单位为秒）
     */
    int time_limit = 0;

    /**
     * @brief 内存限制（单位为 MB）
     */
    int memory_limit = 0;

    codejudge::status status = codejudge::status::QUEUED;

    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    std::optional<std::string> compile_output;

    std::optional<int> exit_code;
    std::optional<int> signal;

    /**
     * @brief 时钟时间和 CPU 时间（单位为秒）
     */
    std::optional<double> wall_time;
    std::optional<double> cpu_time;

    std::optional<long long> memory_peak_kb;

    std::optional<std::string> error_message;

    /**
     * @brief 执行信息，比如执行该提交的 worker id
     */
    std::optional<nlohmann::json> execution_metadata;

    std::chrono::system_clock::time_point created_at;

    /**
     * @brief 被认领的时间，最多设置一次
     */
    std::optional<std::chrono::system_clock::time_point> started_at;

    /**
     * @brief 进入终止状态的时间，最多设置一次
     */
    std::optional<std::chrono::system_clock::time_point> finished_at;
};

void to_json(nlohmann::json &j, const submission &submit);

/**
 * @brief 创建提交的请求
 * 时间和内存限制为空时使用系统默认值
 */
struct new_submission {
    std::string source_code;

    int language_id = 0;

    std::optional<std::string> stdin_text;

    std::optional<std::string> expected_output;

    std::optional<int> time_limit;

    std::optional<int> memory_limit;
};

void from_json(const nlohmann::json &j, new_submission &request);

/**
 * @brief 修改排队中提交的请求，为空的字段不修改
 */
struct submission_edit {
    std::optional<std::string> stdin_text;
    std::optional<std::string> expected_output;
    std::optional<int> time_limit;
    std::optional<int> memory_limit;
};

void from_json(const nlohmann::json &j, submission_edit &edit);

/**
 * @brief 提交进入终止状态时写回数据库的结果
 */
struct submission_outcome {
    codejudge::status status = codejudge::status::INTERNAL_ERROR;

    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;
    std::optional<std::string> compile_output;
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::optional<double> wall_time;
    std::optional<double> cpu_time;
    std::optional<long long> memory_peak_kb;
    std::optional<std::string> error_message;
    std::optional<nlohmann::json> execution_metadata;
};

}  // namespace codejudge
