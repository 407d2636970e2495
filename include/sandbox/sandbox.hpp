#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "config.hpp"
#include "judge/language.hpp"
#include "sandbox/process_runner.hpp"

namespace codejudge::sandbox {

/**
 * @brief 一次代码执行请求
 */
struct execution_request {
    std::string source_code;

    int language_id = 0;

    /**
     * @brief 喂给程序的标准输入，为空时不传
     */
    std::optional<std::string> stdin_text;

    /**
     * @brief 时间限制（单位为秒），为空时由沙箱决定
     */
    std::optional<int> time_limit;

    /**
     * @brief 内存限制（单位为 MB），为空时由沙箱决定
     */
    std::optional<int> memory_limit;
};

/**
 * @brief 沙箱的执行结果，已经翻译为流水线的状态
 */
struct execution_result {
    codejudge::status status = codejudge::status::INTERNAL_ERROR;

    std::optional<int> exit_code;

    std::optional<std::string> stdout_text;

    std::optional<std::string> stderr_text;

    /**
     * @brief 时钟时间（单位为秒）
     */
    std::optional<double> wall_time;

    /**
     * @brief CPU 时间（单位为秒）
     */
    std::optional<double> cpu_time;

    std::optional<long long> memory_peak_kb;

    std::optional<int> signal;

    std::optional<std::string> error_message;

    /**
     * @brief 执行是否成功
     * 只有状态为 Accepted 且沙箱报告的返回码为 0 时才为真，两者必须同时检查
     */
    bool success = false;

    /**
     * @brief 执行所用的语言名，比如 "Python"
     */
    std::optional<std::string> language;
};

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 沙箱的健康信息
 */
struct sandbox_info {
    bool available = false;
    std::filesystem::path binary_path;
    std::filesystem::path work_dir;
    bool binary_exists = false;
    bool work_dir_writable = false;
};

void to_json(nlohmann::json &j, const sandbox_info &info);

struct self_test_result {
    bool test_passed = false;
    std::optional<execution_result> result;
    std::optional<std::string> error;
    bool available = false;
};

void to_json(nlohmann::json &j, const self_test_result &result);

/**
 * @brief 沙箱程序的同步适配器
 *
 * 调用协议：
 * <binary> execute-code --box-id <n> --language <lang> --code <source>
 *          [--time <s>] [--mem <mb>] [--stdin <text>] [--strict]
 * 沙箱程序成功时在标准输出打印一个 JSON 对象，至少包含 status, exit_code,
 * stdout, stderr, wall_time, cpu_time, memory_peak_kb, signal, error_message。
 *
 * 除了语言不存在以外，所有错误都会被翻译成 InternalError 或 TimeLimitExceeded 状态返回，
 * 不会抛出异常。
 */
struct sandbox_adapter {
    explicit sandbox_adapter(const sandbox_config &config,
                             std::unique_ptr<process_runner> runner = std::make_unique<posix_process_runner>());
    virtual ~sandbox_adapter();

    /**
     * @brief 在沙箱中执行一段代码，阻塞直到沙箱返回
     * @throw unsupported_language 如果语言表中不存在 request.language_id，此时不会启动沙箱
     */
    virtual execution_result execute(const execution_request &request);

    /**
     * @brief 以较短的时间限制调用沙箱的 --help，任何错误都视为不可用
     */
    virtual bool is_available();

    sandbox_info info();

    /**
     * @brief 执行一段输出 Hello, World! 的 Python 程序，检查沙箱是否正常工作
     */
    self_test_result self_test();

    /**
     * @brief 构造沙箱的命令行参数
     * @param box_id 沙箱实例 id，同时运行的实例必须互不相同
     */
    std::vector<std::string> build_command(const language &lang, const execution_request &request, int box_id) const;

    /**
     * @brief 将沙箱的状态名翻译为流水线的状态，无法识别的状态视为 Runtime Error (Other)
     */
    static codejudge::status map_engine_status(const std::string &engine_status);

    /**
     * @brief 解析沙箱打印的 JSON 结果
     * @throw nlohmann::json::exception 如果结果的字段类型不正确
     */
    static execution_result parse_engine_output(const nlohmann::json &output, const language &lang);

    const sandbox_config &config() const;

private:
    std::chrono::milliseconds wall_clock_limit(const execution_request &request) const;

    sandbox_config sandbox;
    std::unique_ptr<process_runner> runner;
};

}  // namespace codejudge::sandbox
