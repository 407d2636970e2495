#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>
#include "broker/broker.hpp"
#include "gmock/gmock.h"
#include "sandbox/sandbox.hpp"

namespace codejudge::test {

/**
 * @brief 单元测试使用的沙箱配置，工作目录放在系统临时目录下
 */
inline sandbox_config test_sandbox_config() {
    sandbox_config config;
    config.binary = "/usr/local/bin/rustbox";
    config.work_dir = std::filesystem::temp_directory_path() / "codejudge-test";
    return config;
}

inline worker_config test_worker_config(std::size_t concurrency = 2) {
    worker_config config;
    config.concurrency = concurrency;
    config.idle_interval = 10;
    config.error_backoff = 10;
    config.heartbeat_interval = 10;
    return config;
}

struct mock_process_runner : public sandbox::process_runner {
    MOCK_METHOD2(run, process_output(const std::vector<std::string> &argv, std::chrono::milliseconds timeout));
};

/**
 * @brief 按脚本返回结果的沙箱，不启动任何进程
 * 默认每次执行都返回 Accepted，标准输出为 "ok\n"
 */
struct scripted_sandbox : public sandbox::sandbox_adapter {
    using script_type = std::function<sandbox::execution_result(const sandbox::execution_request &)>;

    scripted_sandbox() : sandbox::sandbox_adapter(test_sandbox_config()) {}

    sandbox::execution_result execute(const sandbox::execution_request &request) override {
        ++executions;
        if (script) return script(request);
        sandbox::execution_result result;
        result.status = status::ACCEPTED;
        result.exit_code = 0;
        result.stdout_text = "ok\n";
        result.stderr_text = "";
        result.wall_time = 0.01;
        result.cpu_time = 0.01;
        result.memory_peak_kb = 1024;
        result.success = true;
        result.language = "Python";
        return result;
    }

    bool is_available() override {
        return available;
    }

    script_type script;
    std::atomic<bool> available{true};
    std::atomic<int> executions{0};
};

/**
 * @brief 记录收到的所有事件
 */
struct event_recorder {
    void operator()(const broker::event &e) {
        std::scoped_lock guard(mut);
        events.push_back(e);
    }

    std::vector<std::string> types() {
        std::scoped_lock guard(mut);
        std::vector<std::string> result;
        for (auto &e : events) result.push_back(e.type);
        return result;
    }

    std::mutex mut;
    std::vector<broker::event> events;
};

/**
 * @brief 手动推进的时钟，用于模拟心跳过期
 * 可以在推进的同时被其他线程读取
 */
struct manual_clock {
    void advance(std::chrono::system_clock::duration duration) {
        std::scoped_lock guard(mut);
        now += duration;
    }

    std::function<std::chrono::system_clock::time_point()> function() {
        return [this] {
            std::scoped_lock guard(mut);
            return now;
        };
    }

private:
    std::mutex mut;
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
};

}  // namespace codejudge::test
