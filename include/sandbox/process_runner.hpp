#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "common/utils.hpp"

namespace codejudge::sandbox {

/**
 * @brief 负责启动外部进程并等待其结束
 * 沙箱适配器通过该接口调用沙箱程序，单元测试可以替换为假的实现
 */
struct process_runner {
    virtual ~process_runner();

    /**
     * @brief 执行外部命令，阻塞直到命令结束或者超时
     * @param argv 外部命令的路径和参数
     * @param timeout 时钟时间限制，超时后外部命令会被杀死，结果的 timed_out 为真
     * @throw std::system_error 如果无法创建进程
     */
    virtual process_output run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 通过 fork + execvp 执行外部命令
 */
struct posix_process_runner : public process_runner {
    process_output run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;
};

}  // namespace codejudge::sandbox
