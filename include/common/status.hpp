#pragma once

#include <optional>
#include <string>

namespace codejudge {

/**
 * @brief 表示提交的状态
 * 数值与外部数据库 statuses 表中的 id 一一对应，是与外部系统共享的约定，
 * 不可以随意修改已有的值。
 */
enum class status {
    /**
     * @brief 提交正在队列中等待执行
     */
    QUEUED = 1,

    /**
     * @brief 提交已经被某个 worker 认领，正在执行
     */
    PROCESSING = 2,

    /**
     * @brief 程序正常运行结束且退出码为 0
     */
    ACCEPTED = 3,

    /**
     * @brief 程序输出与期望输出不一致
     * 只有提交带有期望输出时才会产生该结果。
     */
    WRONG_ANSWER = 4,

    /**
     * @brief 程序运行时间超出限制，或者沙箱本身的调用超时
     */
    TIME_LIMIT_EXCEEDED = 5,

    COMPILATION_ERROR = 6,

    /**
     * @brief 段错误 (SIGSEGV)
     * 沙箱报告的内存超限也会被映射为该结果。
     */
    RUNTIME_ERROR_SIGSEGV = 7,

    /**
     * @brief 写文件超出大小限制 (SIGXFSZ)
     */
    RUNTIME_ERROR_SIGXFSZ = 8,

    /**
     * @brief 浮点运算错误 (SIGFPE)，一般是除零错误
     */
    RUNTIME_ERROR_SIGFPE = 9,

    RUNTIME_ERROR_SIGABRT = 10,

    /**
     * @brief 程序以非零返回值退出 (Non Zero Exit Code)
     */
    RUNTIME_ERROR_NZEC = 11,

    /**
     * @brief 其他运行时错误，沙箱返回无法识别的状态时也使用该结果
     */
    RUNTIME_ERROR_OTHER = 12,

    /**
     * @brief 评测系统内部错误
     * 比如沙箱不可用、沙箱输出无法解析、数据库写入失败等。
     */
    INTERNAL_ERROR = 13,

    EXEC_FORMAT_ERROR = 14
};

/**
 * @brief 获取状态的显示名称，比如 "In Queue"、"Runtime Error (SIGSEGV)"
 */
const char *get_display_message(status);

/**
 * @brief 终止状态不允许再发生任何转移
 * QUEUED 和 PROCESSING 以外的状态都是终止状态
 */
bool is_terminal(status);

/**
 * @brief 根据数据库中的状态 id 查找状态
 * @return 如果 id 不在状态表中则返回空
 */
std::optional<status> status_from_id(int id);

/**
 * @brief 根据显示名称查找状态
 */
std::optional<status> status_from_display_message(const std::string &message);

inline int status_id(status stat) { return static_cast<int>(stat); }

}  // namespace codejudge
