#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    to_string_cont<std::decay_t<const Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

namespace codejudge {

/**
 * @brief 外部命令的执行结果
 */
struct process_output {
    /**
     * @brief 外部命令的返回值，如果因为信号崩溃而没有返回码，则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止外部命令的信号，正常退出时为 0
     */
    int signal = 0;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 外部命令是否因为超出时钟时间限制而被强制杀死
     */
    bool timed_out = false;
};

/**
 * @brief 执行外部命令并收集标准输出和标准错误
 * 子进程通过 fork + execvp 创建，不经过 shell，因此参数不需要转义。
 * 超过 timeout 后子进程会被 SIGKILL 杀死，此时 timed_out 为真。
 * @param argv 外部命令的路径 (argv[0]) 和参数
 * @param timeout 时钟时间限制
 * @return 外部命令的执行结果
 * @throw std::system_error 如果创建管道或者 fork 失败
 */
process_output exec_program(const std::vector<std::string> &argv, std::chrono::milliseconds timeout);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数会自动执行类型转换
 * @code{.cpp}
 *     std::filesystem::path binary("/usr/local/bin/rustbox");
 *     auto output = call_process(std::chrono::seconds(5), binary, "--help");
 * @endcode
 */
template <typename... Args>
process_output call_process(std::chrono::milliseconds timeout, const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return exec_program(list, timeout);
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成随机 UUID 字符串，比如 "3f2b6c1e-..."
 */
std::string random_uuid();

/**
 * @brief 将时间点格式化为 ISO 8601 字符串（UTC，精确到微秒）
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/**
 * @brief 解析 format_iso8601 生成的字符串，也接受 MySQL DATETIME 的文本格式（UTC）
 * @return 格式不正确时返回空
 */
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string &text);

}  // namespace codejudge
