#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace codejudge {

/**
 * redis 的登录情况
 */
struct redis_config {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "127.0.0.1";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 连接失败后至多重试的次数，超过后抛出 broker_error
     */
    unsigned max_retries = 5;

    /**
     * @brief 所有键的前缀，允许多套流水线共用一个 redis 实例
     */
    std::string prefix = "codejudge";

    /**
     * @brief 发布事件的通道名，监控程序可以通过 subscribe 来监听流水线的事件
     */
    std::string channel = "codejudge:events";

    /**
     * @brief 观测用的任务 id 索引最多保留的条数
     */
    std::size_t job_index_size = 1000;
};

void from_json(const nlohmann::json &j, redis_config &config);

/**
 * @brief 描述一个 MySQL 数据库连接信息
 */
struct database_config {
    /**
     * @brief 数据库服务器的地址
     */
    std::string host = "127.0.0.1";

    unsigned port = 3306;

    /**
     * @brief 数据库服务器的账号
     */
    std::string user = "codejudge";

    /**
     * @brief 数据库服务器的密码
     */
    std::string password;

    /**
     * @brief 使用连接到的数据库服务器的哪一个数据库
     */
    std::string database = "codejudge";
};

void from_json(const nlohmann::json &j, database_config &config);

/**
 * @brief 沙箱程序的调用配置
 */
struct sandbox_config {
    /**
     * @brief 沙箱可执行文件路径
     */
    std::filesystem::path binary = "/usr/local/bin/rustbox";

    /**
     * @brief 沙箱的工作目录
     */
    std::filesystem::path work_dir = "/tmp/rustbox";

    /**
     * @brief 提交没有时间限制时，调用沙箱的时钟时间限制（单位为秒）
     */
    unsigned default_timeout = 30;

    /**
     * @brief 探测沙箱是否可用时的时钟时间限制（单位为秒）
     */
    unsigned probe_timeout = 5;

    /**
     * @brief 调用沙箱的时钟时间限制比提交的时间限制多出的秒数
     */
    unsigned timeout_grace = 10;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

struct worker_config {
    /**
     * @brief 同时执行的任务数上限
     */
    std::size_t concurrency = 4;

    /**
     * @brief 队列为空时等待多久再拉取（单位为毫秒）
     */
    unsigned idle_interval = 1000;

    /**
     * @brief 拉取循环出错后等待多久再继续（单位为毫秒）
     */
    unsigned error_backoff = 5000;

    /**
     * @brief worker 心跳的过期时间（单位为秒），过期后心跳会被 redis 删除
     */
    unsigned heartbeat_ttl = 300;

    /**
     * @brief 统计存活 worker 时使用的时间窗口（单位为秒）
     * 比 heartbeat_ttl 更严格，卡住的 worker 会先于被删除前退出统计
     */
    unsigned active_window = 120;

    /**
     * @brief 刷新心跳的间隔（单位为毫秒），必须小于 active_window
     * 空闲和线程池已满时也按这个间隔刷新，配置文件未指定时取 active_window 的三分之一
     */
    unsigned heartbeat_interval = 40000;
};

void from_json(const nlohmann::json &j, worker_config &config);

/**
 * @brief 提交的资源限制
 */
struct limits_config {
    /**
     * @brief 提交未指定时使用的时间限制（单位为秒）
     */
    int default_time_limit = 10;

    /**
     * @brief 提交未指定时使用的内存限制（单位为 MB）
     */
    int default_memory_limit = 512;

    int max_time_limit = 60;

    int max_memory_limit = 2048;

    /**
     * @brief 队列优先级的最大值，合法的优先级为 [0, max_priority]
     * 0 为基准队列，总是最后被检查
     */
    int max_priority = 9;
};

void from_json(const nlohmann::json &j, limits_config &config);

struct system_config {
    redis_config redis;
    database_config database;
    sandbox_config sandbox;
    worker_config worker;
    limits_config limits;
};

void from_json(const nlohmann::json &j, system_config &config);

/**
 * @brief 读取 JSON 配置文件
 * 配置文件中未出现的键使用默认值
 * @param config_path 配置文件路径
 * @throw std::runtime_error 如果配置文件不存在
 * @throw nlohmann::json::exception 如果配置文件格式不正确
 */
system_config load_config(const std::filesystem::path &config_path);

}  // namespace codejudge
