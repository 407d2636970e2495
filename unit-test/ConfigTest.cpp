#include <filesystem>
#include <fstream>
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace codejudge;

static filesystem::path write_config(const string &name, const string &content) {
    filesystem::path path = filesystem::temp_directory_path() / name;
    ofstream fout(path);
    fout << content;
    return path;
}

TEST(ConfigTest, Defaults) {
    system_config config;
    EXPECT_EQ(config.redis.host, "127.0.0.1");
    EXPECT_EQ(config.redis.port, 6379);
    EXPECT_EQ(config.redis.channel, "codejudge:events");
    EXPECT_EQ(config.sandbox.binary.string(), "/usr/local/bin/rustbox");
    EXPECT_EQ(config.sandbox.timeout_grace, 10u);
    EXPECT_EQ(config.worker.concurrency, 4u);
    EXPECT_EQ(config.worker.heartbeat_ttl, 300u);
    EXPECT_EQ(config.worker.active_window, 120u);
    EXPECT_EQ(config.worker.heartbeat_interval, 40000u);
    EXPECT_EQ(config.limits.default_time_limit, 10);
    EXPECT_EQ(config.limits.max_memory_limit, 2048);
    EXPECT_EQ(config.limits.max_priority, 9);
}

TEST(ConfigTest, LoadOverridesGivenKeys) {
    auto path = write_config("codejudge-config-test.json", R"({
        "redis": {"host": "redis.internal", "prefix": "staging", "jobIndexSize": 50},
        "database": {"user": "judge", "password": "secret"},
        "sandbox": {"binary": "/opt/rustbox/bin/rustbox", "timeoutGrace": 3},
        "worker": {"concurrency": 8, "idleInterval": 250},
        "limits": {"maxTimeLimit": 20, "maxPriority": 3}
    })");

    system_config config = load_config(path);
    EXPECT_EQ(config.redis.host, "redis.internal");
    EXPECT_EQ(config.redis.port, 6379);
    EXPECT_EQ(config.redis.prefix, "staging");
    EXPECT_EQ(config.redis.job_index_size, 50u);
    EXPECT_EQ(config.database.user, "judge");
    EXPECT_EQ(config.database.database, "codejudge");
    EXPECT_EQ(config.sandbox.binary.string(), "/opt/rustbox/bin/rustbox");
    EXPECT_EQ(config.sandbox.timeout_grace, 3u);
    EXPECT_EQ(config.sandbox.default_timeout, 30u);
    EXPECT_EQ(config.worker.concurrency, 8u);
    EXPECT_EQ(config.worker.idle_interval, 250u);
    EXPECT_EQ(config.worker.error_backoff, 5000u);
    EXPECT_EQ(config.limits.max_time_limit, 20);
    EXPECT_EQ(config.limits.max_priority, 3);
    EXPECT_EQ(config.limits.default_memory_limit, 512);
}

TEST(ConfigTest, MissingFile) {
    EXPECT_THROW(load_config("/nonexistent/codejudge.json"), runtime_error);
}

TEST(ConfigTest, RejectsInconsistentWorkerWindows) {
    auto path = write_config("codejudge-config-window.json",
                             R"({"worker": {"heartbeatTTL": 60, "activeWindow": 120}})");
    EXPECT_THROW(load_config(path), invalid_argument);
}

TEST(ConfigTest, HeartbeatIntervalFollowsActiveWindow) {
    auto path = write_config("codejudge-config-interval.json", R"({"worker": {"activeWindow": 30}})");
    EXPECT_EQ(load_config(path).worker.heartbeat_interval, 10000u);

    path = write_config("codejudge-config-interval.json", R"({"worker": {"heartbeatInterval": 500}})");
    EXPECT_EQ(load_config(path).worker.heartbeat_interval, 500u);

    path = write_config("codejudge-config-interval.json", R"({"worker": {"activeWindow": 30, "heartbeatInterval": 30000}})");
    EXPECT_THROW(load_config(path), invalid_argument);
}

TEST(ConfigTest, RejectsZeroConcurrency) {
    auto path = write_config("codejudge-config-concurrency.json", R"({"worker": {"concurrency": 0}})");
    EXPECT_THROW(load_config(path), invalid_argument);
}
