#include "config.hpp"
#include "common/io_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

template <typename T>
static void assign_optional(const json &j, const char *key, T &value) {
    if (j.count(key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

void from_json(const json &j, redis_config &config) {
    assign_optional(j, "host", config.host);
    assign_optional(j, "port", config.port);
    assign_optional(j, "password", config.password);
    assign_optional(j, "retryInterval", config.retry_interval);
    assign_optional(j, "maxRetries", config.max_retries);
    assign_optional(j, "prefix", config.prefix);
    assign_optional(j, "channel", config.channel);
    assign_optional(j, "jobIndexSize", config.job_index_size);
}

void from_json(const json &j, database_config &config) {
    assign_optional(j, "host", config.host);
    assign_optional(j, "port", config.port);
    assign_optional(j, "user", config.user);
    assign_optional(j, "password", config.password);
    assign_optional(j, "database", config.database);
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("binary")) config.binary = j.at("binary").get<string>();
    if (j.count("workDir")) config.work_dir = j.at("workDir").get<string>();
    assign_optional(j, "defaultTimeout", config.default_timeout);
    assign_optional(j, "probeTimeout", config.probe_timeout);
    assign_optional(j, "timeoutGrace", config.timeout_grace);
}

void from_json(const json &j, worker_config &config) {
    assign_optional(j, "concurrency", config.concurrency);
    assign_optional(j, "idleInterval", config.idle_interval);
    assign_optional(j, "errorBackoff", config.error_backoff);
    assign_optional(j, "heartbeatTTL", config.heartbeat_ttl);
    assign_optional(j, "activeWindow", config.active_window);
    if (j.count("heartbeatInterval"))
        assign_optional(j, "heartbeatInterval", config.heartbeat_interval);
    else
        config.heartbeat_interval = config.active_window * 1000 / 3;
    if (config.concurrency == 0)
        throw invalid_argument("worker.concurrency must be positive");
    if (config.active_window > config.heartbeat_ttl)
        throw invalid_argument("worker.activeWindow must not exceed worker.heartbeatTTL");
    if (config.heartbeat_interval == 0 || config.heartbeat_interval >= config.active_window * 1000ULL)
        throw invalid_argument("worker.heartbeatInterval must be positive and shorter than worker.activeWindow");
}

void from_json(const json &j, limits_config &config) {
    assign_optional(j, "defaultTimeLimit", config.default_time_limit);
    assign_optional(j, "defaultMemoryLimit", config.default_memory_limit);
    assign_optional(j, "maxTimeLimit", config.max_time_limit);
    assign_optional(j, "maxMemoryLimit", config.max_memory_limit);
    assign_optional(j, "maxPriority", config.max_priority);
    if (config.max_priority < 0)
        throw invalid_argument("limits.maxPriority must not be negative");
}

void from_json(const json &j, system_config &config) {
    assign_optional(j, "redis", config.redis);
    assign_optional(j, "database", config.database);
    assign_optional(j, "sandbox", config.sandbox);
    assign_optional(j, "worker", config.worker);
    assign_optional(j, "limits", config.limits);
}

system_config load_config(const filesystem::path &config_path) {
    if (!filesystem::exists(config_path))
        throw runtime_error("Unable to find configuration file " + config_path.string());
    system_config config;
    json::parse(read_file_content(config_path)).get_to(config);
    return config;
}

}  // namespace codejudge
