#include "sandbox/sandbox.hpp"
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <map>
#include <random>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace codejudge::sandbox {
using namespace std;
using namespace nlohmann;

// 沙箱的状态名到流水线状态的翻译表，同时接受沙箱内部枚举的写法
// clang-format off
static const map<string, status> engine_status_table = boost::assign::map_list_of
    ("TLE", status::TIME_LIMIT_EXCEEDED)
    ("TimeLimit", status::TIME_LIMIT_EXCEEDED)
    ("Memory Limit Exceeded", status::RUNTIME_ERROR_SIGSEGV)
    ("MemoryLimit", status::RUNTIME_ERROR_SIGSEGV)
    ("Success", status::ACCEPTED)
    ("Runtime Error", status::RUNTIME_ERROR_OTHER)
    ("RuntimeError", status::RUNTIME_ERROR_OTHER)
    ("Compilation Error", status::COMPILATION_ERROR);
// clang-format on

static const int MAX_BOX_ID = 1000000;

template <typename T>
static optional<T> get_optional(const json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullopt;
    return it->get<T>();
}

template <typename T>
static void put_optional(json &j, const char *key, const optional<T> &value) {
    if (value)
        j[key] = *value;
    else
        j[key] = nullptr;
}

static int next_box_id() {
    thread_local mt19937 engine(random_device{}());
    uniform_int_distribution<int> dist(0, MAX_BOX_ID - 1);
    return dist(engine);
}

static execution_result internal_error_result(const string &message) {
    execution_result result;
    result.status = status::INTERNAL_ERROR;
    result.success = false;
    result.error_message = message;
    return result;
}

void to_json(json &j, const execution_result &result) {
    j = {{"status", get_display_message(result.status)},
         {"status_id", status_id(result.status)},
         {"success", result.success}};
    put_optional(j, "exit_code", result.exit_code);
    put_optional(j, "stdout", result.stdout_text);
    put_optional(j, "stderr", result.stderr_text);
    put_optional(j, "wall_time", result.wall_time);
    put_optional(j, "cpu_time", result.cpu_time);
    put_optional(j, "memory_peak_kb", result.memory_peak_kb);
    put_optional(j, "signal", result.signal);
    put_optional(j, "error_message", result.error_message);
    put_optional(j, "language", result.language);
}

void to_json(json &j, const sandbox_info &info) {
    j = {{"available", info.available},
         {"binary_path", info.binary_path.string()},
         {"work_dir", info.work_dir.string()},
         {"binary_exists", info.binary_exists},
         {"work_dir_writable", info.work_dir_writable}};
}

void to_json(json &j, const self_test_result &result) {
    j = {{"test_passed", result.test_passed}, {"sandbox_available", result.available}};
    if (result.result) j["result"] = *result.result;
    if (result.error) j["error"] = *result.error;
}

sandbox_adapter::sandbox_adapter(const sandbox_config &config, unique_ptr<process_runner> runner)
    : sandbox(config), runner(move(runner)) {
    error_code ec;
    filesystem::create_directories(sandbox.work_dir, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create sandbox work directory " << sandbox.work_dir << ": " << ec.message();
        BOOST_THROW_EXCEPTION(internal_error("unable to create sandbox work directory " + sandbox.work_dir.string()));
    }
    LOG(INFO) << "Sandbox work directory: " << sandbox.work_dir;
}

sandbox_adapter::~sandbox_adapter() = default;

const sandbox_config &sandbox_adapter::config() const {
    return sandbox;
}

vector<string> sandbox_adapter::build_command(const language &lang, const execution_request &request, int box_id) const {
    vector<string> cmd = {sandbox.binary.string(), "execute-code",
                          "--box-id", std::to_string(box_id),
                          "--language", lang.engine_language,
                          "--code", request.source_code};
    if (request.time_limit && *request.time_limit > 0)
        cmd.insert(cmd.end(), {"--time", std::to_string(*request.time_limit)});
    if (request.memory_limit && *request.memory_limit > 0)
        cmd.insert(cmd.end(), {"--mem", std::to_string(*request.memory_limit)});
    if (request.stdin_text && !request.stdin_text->empty())
        cmd.insert(cmd.end(), {"--stdin", *request.stdin_text});
    // 只有 root 才能使用严格隔离模式
    if (geteuid() == 0)
        cmd.push_back("--strict");
    return cmd;
}

chrono::milliseconds sandbox_adapter::wall_clock_limit(const execution_request &request) const {
    if (request.time_limit && *request.time_limit > 0)
        return chrono::seconds(*request.time_limit + sandbox.timeout_grace);
    return chrono::seconds(sandbox.default_timeout);
}

status sandbox_adapter::map_engine_status(const string &engine_status) {
    auto it = engine_status_table.find(engine_status);
    if (it == engine_status_table.end()) return status::RUNTIME_ERROR_OTHER;
    return it->second;
}

execution_result sandbox_adapter::parse_engine_output(const json &output, const language &lang) {
    execution_result result;
    result.status = map_engine_status(get_optional<string>(output, "status").value_or("Unknown"));
    result.exit_code = get_optional<int>(output, "exit_code");
    result.stdout_text = get_optional<string>(output, "stdout");
    result.stderr_text = get_optional<string>(output, "stderr");
    result.wall_time = get_optional<double>(output, "wall_time");
    result.cpu_time = get_optional<double>(output, "cpu_time");
    result.memory_peak_kb = get_optional<long long>(output, "memory_peak_kb");
    result.signal = get_optional<int>(output, "signal");
    result.error_message = get_optional<string>(output, "error_message");
    result.language = lang.name;
    // 沙箱报告 Success 但返回码不为 0 时仍然视为失败，缺少返回码也视为失败
    result.success = result.status == status::ACCEPTED && result.exit_code.value_or(1) == 0;
    return result;
}

execution_result sandbox_adapter::execute(const execution_request &request) {
    const language &lang = get_language(request.language_id);
    vector<string> cmd = build_command(lang, request, next_box_id());

    // 源代码可能很长，只打印前 6 个参数
    LOG(INFO) << "Executing sandbox command: "
              << boost::algorithm::join(vector<string>(cmd.begin(), cmd.begin() + min<size_t>(6, cmd.size())), " ") << "...";

    process_output output;
    try {
        output = runner->run(cmd, wall_clock_limit(request));
    } catch (std::exception &ex) {
        LOG(ERROR) << "Sandbox execution error: " << ex.what();
        return internal_error_result(ex.what());
    }

    if (output.timed_out) {
        LOG(ERROR) << "Sandbox execution timed out";
        execution_result result;
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.success = false;
        result.error_message = "Execution timed out";
        return result;
    }

    if (output.exit_code != 0) {
        LOG(ERROR) << "Sandbox execution failed: " << output.stderr_text;
        return internal_error_result("Sandbox execution failed: " + output.stderr_text);
    }

    json parsed = json::parse(output.stdout_text, nullptr, /* allow_exceptions */ false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LOG(ERROR) << "Failed to parse sandbox JSON output: " << output.stdout_text;
        return internal_error_result("Failed to parse execution output: " + output.stdout_text);
    }

    try {
        return parse_engine_output(parsed, lang);
    } catch (json::exception &ex) {
        LOG(ERROR) << "Failed to parse sandbox output: " << ex.what();
        return internal_error_result(fmt::format("Failed to parse execution result: {}, output: {}", ex.what(), output.stdout_text));
    }
}

bool sandbox_adapter::is_available() {
    try {
        process_output output = runner->run({sandbox.binary.string(), "--help"}, chrono::seconds(sandbox.probe_timeout));
        return !output.timed_out && output.exit_code == 0;
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to probe sandbox binary " << sandbox.binary << ": " << ex.what();
        return false;
    }
}

sandbox_info sandbox_adapter::info() {
    sandbox_info info;
    info.available = is_available();
    info.binary_path = sandbox.binary;
    info.work_dir = sandbox.work_dir;
    error_code ec;
    info.binary_exists = filesystem::exists(sandbox.binary, ec);
    info.work_dir_writable = is_writable_directory(sandbox.work_dir);
    return info;
}

self_test_result sandbox_adapter::self_test() {
    static const char *expected = "Hello, World!";

    self_test_result test;
    execution_request request;
    request.source_code = "print('Hello, World!')";
    request.language_id = 1;  // Python
    request.time_limit = 5;
    request.memory_limit = 128;

    try {
        execution_result result = execute(request);
        test.test_passed = result.success && result.stdout_text &&
                           result.stdout_text->find(expected) != string::npos;
        test.result = move(result);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Sandbox self test failed: " << ex.what();
        test.test_passed = false;
        test.error = ex.what();
    }
    test.available = is_available();
    return test;
}

}  // namespace codejudge::sandbox
