#include "judge/verdict.hpp"
#include <boost/algorithm/string.hpp>
#include <vector>

namespace codejudge {
using namespace std;

static vector<string> normalized_lines(const string &text) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines) boost::trim_right(line);
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    return lines;
}

bool outputs_match(const string &actual, const string &expected) {
    return normalized_lines(actual) == normalized_lines(expected);
}

submission_outcome make_outcome(const sandbox::execution_result &result,
                                const optional<string> &expected_output,
                                const nlohmann::json &metadata) {
    submission_outcome outcome;
    outcome.status = result.status;
    if (result.status == status::ACCEPTED && expected_output &&
        !outputs_match(result.stdout_text.value_or(""), *expected_output))
        outcome.status = status::WRONG_ANSWER;

    outcome.stdout_text = result.stdout_text;
    outcome.stderr_text = result.stderr_text;
    // 沙箱把编译器的输出放在 stderr 中
    if (result.status == status::COMPILATION_ERROR)
        outcome.compile_output = result.stderr_text;
    outcome.exit_code = result.exit_code;
    outcome.signal = result.signal;
    outcome.wall_time = result.wall_time;
    outcome.cpu_time = result.cpu_time;
    outcome.memory_peak_kb = result.memory_peak_kb;
    outcome.error_message = result.error_message;
    outcome.execution_metadata = metadata;
    return outcome;
}

}  // namespace codejudge
