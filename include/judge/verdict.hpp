#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "judge/submission.hpp"
#include "sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 比较程序输出与期望输出
 * 忽略每行行末的空白字符（包括 \r）以及末尾的空行
 */
bool outputs_match(const std::string &actual, const std::string &expected);

/**
 * @brief 根据沙箱的执行结果生成写回数据库的结果
 * 沙箱报告 Accepted 且提交带有期望输出时还需要比对输出，不一致则为 Wrong Answer。
 * @param result 沙箱的执行结果
 * @param expected_output 提交的期望输出
 * @param metadata 执行信息，原样保存
 */
submission_outcome make_outcome(const sandbox::execution_result &result,
                                const std::optional<std::string> &expected_output,
                                const nlohmann::json &metadata);

}  // namespace codejudge
