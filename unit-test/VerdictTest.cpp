#include "gtest/gtest.h"
#include "judge/verdict.hpp"

using namespace std;
using namespace codejudge;

static sandbox::execution_result accepted(const string &stdout_text) {
    sandbox::execution_result result;
    result.status = status::ACCEPTED;
    result.exit_code = 0;
    result.stdout_text = stdout_text;
    result.stderr_text = "";
    result.success = true;
    return result;
}

TEST(VerdictTest, OutputsMatchIgnoresTrailingWhitespace) {
    EXPECT_TRUE(outputs_match("1 2 3\n", "1 2 3"));
    EXPECT_TRUE(outputs_match("1 2 3  \n4\t\n\n\n", "1 2 3\n4\n"));
    EXPECT_TRUE(outputs_match("a\r\nb\r\n", "a\nb"));
    EXPECT_TRUE(outputs_match("", "\n\n"));
}

TEST(VerdictTest, OutputsMismatch) {
    EXPECT_FALSE(outputs_match("1 2 3", "1 2 4"));
    EXPECT_FALSE(outputs_match(" 1", "1"));
    EXPECT_FALSE(outputs_match("1\n\n2", "1\n2"));
    EXPECT_FALSE(outputs_match("", "0"));
}

TEST(VerdictTest, AcceptedWithoutExpectedOutput) {
    submission_outcome outcome = make_outcome(accepted("anything\n"), nullopt, nlohmann::json::object());
    EXPECT_EQ(outcome.status, status::ACCEPTED);
    EXPECT_EQ(outcome.stdout_text, optional<string>("anything\n"));
    EXPECT_FALSE(outcome.compile_output);
}

TEST(VerdictTest, WrongAnswerOnMismatch) {
    EXPECT_EQ(make_outcome(accepted("42\n"), string("42"), nullptr).status, status::ACCEPTED);
    EXPECT_EQ(make_outcome(accepted("41\n"), string("42"), nullptr).status, status::WRONG_ANSWER);
}

TEST(VerdictTest, ExpectedOutputIgnoredWhenNotAccepted) {
    sandbox::execution_result result = accepted("");
    result.status = status::TIME_LIMIT_EXCEEDED;
    result.success = false;
    EXPECT_EQ(make_outcome(result, string("42"), nullptr).status, status::TIME_LIMIT_EXCEEDED);
}

TEST(VerdictTest, CompilationErrorKeepsCompilerOutput) {
    sandbox::execution_result result;
    result.status = status::COMPILATION_ERROR;
    result.stderr_text = "main.cpp:1:1: error: expected unqualified-id";

    submission_outcome outcome = make_outcome(result, nullopt, {{"worker_id", "worker-1"}});
    EXPECT_EQ(outcome.status, status::COMPILATION_ERROR);
    EXPECT_EQ(outcome.compile_output, result.stderr_text);
    EXPECT_EQ(outcome.execution_metadata->at("worker_id"), "worker-1");
}
