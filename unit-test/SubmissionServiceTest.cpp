#include "broker/memory_broker.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/submission_service.hpp"
#include "store/memory_store.hpp"
#include "test/assertions.hpp"
#include "test/fakes.hpp"

using namespace std;
using namespace nlohmann;
using namespace codejudge;

static new_submission python_request(const string &source = "print(input())") {
    new_submission request;
    request.source_code = source;
    request.language_id = 1;
    return request;
}

struct SubmissionServiceTest : public ::testing::Test {
    SubmissionServiceTest()
        : queue(limits_config(), test::test_worker_config()),
          service(queue, engine, submissions, limits_config()) {}

    broker::memory_broker queue;
    store::memory_store submissions;
    test::scripted_sandbox engine;
    submission_service service;
};

TEST_F(SubmissionServiceTest, CreateAppliesDefaultLimits) {
    test::event_recorder recorder;
    auto sub = queue.subscribe([&](const broker::event &e) { recorder(e); });

    created_submission created = service.create_submission(python_request(), 3);

    EXPECT_EQ(created.record.status, status::QUEUED);
    EXPECT_EQ(created.record.time_limit, 10);
    EXPECT_EQ(created.record.memory_limit, 512);
    EXPECT_EQ(queue.queue_depth(3), 1u);
    auto job = queue.dequeue();
    ASSERT_TRUE(job);
    EXPECT_EQ(job->job_id, created.job_id);
    EXPECT_EQ(job->submission_id, created.record.id);

    ASSERT_EQ(recorder.types(), vector<string>({"submission_created"}));
    EXPECT_JSON_EQ(recorder.events[0].data, json({{"submission_id", created.record.id},
                                                  {"job_id", created.job_id},
                                                  {"priority", 3}}));
}

TEST_F(SubmissionServiceTest, RejectsLimitsOverMaxima) {
    new_submission request = python_request();
    request.time_limit = 61;
    try {
        service.create_submission(request);
        FAIL() << "Expected validation_error";
    } catch (validation_error &ex) {
        EXPECT_STREQ(ex.what(), "Time limit cannot exceed 60 seconds");
    }

    request.time_limit = 60;
    request.memory_limit = 4096;
    EXPECT_THROW(service.create_submission(request), validation_error);

    request.memory_limit = 0;
    EXPECT_THROW(service.create_submission(request), validation_error);

    EXPECT_TRUE(submissions.count_by_status().empty());
    EXPECT_EQ(queue.total_depth(), 0u);
}

TEST_F(SubmissionServiceTest, RejectsUnknownLanguage) {
    new_submission request = python_request();
    request.language_id = 42;
    EXPECT_THROW(service.create_submission(request), unsupported_language);
    EXPECT_TRUE(submissions.count_by_status().empty());
}

TEST_F(SubmissionServiceTest, RejectsInvalidPriority) {
    EXPECT_THROW(service.create_submission(python_request(), 10), validation_error);
    EXPECT_THROW(service.create_submission(python_request(), -1), validation_error);
    EXPECT_TRUE(submissions.count_by_status().empty());
}

TEST_F(SubmissionServiceTest, BatchValidatesEverythingFirst) {
    new_submission invalid = python_request();
    invalid.memory_limit = 100000;
    EXPECT_THROW(service.create_batch({python_request(), invalid}), validation_error);
    EXPECT_TRUE(submissions.count_by_status().empty());
    EXPECT_EQ(queue.total_depth(), 0u);

    auto created = service.create_batch({python_request("print(1)"), python_request("print(2)")}, 1);
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(queue.queue_depth(1), 2u);
    EXPECT_EQ(queue.dequeue()->submission_id, created[0].record.id);
    EXPECT_EQ(queue.dequeue()->submission_id, created[1].record.id);
}

TEST_F(SubmissionServiceTest, UpdateOnlyWhileQueued) {
    long long id = service.create_submission(python_request()).record.id;

    submission_edit edit;
    edit.time_limit = 2;
    edit.expected_output = "hello";
    EXPECT_TRUE(service.update_submission(id, edit));
    EXPECT_EQ(service.find(id)->time_limit, 2);
    EXPECT_EQ(service.find(id)->expected_output, optional<string>("hello"));

    edit.time_limit = 120;
    EXPECT_THROW(service.update_submission(id, edit), validation_error);

    ASSERT_TRUE(submissions.try_claim(id));
    edit.time_limit = 3;
    EXPECT_FALSE(service.update_submission(id, edit));
    EXPECT_EQ(service.find(id)->time_limit, 2);

    EXPECT_THROW(service.update_submission(404, edit), submission_not_found);
}

TEST_F(SubmissionServiceTest, ExecuteNowBypassesQueue) {
    new_submission request = python_request();
    request.expected_output = "ok";

    submission finished = service.execute_now(request);

    EXPECT_EQ(finished.status, status::ACCEPTED);
    EXPECT_TRUE(finished.finished_at);
    ASSERT_TRUE(finished.execution_metadata);
    EXPECT_EQ(finished.execution_metadata->at("worker_id"), "immediate");
    EXPECT_EQ(queue.total_depth(), 0u);
    EXPECT_EQ(engine.executions.load(), 1);
}

TEST_F(SubmissionServiceTest, ExecuteNowRecordsEngineFailure) {
    engine.script = [](const sandbox::execution_request &) -> sandbox::execution_result {
        throw runtime_error("box vanished");
    };

    submission finished = service.execute_now(python_request());
    EXPECT_EQ(finished.status, status::INTERNAL_ERROR);
    EXPECT_EQ(finished.error_message, optional<string>("box vanished"));
}

TEST_F(SubmissionServiceTest, ExecuteNowRequiresSandbox) {
    engine.available = false;
    EXPECT_THROW(service.execute_now(python_request()), internal_error);
    EXPECT_TRUE(submissions.count_by_status().empty());
}

TEST_F(SubmissionServiceTest, ExecuteNowRefusesClaimedSubmission) {
    long long id = service.create_submission(python_request()).record.id;
    ASSERT_TRUE(submissions.try_claim(id));

    EXPECT_THROW(service.execute_now(id), validation_error);
    EXPECT_THROW(service.execute_now(404LL), submission_not_found);
    EXPECT_EQ(engine.executions.load(), 0);
}

TEST_F(SubmissionServiceTest, SubmissionJson) {
    json request = {{"source_code", "print(input())"},
                    {"language_id", 1},
                    {"stdin", "hi"},
                    {"time_limit", 3}};
    submission record = service.create_submission(request.get<new_submission>()).record;

    json j = record;
    EXPECT_EQ(j.at("status_id"), 1);
    EXPECT_EQ(j.at("status"), "In Queue");
    EXPECT_EQ(j.at("stdin"), "hi");
    EXPECT_EQ(j.at("time_limit"), 3);
    EXPECT_EQ(j.at("memory_limit"), 512);
    EXPECT_TRUE(j.at("stdout").is_null());
    EXPECT_TRUE(j.at("finished_at").is_null());
}
