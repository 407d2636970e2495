#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "common/status.hpp"
#include "gtest/gtest.h"
#include "judge/lifecycle.hpp"
#include "store/memory_store.hpp"

using namespace std;
using namespace codejudge;

static submission make_draft() {
    submission draft;
    draft.source_code = "print(input())";
    draft.language_id = 1;
    draft.stdin_text = "hello";
    draft.time_limit = 10;
    draft.memory_limit = 512;
    return draft;
}

static submission_outcome make_accepted() {
    submission_outcome outcome;
    outcome.status = status::ACCEPTED;
    outcome.stdout_text = "hello\n";
    outcome.exit_code = 0;
    outcome.execution_metadata = nlohmann::json({{"worker_id", "worker-test"}});
    return outcome;
}

TEST(StatusTest, FixedIdentifiers) {
    EXPECT_EQ(status_id(status::QUEUED), 1);
    EXPECT_EQ(status_id(status::PROCESSING), 2);
    EXPECT_EQ(status_id(status::INTERNAL_ERROR), 13);
    EXPECT_EQ(status_id(status::EXEC_FORMAT_ERROR), 14);
    EXPECT_EQ(status_from_id(7), status::RUNTIME_ERROR_SIGSEGV);
    EXPECT_FALSE(status_from_id(0));
    EXPECT_FALSE(status_from_id(15));

    EXPECT_STREQ(get_display_message(status::QUEUED), "In Queue");
    EXPECT_STREQ(get_display_message(status::RUNTIME_ERROR_NZEC), "Runtime Error (NZEC)");
    EXPECT_EQ(status_from_display_message("Time Limit Exceeded"), status::TIME_LIMIT_EXCEEDED);
    EXPECT_FALSE(status_from_display_message("Timeout"));
}

TEST(StatusTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(status::QUEUED));
    EXPECT_FALSE(is_terminal(status::PROCESSING));
    for (int id = 3; id <= 14; ++id)
        EXPECT_TRUE(is_terminal(*status_from_id(id))) << id;
}

TEST(LifecycleTest, Transitions) {
    EXPECT_TRUE(can_transition(status::QUEUED, status::PROCESSING));
    EXPECT_TRUE(can_transition(status::QUEUED, status::INTERNAL_ERROR));
    EXPECT_FALSE(can_transition(status::QUEUED, status::ACCEPTED));
    EXPECT_TRUE(can_transition(status::PROCESSING, status::ACCEPTED));
    EXPECT_TRUE(can_transition(status::PROCESSING, status::INTERNAL_ERROR));
    EXPECT_FALSE(can_transition(status::PROCESSING, status::QUEUED));
    EXPECT_FALSE(can_transition(status::PROCESSING, status::PROCESSING));
    EXPECT_FALSE(can_transition(status::ACCEPTED, status::INTERNAL_ERROR));
    EXPECT_FALSE(can_transition(status::INTERNAL_ERROR, status::ACCEPTED));
}

TEST(LifecycleTest, ClaimSucceedsOnce) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;

    EXPECT_TRUE(lifecycle.claim(id));
    EXPECT_FALSE(lifecycle.claim(id));

    auto record = store.find(id);
    EXPECT_EQ(record->status, status::PROCESSING);
    EXPECT_TRUE(record->started_at);
}

TEST(LifecycleTest, ConcurrentClaimHasOneWinner) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;

    atomic<int> winners{0};
    vector<thread> threads;
    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&] {
            if (lifecycle.claim(id)) ++winners;
        });
    for (auto &thd : threads) thd.join();

    EXPECT_EQ(winners.load(), 1);
}

TEST(LifecycleTest, ClaimMissingSubmission) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    EXPECT_FALSE(lifecycle.claim(404));
}

TEST(LifecycleTest, FinishRequiresProcessing) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;

    EXPECT_FALSE(lifecycle.finish(id, make_accepted()));
    EXPECT_EQ(store.find(id)->status, status::QUEUED);

    ASSERT_TRUE(lifecycle.claim(id));
    EXPECT_TRUE(lifecycle.finish(id, make_accepted()));

    auto record = store.find(id);
    EXPECT_EQ(record->status, status::ACCEPTED);
    EXPECT_EQ(record->stdout_text, optional<string>("hello\n"));
    EXPECT_EQ(record->execution_metadata->at("worker_id"), "worker-test");
    EXPECT_TRUE(record->finished_at);
}

TEST(LifecycleTest, FinishRejectsNonTerminalStatus) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;
    ASSERT_TRUE(lifecycle.claim(id));

    submission_outcome outcome = make_accepted();
    outcome.status = status::QUEUED;
    EXPECT_THROW(lifecycle.finish(id, outcome), internal_error);
    EXPECT_EQ(store.find(id)->status, status::PROCESSING);
}

TEST(LifecycleTest, TerminalStatusWrittenOnce) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;
    ASSERT_TRUE(lifecycle.claim(id));
    ASSERT_TRUE(lifecycle.finish(id, make_accepted()));

    EXPECT_FALSE(lifecycle.fail(id, "late failure"));
    submission_outcome second = make_accepted();
    second.status = status::WRONG_ANSWER;
    EXPECT_FALSE(lifecycle.finish(id, second));

    auto record = store.find(id);
    EXPECT_EQ(record->status, status::ACCEPTED);
    EXPECT_FALSE(record->error_message);
}

TEST(LifecycleTest, FailFromQueuedOrProcessing) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long queued = store.create(make_draft()).id;
    long long processing = store.create(make_draft()).id;
    ASSERT_TRUE(lifecycle.claim(processing));

    EXPECT_TRUE(lifecycle.fail(queued, "Sandbox is not available"));
    EXPECT_TRUE(lifecycle.fail(processing, ""));

    EXPECT_EQ(store.find(queued)->status, status::INTERNAL_ERROR);
    EXPECT_EQ(store.find(queued)->error_message, optional<string>("Sandbox is not available"));
    EXPECT_EQ(store.find(processing)->status, status::INTERNAL_ERROR);
    EXPECT_EQ(store.find(processing)->error_message, optional<string>("Unknown internal error"));
}

TEST(LifecycleTest, EditOnlyWhileQueued) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long id = store.create(make_draft()).id;

    submission_edit edit;
    edit.stdin_text = "world";
    edit.time_limit = 3;
    EXPECT_TRUE(lifecycle.edit(id, edit));
    EXPECT_EQ(store.find(id)->stdin_text, optional<string>("world"));
    EXPECT_EQ(store.find(id)->time_limit, 3);
    EXPECT_EQ(store.find(id)->memory_limit, 512);

    ASSERT_TRUE(lifecycle.claim(id));
    edit.stdin_text = "too late";
    EXPECT_FALSE(lifecycle.edit(id, edit));
    EXPECT_EQ(store.find(id)->stdin_text, optional<string>("world"));
}

TEST(LifecycleTest, CountByStatus) {
    store::memory_store store;
    submission_lifecycle lifecycle(store);
    long long first = store.create(make_draft()).id;
    store.create(make_draft());
    ASSERT_TRUE(lifecycle.claim(first));

    auto counts = store.count_by_status();
    EXPECT_EQ(counts[status::QUEUED], 1u);
    EXPECT_EQ(counts[status::PROCESSING], 1u);
}
