#include <gtest/gtest.h>
#include "run_registry.hpp"
#include <atomic>
#include <future>
#include <thread>

namespace {
RunSummary summary_with(const std::string& id, RunStatus status) {
    RunSummary s;
    s.run_id = id;
    s.status = status;
    return s;
}
}

TEST(RunRegistryTests, Submit_ThenGet_ReturnsPendingEntry) {
    RunRegistry reg;
    reg.submit("r1", {"macro", "finance"});
    auto e = reg.get("r1");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->status, RunStatus::Pending);
    EXPECT_EQ(e->roles, (std::vector<std::string>{"macro", "finance"}));
    EXPECT_FALSE(reg.get("missing").has_value());
}

TEST(RunRegistryTests, Submit_DuplicateId_Throws) {
    RunRegistry reg;
    reg.submit("r1", {});
    EXPECT_THROW(reg.submit("r1", {}), std::invalid_argument);
    reg.complete("r1", summary_with("r1", RunStatus::Completed));
    EXPECT_THROW(reg.submit("r1", {}), std::invalid_argument);
}

TEST(RunRegistryTests, Complete_MovesEntryToHistoryWithSummaryStatus) {
    RunRegistry reg;
    reg.submit("r1", {});
    EXPECT_TRUE(reg.mark_running("r1"));
    EXPECT_EQ(reg.get("r1")->status, RunStatus::Running);

    reg.complete("r1", summary_with("r1", RunStatus::CompletedWithErrors));
    auto snap = reg.snapshot();
    EXPECT_TRUE(snap.active.empty());
    ASSERT_EQ(snap.finished.size(), 1u);
    EXPECT_EQ(snap.finished[0].status, RunStatus::CompletedWithErrors);
    ASSERT_TRUE(snap.finished[0].summary.has_value());
    EXPECT_FALSE(reg.mark_running("r1"));
}

TEST(RunRegistryTests, Fail_RecordsErrorWithoutSummary) {
    RunRegistry reg;
    reg.submit("r1", {});
    reg.fail("r1", "unknown role(s): nope");
    auto e = reg.get("r1");
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->status, RunStatus::Failed);
    EXPECT_EQ(e->error, "unknown role(s): nope");
    EXPECT_FALSE(e->summary.has_value());
}

TEST(RunRegistryTests, Cancel_SignalsTheRunsToken) {
    RunRegistry reg;
    auto entry = reg.submit("r1", {});
    reg.submit("r2", {});
    EXPECT_TRUE(reg.cancel("r1"));
    EXPECT_TRUE(entry.cancel.cancelled());
    EXPECT_FALSE(reg.get("r2")->cancel.cancelled());
    EXPECT_FALSE(reg.cancel("nope"));

    reg.complete("r1", summary_with("r1", RunStatus::Failed));
    EXPECT_FALSE(reg.cancel("r1"));
    EXPECT_EQ(reg.cancel_all(), 1u);
    EXPECT_TRUE(reg.get("r2")->cancel.cancelled());
}

TEST(RunRegistryTests, History_IsBounded) {
    RunRegistry reg(2);
    for (int i = 0; i < 4; ++i) {
        std::string id = "r" + std::to_string(i);
        reg.submit(id, {});
        reg.complete(id, summary_with(id, RunStatus::Completed));
    }
    auto snap = reg.snapshot();
    ASSERT_EQ(snap.finished.size(), 2u);
    EXPECT_EQ(snap.finished[0].id, "r2");
    EXPECT_EQ(snap.finished[1].id, "r3");
    EXPECT_FALSE(reg.get("r0").has_value());
}

TEST(RunRegistryTests, Snapshot_ActiveOrderedBySubmission) {
    RunRegistry reg;
    reg.submit("first", {});
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    reg.submit("second", {});
    auto snap = reg.snapshot();
    ASSERT_EQ(snap.active.size(), 2u);
    EXPECT_EQ(snap.active[0].id, "first");
}

// =============================================================================
// Run threads
// =============================================================================

TEST(RunThreadsTests, Reap_JoinsOnlyFinishedThreads) {
    RunThreads threads;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> done{0};

    threads.start([gate]{ gate.wait(); });
    for (int i = 0; i < 3; ++i) threads.start([&done]{ ++done; });

    for (int i = 0; i < 2000 && threads.size() > 1; ++i) {
        threads.reap();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(done.load(), 3);
    EXPECT_EQ(threads.size(), 1u);

    release.set_value();
    threads.join_all();
    EXPECT_EQ(threads.size(), 0u);
    EXPECT_EQ(threads.reap(), 0u);
}
