#include <gtest/gtest.h>
#include "result_store.hpp"
#include <atomic>
#include <thread>

namespace {
AgentResult result(const std::string& role, const std::string& text, int attempt = 1) {
    AgentResult r;
    r.role = role;
    r.content = {{"text", text}};
    r.attempt = attempt;
    return r;
}
}

TEST(ResultStoreTests, Put_ThenGet_ReturnsResult) {
    ResultStore store("run-1");
    store.put(result("macro", "gdp up"));
    auto got = store.get("macro");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->content["text"], "gdp up");
    EXPECT_TRUE(store.contains("macro"));
    EXPECT_FALSE(store.get("finance").has_value());
}

TEST(ResultStoreTests, Put_SecondWriteForRole_ThrowsDuplicate) {
    ResultStore store("run-1");
    store.put(result("macro", "first"));
    EXPECT_THROW(store.put(result("macro", "second")), DuplicateWriteError);
    EXPECT_EQ(store.get("macro")->content["text"], "first");
    EXPECT_EQ(store.size(), 1u);
}

TEST(ResultStoreTests, Put_RetryReplace_OverwritesExistingResult) {
    ResultStore store("run-1");
    store.put(result("macro", "first", 1));
    store.put(result("macro", "second", 2), WriteMode::RetryReplace);
    EXPECT_EQ(store.get("macro")->content["text"], "second");
    EXPECT_EQ(store.get("macro")->attempt, 2);
    EXPECT_EQ(store.size(), 1u);
}

TEST(ResultStoreTests, Snapshot_FollowsGivenOrderThenName) {
    ResultStore store("run-7");
    store.put(result("zeta", "z"));
    store.put(result("market", "m"));
    store.put(result("macro", "a"));
    store.put(result("alpha", "x"));
    auto snap = store.snapshot({"macro", "finance", "market"});
    EXPECT_EQ(snap.run_id, "run-7");
    ASSERT_EQ(snap.results.size(), 4u);
    EXPECT_EQ(snap.results[0].role, "macro");
    EXPECT_EQ(snap.results[1].role, "market");
    EXPECT_EQ(snap.results[2].role, "alpha");
    EXPECT_EQ(snap.results[3].role, "zeta");
}

TEST(ResultStoreTests, ConcurrentWriters_EachRoleStoredOnce) {
    ResultStore store("run-1");
    std::vector<std::thread> writers;
    std::atomic<int> duplicates{0};
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&, t]{
            for (int i = 0; i < 50; ++i) {
                try {
                    store.put(result("role" + std::to_string(i), std::to_string(t)));
                } catch (const DuplicateWriteError&) {
                    ++duplicates;
                }
            }
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(store.size(), 50u);
    EXPECT_EQ(duplicates.load(), 7 * 50);
}
