#pragma once
#include "collaborators.hpp"
#include "dependency_graph.hpp"
#include "result_store.hpp"
#include "run_types.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct TaskRecord {
    std::string role;
    std::vector<Prerequisite> prerequisites;
    TaskState state{TaskState::Waiting};
    int attempts{0};
    std::optional<FailureRecord> last_error;
    std::vector<FailureRecord> failures;
    std::vector<OmittedInput> omitted;
    std::chrono::steady_clock::time_point retry_at{};
};

// Drives every task of a run to a terminal state with at most
// options.max_concurrent attempts in flight.
class Scheduler {
public:
    Scheduler(std::string run_id, const DependencyGraph& graph, const std::vector<RoleSpec>& roles,
              std::shared_ptr<InferenceClient> client, std::shared_ptr<DataProvider> data,
              ResultStore& store, const RunOptions& options);

    // Blocks until every task is terminal.
    void run();

    std::vector<TaskRecord> tasks() const;    // declaration order
    std::vector<FailureRecord> failures() const; // chronological
    int peak_concurrency() const;

private:
    struct Transition {
        std::string role;
        TaskState from;
        TaskState to;
    };

    struct AttemptOutcome {
        bool ok{false};
        AgentResult result;
        ClassifiedError error;
    };

    void worker_loop();
    bool all_terminal_locked() const;
    void promote_locked();
    void cancel_pending_locked();
    std::optional<std::size_t> pick_launchable_locked(std::chrono::steady_clock::time_point now) const;
    std::optional<std::chrono::steady_clock::time_point> next_retry_locked() const;
    TaskInput build_input_locked(const TaskRecord& task) const;
    AttemptOutcome execute_attempt(const RoleSpec& spec, TaskInput input);
    void apply_outcome_locked(std::size_t idx, AttemptOutcome outcome);
    void transition_locked(TaskRecord& task, TaskState to);
    void deliver_transitions(std::unique_lock<std::mutex>& lock);
    void record_failure_locked(TaskRecord& task, ErrorClass cls, const std::string& message);

    std::string run_id_;
    const DependencyGraph& graph_;
    std::map<std::string, const RoleSpec*> specs_;
    std::shared_ptr<InferenceClient> client_;
    std::shared_ptr<DataProvider> data_;
    ResultStore& store_;
    RunOptions options_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<TaskRecord> tasks_;
    StateMap states_;
    std::vector<FailureRecord> failures_;
    std::vector<Transition> pending_transitions_;
    bool delivering_{false};
    int running_{0};
    int peak_running_{0};
    std::mt19937_64 rng_;
};
