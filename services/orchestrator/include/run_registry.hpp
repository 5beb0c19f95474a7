#pragma once
#include "run_types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct RunEntry {
    std::string id;
    RunStatus status{RunStatus::Pending};
    std::vector<std::string> roles;
    std::chrono::system_clock::time_point submitted_at{};
    CancellationToken cancel;
    std::optional<RunSummary> summary;
    std::string error; // set when the run never produced a summary
};

struct RegistrySnapshot {
    std::vector<RunEntry> active;
    std::vector<RunEntry> finished; // oldest first
};

// Runs submitted to the service. Finished runs are kept in a bounded history.
class RunRegistry {
public:
    explicit RunRegistry(std::size_t history_limit = 50) : history_limit_(history_limit) {}

    // Throws std::invalid_argument if the id is already known.
    RunEntry submit(const std::string& id, std::vector<std::string> roles);
    bool mark_running(const std::string& id);
    void complete(const std::string& id, RunSummary summary);
    void fail(const std::string& id, const std::string& error);

    // False when the run is unknown or already finished.
    bool cancel(const std::string& id);
    std::size_t cancel_all();

    std::optional<RunEntry> get(const std::string& id);
    RegistrySnapshot snapshot();

private:
    void retire_locked(RunEntry entry);

    std::mutex mtx_;
    std::size_t history_limit_;
    std::unordered_map<std::string, RunEntry> active_;
    std::deque<RunEntry> finished_;
};

// One thread per submitted run. A thread that has returned is joined by the
// next start() or reap(), so finished runs do not pin their threads.
class RunThreads {
public:
    RunThreads() = default;
    RunThreads(const RunThreads&) = delete;
    RunThreads& operator=(const RunThreads&) = delete;
    ~RunThreads() { join_all(); }

    void start(std::function<void()> fn);
    std::size_t reap();
    void join_all();
    std::size_t size();

private:
    std::mutex mtx_;
    std::uint64_t next_{0};
    std::map<std::uint64_t, std::thread> threads_;
    std::vector<std::uint64_t> finished_;
};
