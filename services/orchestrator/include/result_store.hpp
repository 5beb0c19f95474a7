#pragma once
#include "run_types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class WriteMode { Append, RetryReplace };

// Immutable view handed to the aggregator.
struct ResultSnapshot {
    std::string run_id;
    std::vector<AgentResult> results; // declared role order
};

// Per-run, append-only map from role to result. Safe for concurrent writers.
class ResultStore {
public:
    explicit ResultStore(std::string run_id);

    const std::string& run_id() const { return run_id_; }

    // Throws DuplicateWriteError if the role already has a result and mode is Append.
    void put(AgentResult result, WriteMode mode = WriteMode::Append);
    std::optional<AgentResult> get(const std::string& role) const;
    bool contains(const std::string& role) const;
    std::size_t size() const;

    // Roles not in order are appended after the ordered ones, by name.
    ResultSnapshot snapshot(const std::vector<std::string>& order) const;

private:
    std::string run_id_;
    mutable std::mutex mtx_;
    std::map<std::string, AgentResult> results_;
};
