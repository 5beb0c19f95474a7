#include "../include/result_store.hpp"
#include <set>

ResultStore::ResultStore(std::string run_id) : run_id_(std::move(run_id)) {}

void ResultStore::put(AgentResult result, WriteMode mode) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = results_.find(result.role);
    if (it != results_.end()) {
        if (mode != WriteMode::RetryReplace) throw DuplicateWriteError(result.role);
        it->second = std::move(result);
        return;
    }
    std::string role = result.role;
    results_.emplace(std::move(role), std::move(result));
}

std::optional<AgentResult> ResultStore::get(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = results_.find(role);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

bool ResultStore::contains(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return results_.count(role) > 0;
}

std::size_t ResultStore::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return results_.size();
}

ResultSnapshot ResultStore::snapshot(const std::vector<std::string>& order) const {
    std::lock_guard<std::mutex> lock(mtx_);
    ResultSnapshot s;
    s.run_id = run_id_;
    s.results.reserve(results_.size());
    std::set<std::string> taken;
    for (const auto& role : order) {
        auto it = results_.find(role);
        if (it != results_.end() && taken.insert(role).second) s.results.push_back(it->second);
    }
    for (const auto& kv : results_) {
        if (!taken.count(kv.first)) s.results.push_back(kv.second);
    }
    return s;
}
