#include "../include/run_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

RunEntry RunRegistry::submit(const std::string& id, std::vector<std::string> roles) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool known = active_.count(id) ||
                 std::any_of(finished_.begin(), finished_.end(), [&](const RunEntry& e){ return e.id == id; });
    if (known) throw std::invalid_argument("run already exists: " + id);
    RunEntry e;
    e.id = id;
    e.roles = std::move(roles);
    e.submitted_at = std::chrono::system_clock::now();
    active_.emplace(id, e);
    return e;
}

bool RunRegistry::mark_running(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = active_.find(id);
    if (it == active_.end()) return false;
    it->second.status = RunStatus::Running;
    return true;
}

void RunRegistry::complete(const std::string& id, RunSummary summary) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = active_.find(id);
    if (it == active_.end()) return;
    RunEntry e = std::move(it->second);
    active_.erase(it);
    e.status = summary.status;
    e.summary = std::move(summary);
    retire_locked(std::move(e));
}

void RunRegistry::fail(const std::string& id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = active_.find(id);
    if (it == active_.end()) return;
    RunEntry e = std::move(it->second);
    active_.erase(it);
    e.status = RunStatus::Failed;
    e.error = error;
    retire_locked(std::move(e));
}

void RunRegistry::retire_locked(RunEntry entry) {
    finished_.push_back(std::move(entry));
    while (finished_.size() > history_limit_) finished_.pop_front();
}

bool RunRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = active_.find(id);
    if (it == active_.end()) return false;
    it->second.cancel.cancel();
    return true;
}

std::size_t RunRegistry::cancel_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : active_) kv.second.cancel.cancel();
    return active_.size();
}

std::optional<RunEntry> RunRegistry::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = active_.find(id);
    if (it != active_.end()) return it->second;
    for (const auto& e : finished_) {
        if (e.id == id) return e;
    }
    return std::nullopt;
}

RegistrySnapshot RunRegistry::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    RegistrySnapshot s;
    s.active.reserve(active_.size());
    for (const auto& kv : active_) s.active.push_back(kv.second);
    std::sort(s.active.begin(), s.active.end(),
              [](const RunEntry& a, const RunEntry& b){ return a.submitted_at < b.submitted_at; });
    s.finished.assign(finished_.begin(), finished_.end());
    return s;
}

void RunThreads::start(std::function<void()> fn) {
    reap();
    std::lock_guard<std::mutex> lock(mtx_);
    std::uint64_t key = next_++;
    threads_.emplace(key, std::thread([this, key, fn = std::move(fn)]{
        fn();
        std::lock_guard<std::mutex> done(mtx_);
        finished_.push_back(key);
    }));
}

std::size_t RunThreads::reap() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto key : finished_) {
            auto it = threads_.find(key);
            if (it == threads_.end()) continue;
            done.push_back(std::move(it->second));
            threads_.erase(it);
        }
        finished_.clear();
    }
    for (auto& t : done) t.join();
    return done.size();
}

void RunThreads::join_all() {
    std::map<std::uint64_t, std::thread> all;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        all.swap(threads_);
    }
    for (auto& kv : all) kv.second.join();
    std::lock_guard<std::mutex> lock(mtx_);
    finished_.erase(std::remove_if(finished_.begin(), finished_.end(),
                                   [&](std::uint64_t key){ return all.count(key) > 0; }),
                    finished_.end());
}

std::size_t RunThreads::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return threads_.size();
}
