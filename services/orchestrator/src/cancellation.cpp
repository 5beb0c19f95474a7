#include "../include/cancellation.hpp"
#include <algorithm>

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(state_->mtx);
    if (state_->flag.exchange(true)) return;
    for (auto& kv : state_->callbacks) kv.second();
    state_->cv.notify_all();
}

bool CancellationToken::cancelled() const { return state_->flag.load(); }

std::shared_ptr<const std::atomic<bool>> CancellationToken::flag() const {
    return std::shared_ptr<const std::atomic<bool>>(state_, &state_->flag);
}

std::size_t CancellationToken::subscribe(Callback cb) {
    std::lock_guard<std::mutex> lock(state_->mtx);
    std::size_t id = state_->next_id++;
    if (state_->flag.load()) {
        cb();
        return id;
    }
    state_->callbacks.emplace_back(id, std::move(cb));
    return id;
}

void CancellationToken::unsubscribe(std::size_t id) {
    std::lock_guard<std::mutex> lock(state_->mtx);
    auto& cbs = state_->callbacks;
    cbs.erase(std::remove_if(cbs.begin(), cbs.end(), [&](const auto& kv){ return kv.first == id; }), cbs.end());
}

bool CancellationToken::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lock(state_->mtx);
    return state_->cv.wait_for(lock, d, [&]{ return state_->flag.load(); });
}
