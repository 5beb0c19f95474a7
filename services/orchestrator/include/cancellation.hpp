#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Shared cancellation flag. Copies refer to the same state.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel();
    bool cancelled() const;

    // Aliases the flag so it can be handed to code that only polls.
    std::shared_ptr<const std::atomic<bool>> flag() const;

    // Callbacks run once, with the token's lock held, when cancel() is first
    // called (immediately if already cancelled). They must only notify.
    std::size_t subscribe(Callback cb);
    void unsubscribe(std::size_t id);

    // Sleeps for d unless cancelled first. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::mutex mtx;
        std::condition_variable cv;
        std::size_t next_id{1};
        std::vector<std::pair<std::size_t, Callback>> callbacks;
    };
    std::shared_ptr<State> state_;
};

class CancellationSubscription {
public:
    CancellationSubscription(const CancellationToken& token, CancellationToken::Callback cb)
        : token_(token), id_(token_.subscribe(std::move(cb))) {}
    ~CancellationSubscription() { token_.unsubscribe(id_); }
    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken token_;
    std::size_t id_;
};
