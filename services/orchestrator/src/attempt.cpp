#include "../include/attempt.hpp"
#include "../include/errors.hpp"
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>

namespace {
struct PendingCall {
    std::mutex mtx;
    std::condition_variable cv;
    bool done{false};
    std::optional<InferenceReply> reply;
    std::exception_ptr error;
};
}

InferenceReply infer_with_deadline(const std::shared_ptr<InferenceClient>& client, const std::string& role,
                                   const std::string& prompt, const InferenceParams& params,
                                   std::chrono::milliseconds timeout, const CancellationToken& cancel) {
    if (cancel.cancelled()) throw CancelledError();

    auto call = std::make_shared<PendingCall>();
    std::thread([client, call, role, prompt, params]() {
        std::optional<InferenceReply> reply;
        std::exception_ptr error;
        try {
            reply = client->infer(role, prompt, params);
        } catch (...) {
            error = std::current_exception(); // handed to the waiter
        }
        std::lock_guard<std::mutex> lock(call->mtx);
        call->reply = std::move(reply);
        call->error = error;
        call->done = true;
        call->cv.notify_all();
    }).detach();

    CancellationSubscription sub(cancel, [call]{
        std::lock_guard<std::mutex> lock(call->mtx);
        call->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(call->mtx);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    call->cv.wait_until(lock, deadline, [&]{ return call->done || cancel.cancelled(); });
    if (call->done) {
        if (call->error) std::rethrow_exception(call->error);
        return *call->reply;
    }
    if (cancel.cancelled()) throw CancelledError();
    throw TransientInferenceError(role + ": attempt timed out after " + std::to_string(timeout.count()) + " ms");
}
