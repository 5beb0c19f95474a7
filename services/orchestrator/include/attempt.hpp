#pragma once
#include "cancellation.hpp"
#include "../../../shared/cpp/agent_sdk/include/inference_client.hpp"
#include <chrono>
#include <memory>
#include <string>

// Runs client->infer on a helper thread and waits at most timeout.
// Throws TransientInferenceError on timeout and CancelledError if the token
// fires first; the abandoned call keeps running and its result is dropped.
// Errors thrown by the client are rethrown unchanged.
InferenceReply infer_with_deadline(const std::shared_ptr<InferenceClient>& client, const std::string& role,
                                   const std::string& prompt, const InferenceParams& params,
                                   std::chrono::milliseconds timeout, const CancellationToken& cancel);
