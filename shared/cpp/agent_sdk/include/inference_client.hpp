#pragma once
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

struct InferenceParams {
    std::string model;          // empty: client default
    std::string system_prompt;
    double temperature{0.1};
    int max_tokens{4000};
    long timeout_ms{120000};
    std::shared_ptr<const std::atomic<bool>> cancel_flag; // set when the caller gives up
};

struct InferenceReply {
    std::string text;
    int prompt_tokens{0};
    int completion_tokens{0};
};

class InferenceError : public std::runtime_error {
public:
    InferenceError(const std::string& what, long status) : std::runtime_error(what), status_(status) {}
    long status() const { return status_; } // 0 when no HTTP status was received
    virtual bool transient() const = 0;

private:
    long status_;
};

// Timeouts, rate limiting, 5xx, transport failures.
class TransientInferenceError : public InferenceError {
public:
    explicit TransientInferenceError(const std::string& what, long status = 0) : InferenceError(what, status) {}
    bool transient() const override { return true; }
};

// Bad credentials, rejected requests, unreadable responses.
class PermanentInferenceError : public InferenceError {
public:
    explicit PermanentInferenceError(const std::string& what, long status = 0) : InferenceError(what, status) {}
    bool transient() const override { return false; }
};

class InferenceClient {
public:
    virtual ~InferenceClient() = default;
    virtual InferenceReply infer(const std::string& role, const std::string& prompt, const InferenceParams& params) = 0;
};

struct LlmConfig {
    std::string provider{"openai"}; // openai | ollama
    std::string base_url{"https://api.siliconflow.cn/v1"};
    std::string model{"deepseek-ai/DeepSeek-R1"};
    std::string api_key;
    long timeout_ms{240000};
};

bool is_transient_status(long status);

// OpenAI-compatible /chat/completions endpoint (SiliconFlow, vLLM, ...).
class OpenAiCompatibleClient : public InferenceClient {
public:
    explicit OpenAiCompatibleClient(LlmConfig cfg);
    InferenceReply infer(const std::string& role, const std::string& prompt, const InferenceParams& params) override;

private:
    LlmConfig cfg_;
};

// Ollama /api/chat endpoint.
class OllamaClient : public InferenceClient {
public:
    explicit OllamaClient(LlmConfig cfg);
    InferenceReply infer(const std::string& role, const std::string& prompt, const InferenceParams& params) override;

private:
    LlmConfig cfg_;
};

std::shared_ptr<InferenceClient> make_inference_client(const LlmConfig& cfg);
