#include "../include/inference_client.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
json build_messages(const std::string& system_prompt, const std::string& prompt) {
    json messages = json::array();
    if (!system_prompt.empty()) messages.push_back(json{{"role", "system"}, {"content", system_prompt}});
    messages.push_back(json{{"role", "user"}, {"content", prompt}});
    return messages;
}

long effective_timeout(const LlmConfig& cfg, const InferenceParams& params) {
    if (params.timeout_ms > 0 && params.timeout_ms < cfg.timeout_ms) return params.timeout_ms;
    return cfg.timeout_ms;
}

HttpResponse post(const std::string& role, const std::string& url, const json& body, long timeout_ms,
                  const std::vector<std::string>& headers, const InferenceParams& params) {
    log_debug("inference", role + " -> " + url);
    try {
        return http_post_json(url, body.dump(), timeout_ms, headers, params.cancel_flag.get());
    } catch (const HttpTransportError& e) {
        // Transport failures (refused, reset, timed out, aborted) are worth another attempt.
        throw TransientInferenceError(role + ": " + e.what());
    }
}

void check_status(const std::string& role, const HttpResponse& r) {
    if (r.status >= 200 && r.status < 300) return;
    std::string body = r.body.size() > 300 ? r.body.substr(0, 300) + "..." : r.body;
    std::string msg = role + ": inference failed: status " + std::to_string(r.status) + " " + body;
    if (is_transient_status(r.status)) throw TransientInferenceError(msg, r.status);
    throw PermanentInferenceError(msg, r.status);
}

json parse_body(const std::string& role, const HttpResponse& r) {
    try {
        return json::parse(r.body);
    } catch (const json::parse_error& e) {
        throw PermanentInferenceError(role + ": malformed response: " + e.what(), r.status);
    }
}
}

bool is_transient_status(long status) {
    return status == 408 || status == 425 || status == 429 || status >= 500;
}

OpenAiCompatibleClient::OpenAiCompatibleClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();
}

InferenceReply OpenAiCompatibleClient::infer(const std::string& role, const std::string& prompt,
                                             const InferenceParams& params) {
    json body = {
        {"model", params.model.empty() ? cfg_.model : params.model},
        {"messages", build_messages(params.system_prompt, prompt)},
        {"temperature", params.temperature},
        {"max_tokens", params.max_tokens},
        {"stream", false}
    };
    std::vector<std::string> headers;
    if (!cfg_.api_key.empty()) headers.push_back("Authorization: Bearer " + cfg_.api_key);

    auto r = post(role, cfg_.base_url + "/chat/completions", body, effective_timeout(cfg_, params), headers, params);
    check_status(role, r);
    auto data = parse_body(role, r);

    InferenceReply reply;
    try {
        reply.text = data.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw PermanentInferenceError(role + ": response has no message content: " + e.what(), r.status);
    }
    if (data.contains("usage")) {
        reply.prompt_tokens = data["usage"].value("prompt_tokens", 0);
        reply.completion_tokens = data["usage"].value("completion_tokens", 0);
    }
    return reply;
}

OllamaClient::OllamaClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.base_url.empty() && cfg_.base_url.back() == '/') cfg_.base_url.pop_back();
}

InferenceReply OllamaClient::infer(const std::string& role, const std::string& prompt, const InferenceParams& params) {
    json body = {
        {"model", params.model.empty() ? cfg_.model : params.model},
        {"messages", build_messages(params.system_prompt, prompt)},
        {"stream", false},
        {"options", {{"temperature", params.temperature}, {"num_predict", params.max_tokens}}}
    };
    auto r = post(role, cfg_.base_url + "/api/chat", body, effective_timeout(cfg_, params), {}, params);
    check_status(role, r);
    auto data = parse_body(role, r);

    InferenceReply reply;
    if (data.contains("message")) reply.text = data["message"].value("content", std::string());
    else throw PermanentInferenceError(role + ": response has no message", r.status);
    reply.prompt_tokens = data.value("prompt_eval_count", 0);
    reply.completion_tokens = data.value("eval_count", 0);
    return reply;
}

std::shared_ptr<InferenceClient> make_inference_client(const LlmConfig& cfg) {
    if (cfg.provider == "openai") return std::make_shared<OpenAiCompatibleClient>(cfg);
    if (cfg.provider == "ollama") return std::make_shared<OllamaClient>(cfg);
    throw std::invalid_argument("unknown LLM provider: " + cfg.provider);
}
