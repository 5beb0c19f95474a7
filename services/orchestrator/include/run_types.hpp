#pragma once
#include "cancellation.hpp"
#include "errors.hpp"
#include "retry_policy.hpp"
#include "../../../shared/cpp/agent_sdk/include/inference_client.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class TaskState { Waiting, Ready, Running, Succeeded, Failed, Skipped };
enum class RunStatus { Pending, Running, Completed, CompletedWithErrors, Failed };

const char* to_string(TaskState s);
const char* to_string(RunStatus s);
bool is_terminal(TaskState s);

struct Prerequisite {
    std::string role;
    bool optional{false}; // dependent still runs if this one fails
};

struct AgentResult {
    std::string role;
    nlohmann::json content;
    std::chrono::system_clock::time_point produced_at{};
    std::chrono::milliseconds latency{0};
    int prompt_tokens{0};
    int completion_tokens{0};
    int attempt{1};
};

struct FailureRecord {
    std::string role;
    int attempt{0};
    ErrorClass cls{ErrorClass::PermanentInference};
    std::string message;
    std::chrono::system_clock::time_point at{};
};

// A role whose output is missing from some input payload.
struct OmittedInput {
    std::string role;
    TaskState state{TaskState::Failed};
    std::string reason;
};

struct TaskInput {
    std::string run_id;
    std::string role;
    std::optional<nlohmann::json> raw;  // from the data provider
    std::vector<AgentResult> upstream;  // declared order
    std::vector<OmittedInput> omitted;
    int attempt{1};
};

using PromptBuilder = std::function<std::string(const TaskInput&)>;
using ResponseParser = std::function<nlohmann::json(const std::string&)>;

// One agent, described as data.
struct RoleSpec {
    std::string role;
    std::string description;
    std::vector<Prerequisite> prerequisites;
    bool requires_input{false};
    PromptBuilder build_prompt;
    ResponseParser parse_response; // empty: {"text": reply}
    InferenceParams params;
};

struct ReportArtifact {
    std::string run_id;
    std::string role;
    nlohmann::json content;
    std::vector<AgentResult> upstream;
    std::vector<OmittedInput> omitted;
    std::chrono::system_clock::time_point produced_at{};
    std::chrono::milliseconds latency{0};
    int attempt{1};
};

struct RoleStatus {
    std::string role;
    TaskState state{TaskState::Waiting};
    int attempts{0};
    std::optional<FailureRecord> last_error;
};

using TransitionObserver = std::function<void(const std::string& role, TaskState from, TaskState to)>;

struct RunOptions {
    int max_concurrent{2};
    RetryPolicy retry;
    std::chrono::milliseconds task_timeout{120000};
    bool enable_charts{true};
    std::string run_id;              // empty: generated
    CancellationToken cancel;
    TransitionObserver on_transition; // serialized, in order, outside the scheduler lock
};

struct RunSummary {
    std::string run_id;
    RunStatus status{RunStatus::Pending};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::vector<std::string> selected_roles;
    std::vector<RoleStatus> roles;
    std::vector<FailureRecord> failures;
    std::vector<AgentResult> results;
    std::optional<ReportArtifact> report;
    int aggregation_attempts{0};
    int peak_concurrency{0};
    bool cancelled{false};
    bool enable_charts{true};
    std::vector<std::string> sink_errors;

    const RoleStatus* find_role(const std::string& role) const;
    const AgentResult* find_result(const std::string& role) const;
};

void to_json(nlohmann::json& j, const AgentResult& r);
void to_json(nlohmann::json& j, const FailureRecord& f);
void to_json(nlohmann::json& j, const OmittedInput& o);
void to_json(nlohmann::json& j, const ReportArtifact& r);
void to_json(nlohmann::json& j, const RoleStatus& s);
void to_json(nlohmann::json& j, const RunSummary& s);
