#include "../include/run_types.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"

using json = nlohmann::json;

const char* to_string(TaskState s) {
    switch (s) {
        case TaskState::Waiting: return "waiting";
        case TaskState::Ready: return "ready";
        case TaskState::Running: return "running";
        case TaskState::Succeeded: return "succeeded";
        case TaskState::Failed: return "failed";
        case TaskState::Skipped: return "skipped";
    }
    return "unknown";
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::CompletedWithErrors: return "completed_with_errors";
        case RunStatus::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(TaskState s) {
    return s == TaskState::Succeeded || s == TaskState::Failed || s == TaskState::Skipped;
}

const RoleStatus* RunSummary::find_role(const std::string& role) const {
    for (const auto& r : roles) if (r.role == role) return &r;
    return nullptr;
}

const AgentResult* RunSummary::find_result(const std::string& role) const {
    for (const auto& r : results) if (r.role == role) return &r;
    return nullptr;
}

void to_json(json& j, const AgentResult& r) {
    j = json{
        {"role", r.role},
        {"content", r.content},
        {"produced_at", format_utc(r.produced_at)},
        {"latency_ms", r.latency.count()},
        {"prompt_tokens", r.prompt_tokens},
        {"completion_tokens", r.completion_tokens},
        {"attempt", r.attempt}
    };
}

void to_json(json& j, const FailureRecord& f) {
    j = json{
        {"role", f.role},
        {"attempt", f.attempt},
        {"error_class", to_string(f.cls)},
        {"message", f.message},
        {"at", format_utc(f.at)}
    };
}

void to_json(json& j, const OmittedInput& o) {
    j = json{{"role", o.role}, {"state", to_string(o.state)}, {"reason", o.reason}};
}

void to_json(json& j, const ReportArtifact& r) {
    json sources = json::array();
    for (const auto& u : r.upstream) sources.push_back(u.role);
    j = json{
        {"run_id", r.run_id},
        {"role", r.role},
        {"content", r.content},
        {"sources", sources},
        {"upstream", r.upstream},
        {"omitted", r.omitted},
        {"produced_at", format_utc(r.produced_at)},
        {"latency_ms", r.latency.count()},
        {"attempt", r.attempt}
    };
}

void to_json(json& j, const RoleStatus& s) {
    j = json{{"role", s.role}, {"state", to_string(s.state)}, {"attempts", s.attempts}};
    j["last_error"] = s.last_error ? json(*s.last_error) : json(nullptr);
}

void to_json(json& j, const RunSummary& s) {
    j = json{
        {"run_id", s.run_id},
        {"status", to_string(s.status)},
        {"started_at", format_utc(s.started_at)},
        {"finished_at", format_utc(s.finished_at)},
        {"selected_roles", s.selected_roles},
        {"roles", s.roles},
        {"failures", s.failures},
        {"aggregation_attempts", s.aggregation_attempts},
        {"peak_concurrency", s.peak_concurrency},
        {"cancelled", s.cancelled},
        {"enable_charts", s.enable_charts},
        {"report_available", s.report.has_value()},
        {"sink_errors", s.sink_errors}
    };
}
