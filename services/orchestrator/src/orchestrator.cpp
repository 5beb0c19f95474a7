#include "../include/orchestrator.hpp"
#include "../include/aggregator.hpp"
#include "../include/result_store.hpp"
#include "../include/scheduler.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <cstdint>
#include <cstdio>
#include <random>

namespace {
std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) out += (out.empty() ? "" : ", ") + s;
    return out;
}

template <typename Fn>
void emit(RunSummary& summary, const std::string& what, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        summary.sink_errors.push_back(what + ": " + e.what());
        log_error("orchestrator", summary.run_id + ": failed to persist " + what + ": " + e.what());
    }
}
}

void validate(const RunOptions& options) {
    if (!options.run_id.empty() && !is_safe_name(options.run_id)) {
        throw ConfigurationError("run_id may only contain letters, digits, '-' and '_'");
    }
    if (options.max_concurrent < 1) throw ConfigurationError("max_concurrent must be at least 1");
    if (options.retry.max_retries < 0) throw ConfigurationError("max_retries must not be negative");
    if (options.task_timeout.count() <= 0) throw ConfigurationError("task_timeout must be positive");
    if (options.retry.base_delay.count() < 0) throw ConfigurationError("base_delay must not be negative");
    if (options.retry.max_delay < options.retry.base_delay) {
        throw ConfigurationError("max_delay must not be smaller than base_delay");
    }
}

void validate(const AnalysisSetup& setup) {
    if (!setup.client) throw ConfigurationError("no inference client configured");
    if (setup.roles.empty()) throw ConfigurationError("no roles declared");
    for (const auto& r : setup.roles) {
        if (!r.build_prompt) throw ConfigurationError("role " + r.role + " has no prompt builder");
    }
    if (setup.synthesis.role.empty()) throw ConfigurationError("synthesis role has no name");
    if (!setup.synthesis.build_prompt) throw ConfigurationError("synthesis role has no prompt builder");
    for (const auto& r : setup.roles) {
        if (r.role == setup.synthesis.role) {
            throw ConfigurationError("synthesis role " + r.role + " is also declared as a domain role");
        }
    }
}

DependencyGraph build_graph(const std::vector<RoleSpec>& roles) {
    std::vector<RoleNode> nodes;
    nodes.reserve(roles.size());
    for (const auto& r : roles) nodes.push_back({r.role, r.prerequisites});
    return DependencyGraph(std::move(nodes));
}

std::vector<std::string> resolve_selection(const AnalysisSetup& setup, const std::set<std::string>& selected) {
    DependencyGraph graph = build_graph(setup.roles);
    if (selected.empty()) return graph.roles();

    std::vector<std::string> unknown;
    for (const auto& r : selected) if (!graph.contains(r)) unknown.push_back(r);
    if (!unknown.empty()) throw ConfigurationError("unknown role(s): " + join(unknown));

    auto roles = graph.closure(selected);
    if (roles.size() > selected.size()) {
        std::vector<std::string> added;
        for (const auto& r : roles) if (!selected.count(r)) added.push_back(r);
        log_info("orchestrator", "adding prerequisite role(s) " + join(added));
    }
    return roles;
}

std::string make_run_id() {
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<uint32_t> dist;
    char suffix[9];
    snprintf(suffix, sizeof(suffix), "%08x", (unsigned)dist(rng));
    return format_compact(std::chrono::system_clock::now()) + "-" + suffix;
}

RunSummary run_analysis(const AnalysisSetup& setup, const std::set<std::string>& selected,
                        const RunOptions& options) {
    validate(options);
    validate(setup);
    auto roles = resolve_selection(setup, selected);
    DependencyGraph graph = build_graph(setup.roles).subgraph(roles);

    RunSummary summary;
    summary.run_id = options.run_id.empty() ? make_run_id() : options.run_id;
    summary.started_at = std::chrono::system_clock::now();
    summary.status = RunStatus::Running;
    summary.selected_roles = roles;
    summary.enable_charts = options.enable_charts;
    log_info("orchestrator", summary.run_id + ": run started for " + join(roles));

    ResultStore store(summary.run_id);
    Scheduler scheduler(summary.run_id, graph, setup.roles, setup.client, setup.data, store, options);
    scheduler.run();

    bool all_succeeded = true;
    std::vector<OmittedInput> missing;
    for (const auto& t : scheduler.tasks()) {
        summary.roles.push_back({t.role, t.state, t.attempts, t.last_error});
        if (t.state != TaskState::Succeeded) {
            all_succeeded = false;
            missing.push_back({t.role, t.state, t.last_error ? t.last_error->message : std::string()});
        }
    }
    summary.failures = scheduler.failures();
    summary.peak_concurrency = scheduler.peak_concurrency();

    ResultSnapshot snapshot = store.snapshot(graph.roles());
    summary.results = snapshot.results;
    if (setup.sink) {
        for (const auto& r : summary.results) {
            emit(summary, "result " + r.role, [&]{ setup.sink->write_result(summary.run_id, r); });
        }
    }

    if (options.cancel.cancelled()) {
        summary.cancelled = true;
        summary.status = RunStatus::Failed;
        log_warn("orchestrator", summary.run_id + ": run cancelled, aggregation not attempted");
    } else {
        Aggregator aggregator(setup.synthesis, setup.client, options);
        auto outcome = aggregator.aggregate(snapshot, missing);
        summary.aggregation_attempts = outcome.attempts;
        summary.failures.insert(summary.failures.end(), outcome.failures.begin(), outcome.failures.end());
        summary.cancelled = options.cancel.cancelled();
        if (outcome.report) {
            summary.report = std::move(outcome.report);
            summary.status = all_succeeded ? RunStatus::Completed : RunStatus::CompletedWithErrors;
        } else {
            summary.status = RunStatus::Failed;
        }
    }
    summary.finished_at = std::chrono::system_clock::now();

    if (setup.sink) {
        if (summary.report) emit(summary, "report", [&]{ setup.sink->write_report(summary.run_id, *summary.report); });
        emit(summary, "summary", [&]{ setup.sink->write_summary(summary); });
    }

    log_info("orchestrator", summary.run_id + ": run finished with status " + to_string(summary.status) + " (" +
             std::to_string(summary.results.size()) + "/" + std::to_string(roles.size()) + " roles succeeded)");
    return summary;
}
