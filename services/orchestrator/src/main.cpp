#include <iostream>
#include <string>
#include <map>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <filesystem>
#include <microhttpd.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "../include/orchestrator.hpp"
#include "../include/run_registry.hpp"
#include "../../../agents/analysis/include/app_config.hpp"
#include "../../../agents/analysis/include/roles.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

using json = nlohmann::json;

static AppConfig g_config;
static AnalysisRuntime g_runtime;
static RunRegistry g_runs;
static RunThreads g_run_threads;
static std::atomic<bool> g_stop{false};
static int g_max_active_runs = 4;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult send_error(struct MHD_Connection* conn, int status, const std::string& msg) {
    return send_response(conn, status, json({{"error", msg}}).dump());
}

static json entry_json(const RunEntry& e, bool full) {
    json j = {
        {"run_id", e.id},
        {"status", to_string(e.status)},
        {"roles", e.roles},
        {"submitted_at", format_utc(e.submitted_at)},
        {"cancel_requested", e.cancel.cancelled()}
    };
    if (!e.error.empty()) j["error"] = e.error;
    if (e.summary) {
        if (full) j["summary"] = *e.summary;
        else j["report_available"] = e.summary->report.has_value();
    }
    return j;
}

static json roles_json() {
    json arr = json::array();
    for (const auto& r : g_runtime.setup.roles) {
        json prereq = json::array();
        for (const auto& p : r.prerequisites) prereq.push_back({{"role", p.role}, {"optional", p.optional}});
        arr.push_back({{"role", r.role}, {"name", display_name(r.role)}, {"description", r.description},
                       {"prerequisites", prereq}, {"requires_input", r.requires_input}});
    }
    return {{"roles", arr}, {"synthesis", g_runtime.setup.synthesis.role}};
}

static void execute_run(std::string id, std::set<std::string> selected, RunOptions opts) {
    g_runs.mark_running(id);
    try {
        auto summary = run_analysis(g_runtime.setup, selected, opts);
        g_runs.complete(id, std::move(summary));
    } catch (const std::exception& e) {
        log_error("server", id + ": " + e.what());
        g_runs.fail(id, e.what());
    }
}

static MhdResult submit_run(struct MHD_Connection* connection, const std::string& body) {
    json j = body.empty() ? json::object() : json::parse(body);
    if (!j.is_object()) return send_error(connection, MHD_HTTP_BAD_REQUEST, "request body must be a JSON object");

    RunOptions opts = make_run_options(g_config);
    std::set<std::string> selected;
    std::vector<std::string> roles;
    try {
        opts.run_id = j.contains("run_id") ? j["run_id"].get<std::string>() : make_run_id();
        selected = resolve_focus(j.value("focus", g_config.focus));
        opts.max_concurrent = j.value("max_concurrent", opts.max_concurrent);
        opts.retry.max_retries = j.value("max_retries", opts.retry.max_retries);
        opts.task_timeout = std::chrono::milliseconds(j.value("task_timeout_ms", (long)opts.task_timeout.count()));
        opts.enable_charts = j.value("enable_charts", opts.enable_charts);
        validate(opts);
        roles = resolve_selection(g_runtime.setup, selected);
    } catch (const ConfigurationError& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    }

    if (g_runs.snapshot().active.size() >= (std::size_t)g_max_active_runs) {
        return send_error(connection, MHD_HTTP_TOO_MANY_REQUESTS, "too many active runs");
    }
    const std::string id = opts.run_id;
    RunEntry entry;
    try {
        entry = g_runs.submit(id, roles);
    } catch (const std::invalid_argument& e) {
        return send_error(connection, MHD_HTTP_CONFLICT, e.what());
    }
    opts.cancel = entry.cancel;
    g_run_threads.start([id, selected, opts]{ execute_run(id, selected, opts); });
    log_info("server", "accepted run " + id);
    return send_response(connection, MHD_HTTP_ACCEPTED, entry_json(entry, false).dump());
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    try {
        if (ci->method == "POST" && path == "/runs") {
            return submit_run(connection, ci->body);
        }
        if (ci->method == "GET" && path == "/runs") {
            auto s = g_runs.snapshot();
            json active = json::array();
            json finished = json::array();
            for (const auto& e : s.active) active.push_back(entry_json(e, false));
            for (auto it = s.finished.rbegin(); it != s.finished.rend(); ++it) finished.push_back(entry_json(*it, false));
            json out = {{"active", active}, {"finished", finished}};
            if (g_runtime.db) {
                json stored = json::array();
                for (const auto& r : g_runtime.db->list_runs()) {
                    stored.push_back({{"run_id", r.run_id}, {"status", r.status}, {"started_at", r.started_at},
                                      {"finished_at", r.finished_at}, {"result_count", r.result_count},
                                      {"report_available", r.has_report}});
                }
                out["stored"] = stored;
            }
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        if (ci->method == "GET" && path == "/roles") {
            return send_response(connection, MHD_HTTP_OK, roles_json().dump());
        }
        if (path.rfind("/runs/", 0) == 0) {
            std::string rest = path.substr(std::string("/runs/").size());
            std::string id = rest;
            std::string action;
            auto slash = rest.find('/');
            if (slash != std::string::npos) {
                id = rest.substr(0, slash);
                action = rest.substr(slash + 1);
            }
            if (id.empty()) return send_error(connection, MHD_HTTP_BAD_REQUEST, "run id required");

            if (ci->method == "POST" && action == "cancel") {
                if (g_runs.cancel(id)) {
                    log_info("server", "cancellation requested for " + id);
                    return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
                }
                if (g_runs.get(id)) return send_error(connection, MHD_HTTP_CONFLICT, "run already finished");
                return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown run");
            }
            if (ci->method == "GET" && action.empty()) {
                if (auto e = g_runs.get(id)) return send_response(connection, MHD_HTTP_OK, entry_json(*e, true).dump());
                if (g_runtime.db) {
                    if (auto s = g_runtime.db->load_summary(id)) {
                        json out = {{"run_id", id}, {"status", s->value("status", std::string())}, {"summary", *s}};
                        return send_response(connection, MHD_HTTP_OK, out.dump());
                    }
                }
                return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown run");
            }
            if (ci->method == "GET" && action == "report") {
                auto e = g_runs.get(id);
                if (e && e->summary && e->summary->report) {
                    const auto& c = e->summary->report->content;
                    std::string md = c.is_object() && c.contains("report_content") && c["report_content"].is_string()
                        ? c["report_content"].get<std::string>() : c.dump(2);
                    return send_response(connection, MHD_HTTP_OK, md, "text/markdown; charset=utf-8");
                }
                if (g_runtime.db) {
                    if (auto md = g_runtime.db->load_report(id)) {
                        return send_response(connection, MHD_HTTP_OK, *md, "text/markdown; charset=utf-8");
                    }
                }
                return send_error(connection, MHD_HTTP_NOT_FOUND, "no report for run");
            }
        }
        return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
    } catch (const std::exception& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    }
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string env_path = ".env";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "--env" && i + 1 < argc) env_path = argv[++i];
        else if (a == "--port" && i + 1 < argc) setenv("ORCHESTRATOR_PORT", argv[++i], 1);
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    try {
        load_env_file(env_path);
        if (!config_path.empty()) apply_config_file(g_config, config_path);
        else if (std::filesystem::exists("config/analyst.json")) apply_config_file(g_config, "config/analyst.json");
        apply_environment(g_config);
        set_log_level(parse_log_level(g_config.log_level));
        validate(make_run_options(g_config));
        g_max_active_runs = getenv_int_or("MAX_ACTIVE_RUNS", g_max_active_runs);
        g_runtime = build_runtime(g_config);
    } catch (const std::exception& e) {
        std::cerr << "[server] configuration: " << e.what() << std::endl;
        curl_global_cleanup();
        return 2;
    }

    int port = g_config.server_port;
    std::cout << "[server] Starting HTTP server on port " << port << "...\n";
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, port, nullptr, nullptr,
                                            &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[server] Failed to start HTTP server" << std::endl;
        curl_global_cleanup();
        return 1;
    }
    std::signal(SIGINT, [](int){ g_stop = true; });
    std::signal(SIGTERM, [](int){ g_stop = true; });
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "[server] Shutting down\n";
    MHD_stop_daemon(d);
    std::size_t n = g_runs.cancel_all();
    if (n) log_info("server", "cancelled " + std::to_string(n) + " active run(s)");
    g_run_threads.join_all();
    curl_global_cleanup();
    return 0;
}
