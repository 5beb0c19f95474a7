#include "../include/app_config.hpp"
#include "../include/roles.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <curl/curl.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

static std::atomic<bool> g_interrupted{false};

static void usage() {
    std::cerr << "analyst_cli usage:\n"
              << "  analyst_cli [--config <file.json>] [--env <.env>] [--focus <role|label>]...\n"
              << "              [--data-root <dir>] [--mapping <file.json>] [--output <dir>] [--db <sqlite>]\n"
              << "              [--provider openai|ollama] [--base-url <url>] [--model <name>]\n"
              << "              [--max-concurrent N] [--max-retries N] [--timeout-ms N] [--no-charts]\n"
              << "              [--log-level debug|info|warn|error]\n"
              << "  analyst_cli --list-roles\n"
              << "Focus labels: macro finance market policy forecast (or 宏观经济 财务 市场 政策 预测)\n";
}

static int to_int(const std::string& flag, const std::string& v) {
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects an integer, got " + v);
    }
}

static void list_roles() {
    for (const auto& r : default_roles()) {
        std::cout << r.role << " - " << display_name(r.role) << "\n    " << r.description << "\n";
        if (!r.prerequisites.empty()) {
            std::cout << "    needs:";
            for (const auto& p : r.prerequisites) std::cout << " " << p.role << (p.optional ? " (optional)" : "");
            std::cout << "\n";
        }
    }
    auto report = report_role();
    std::cout << report.role << " - " << display_name(report.role) << " (always runs last)\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string env_path = ".env";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") { usage(); return 0; }
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "--env" && i + 1 < argc) env_path = argv[++i];
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = 1;
    try {
        load_env_file(env_path);

        AppConfig cfg;
        if (!config_path.empty()) apply_config_file(cfg, config_path);
        else if (std::filesystem::exists("config/analyst.json")) apply_config_file(cfg, "config/analyst.json");
        apply_environment(cfg);

        bool list_only = false;
        std::vector<std::string> focus;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            bool has_value = i + 1 < argc;
            if ((a == "--config" || a == "--env") && has_value) ++i;
            else if (a == "--focus" && has_value) focus.push_back(argv[++i]);
            else if (a == "--data-root" && has_value) cfg.data_root = argv[++i];
            else if (a == "--mapping" && has_value) cfg.dataset_mapping = argv[++i];
            else if (a == "--output" && has_value) cfg.output_path = argv[++i];
            else if (a == "--db" && has_value) cfg.results_db = argv[++i];
            else if (a == "--provider" && has_value) cfg.llm.provider = argv[++i];
            else if (a == "--base-url" && has_value) cfg.llm.base_url = argv[++i];
            else if (a == "--model" && has_value) cfg.llm.model = argv[++i];
            else if (a == "--max-concurrent" && has_value) cfg.max_concurrent = to_int(a, argv[++i]);
            else if (a == "--max-retries" && has_value) cfg.max_retries = to_int(a, argv[++i]);
            else if (a == "--timeout-ms" && has_value) cfg.task_timeout_ms = to_int(a, argv[++i]);
            else if (a == "--no-charts") cfg.enable_charts = false;
            else if (a == "--log-level" && has_value) cfg.log_level = argv[++i];
            else if (a == "--list-roles") list_only = true;
            else { usage(); curl_global_cleanup(); return 2; }
        }
        if (!focus.empty()) cfg.focus = focus;
        set_log_level(parse_log_level(cfg.log_level));

        if (list_only) {
            list_roles();
            curl_global_cleanup();
            return 0;
        }

        auto rt = build_runtime(cfg);
        auto selected = resolve_focus(cfg.focus);
        RunOptions opts = make_run_options(cfg);

        std::signal(SIGINT, [](int){ g_interrupted = true; });
        std::signal(SIGTERM, [](int){ g_interrupted = true; });
        std::atomic<bool> done{false};
        CancellationToken token = opts.cancel;
        std::thread watcher([&]{
            while (!done) {
                if (g_interrupted) {
                    log_warn("cli", "interrupted, cancelling run");
                    token.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        RunSummary summary;
        try {
            summary = run_analysis(rt.setup, selected, opts);
        } catch (...) {
            done = true;
            watcher.join();
            throw;
        }
        done = true;
        watcher.join();

        std::cout << "\n==== Run " << summary.run_id << ": " << to_string(summary.status) << " ====\n";
        for (const auto& r : summary.roles) {
            std::cout << "  " << r.role << ": " << to_string(r.state) << " (attempts " << r.attempts << ")";
            if (r.last_error) std::cout << " " << to_string(r.last_error->cls) << ": " << r.last_error->message;
            std::cout << "\n";
        }
        if (summary.report) {
            std::cout << "  report: " << (std::filesystem::path(cfg.output_path) / summary.run_id / "report.md").string()
                      << "\n";
        }
        for (const auto& e : summary.sink_errors) std::cerr << "[WARN] not persisted: " << e << "\n";
        rc = summary.status == RunStatus::Failed ? 1 : 0;
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] configuration: " << e.what() << "\n";
        rc = 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
