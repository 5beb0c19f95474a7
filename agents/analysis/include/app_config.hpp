#pragma once
#include "sqlite_sink.hpp"
#include "../../../services/orchestrator/include/orchestrator.hpp"
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct AppConfig {
    LlmConfig llm;
    std::string system_prompt{"You are a senior analyst of the new-energy-vehicle industry. "
                              "Base every statement on the data provided."};
    double temperature{0.1};
    int max_tokens{4000};

    std::string data_root{"data"};
    std::string dataset_mapping{"config/data_mapping.json"};
    std::string output_path{"output"};
    std::string results_db;            // empty: results are only written as files

    int max_concurrent{2};
    int max_retries{2};
    long base_delay_ms{1000};
    long max_delay_ms{30000};
    long task_timeout_ms{120000};
    bool enable_charts{true};
    std::vector<std::string> focus;    // empty: every role

    int server_port{7100};
    std::string log_level{"info"};
};

// Layers, lowest first: defaults, config file, environment, command line.
// Both functions throw ConfigurationError on malformed values.
void apply_config_file(AppConfig& cfg, const std::filesystem::path& path);
void apply_environment(AppConfig& cfg);

RunOptions make_run_options(const AppConfig& cfg);

// Maps focus labels onto roles. Throws ConfigurationError for unknown labels.
std::set<std::string> resolve_focus(const std::vector<std::string>& labels);

struct AnalysisRuntime {
    AnalysisSetup setup;
    std::shared_ptr<SqliteArtifactSink> db; // null when results_db is empty
};

// Wires roles, data, sinks and the inference client. A null client means one
// is created from cfg.llm.
AnalysisRuntime build_runtime(const AppConfig& cfg, std::shared_ptr<InferenceClient> client = nullptr);
