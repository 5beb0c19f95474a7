#include "../include/app_config.hpp"
#include "../include/csv_data_provider.hpp"
#include "../include/file_sink.hpp"
#include "../include/roles.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>

using json = nlohmann::json;

namespace {
template <typename T>
void read(const json& obj, const char* key, T& out, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(where + "." + key + ": " + e.what());
    }
}

long env_long(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stol(v);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string("environment variable ") + key + " is not an integer: " + v);
    }
}

bool env_bool(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    std::string s = v;
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw ConfigurationError(std::string("environment variable ") + key + " is not a boolean: " + v);
}
}

void apply_config_file(AppConfig& cfg, const std::filesystem::path& path) {
    json j;
    try {
        j = json::parse(read_text_file(path));
    } catch (const std::exception& e) {
        throw ConfigurationError("cannot load config " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigurationError("config " + path.string() + " must be a JSON object");

    if (j.contains("llm")) {
        const auto& l = j["llm"];
        read(l, "provider", cfg.llm.provider, "llm");
        read(l, "base_url", cfg.llm.base_url, "llm");
        read(l, "model", cfg.llm.model, "llm");
        read(l, "api_key", cfg.llm.api_key, "llm");
        read(l, "timeout_ms", cfg.llm.timeout_ms, "llm");
        read(l, "temperature", cfg.temperature, "llm");
        read(l, "max_tokens", cfg.max_tokens, "llm");
        read(l, "system_prompt", cfg.system_prompt, "llm");
    }
    // Older layout: project.llm_models.main_llm.model_name
    if (j.contains("project") && j["project"].contains("llm_models") &&
        j["project"]["llm_models"].contains("main_llm")) {
        read(j["project"]["llm_models"]["main_llm"], "model_name", cfg.llm.model, "project.llm_models.main_llm");
    }
    if (j.contains("data")) {
        read(j["data"], "root_path", cfg.data_root, "data");
        read(j["data"], "mapping", cfg.dataset_mapping, "data");
    }
    if (j.contains("output")) {
        read(j["output"], "path", cfg.output_path, "output");
        read(j["output"], "results_db", cfg.results_db, "output");
    }
    if (j.contains("analysis")) {
        read(j["analysis"], "focus_areas", cfg.focus, "analysis");
        read(j["analysis"], "enable_charts", cfg.enable_charts, "analysis");
    }
    if (j.contains("orchestrator")) {
        const auto& o = j["orchestrator"];
        read(o, "max_concurrent", cfg.max_concurrent, "orchestrator");
        read(o, "max_retries", cfg.max_retries, "orchestrator");
        read(o, "base_delay_ms", cfg.base_delay_ms, "orchestrator");
        read(o, "max_delay_ms", cfg.max_delay_ms, "orchestrator");
        read(o, "task_timeout_ms", cfg.task_timeout_ms, "orchestrator");
    }
    if (j.contains("server")) read(j["server"], "port", cfg.server_port, "server");
    read(j, "log_level", cfg.log_level, "config");
}

void apply_environment(AppConfig& cfg) {
    cfg.llm.provider = getenv_or("LLM_PROVIDER", cfg.llm.provider);
    cfg.llm.base_url = getenv_or("LLM_BASE_URL", cfg.llm.base_url);
    cfg.llm.model = getenv_or("LLM_MODEL", cfg.llm.model);
    cfg.llm.api_key = getenv_or("SILICONFLOW_API_KEY", cfg.llm.api_key);
    cfg.llm.api_key = getenv_or("LLM_API_KEY", cfg.llm.api_key);
    cfg.llm.timeout_ms = env_long("LLM_TIMEOUT_MS", cfg.llm.timeout_ms);
    cfg.data_root = getenv_or("DATA_ROOT_PATH", cfg.data_root);
    cfg.dataset_mapping = getenv_or("DATA_MAPPING_CONFIG", cfg.dataset_mapping);
    cfg.output_path = getenv_or("OUTPUT_PATH", cfg.output_path);
    cfg.results_db = getenv_or("RESULTS_DB_PATH", cfg.results_db);
    cfg.max_concurrent = (int)env_long("MAX_CONCURRENT", cfg.max_concurrent);
    cfg.max_retries = (int)env_long("MAX_RETRIES", cfg.max_retries);
    cfg.task_timeout_ms = env_long("TASK_TIMEOUT_MS", cfg.task_timeout_ms);
    cfg.enable_charts = env_bool("ENABLE_CHARTS", cfg.enable_charts);
    cfg.server_port = (int)env_long("ORCHESTRATOR_PORT", cfg.server_port);
    cfg.log_level = getenv_or("LOG_LEVEL", cfg.log_level);
}

RunOptions make_run_options(const AppConfig& cfg) {
    RunOptions o;
    o.max_concurrent = cfg.max_concurrent;
    o.retry.max_retries = cfg.max_retries;
    o.retry.base_delay = std::chrono::milliseconds(cfg.base_delay_ms);
    o.retry.max_delay = std::chrono::milliseconds(cfg.max_delay_ms);
    o.task_timeout = std::chrono::milliseconds(cfg.task_timeout_ms);
    o.enable_charts = cfg.enable_charts;
    return o;
}

std::set<std::string> resolve_focus(const std::vector<std::string>& labels) {
    std::set<std::string> out;
    std::vector<std::string> unknown;
    for (const auto& l : labels) {
        auto role = role_for_focus(trim(l));
        if (role) out.insert(*role);
        else unknown.push_back(l);
    }
    if (!unknown.empty()) {
        std::string msg = "unknown focus area(s):";
        for (const auto& u : unknown) msg += " " + u;
        throw ConfigurationError(msg);
    }
    return out;
}

AnalysisRuntime build_runtime(const AppConfig& cfg, std::shared_ptr<InferenceClient> client) {
    AnalysisRuntime rt;
    if (!client) {
        try {
            client = make_inference_client(cfg.llm);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError(e.what());
        }
        if (cfg.llm.provider != "ollama" && cfg.llm.api_key.empty()) {
            log_warn("config", "no API key configured (SILICONFLOW_API_KEY)");
        }
    }

    RoleTuning tuning;
    tuning.system_prompt = cfg.system_prompt;
    tuning.temperature = cfg.temperature;
    tuning.max_tokens = cfg.max_tokens;

    json mapping;
    try {
        mapping = load_dataset_mapping(cfg.dataset_mapping);
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("dataset mapping: ") + e.what());
    }

    rt.setup.roles = default_roles(tuning);
    rt.setup.synthesis = report_role(tuning);
    rt.setup.client = std::move(client);
    rt.setup.data = std::make_shared<CsvDataProvider>(cfg.data_root, default_role_datasets(), mapping);

    std::vector<std::shared_ptr<ArtifactSink>> sinks;
    sinks.push_back(std::make_shared<FileArtifactSink>(cfg.output_path));
    if (!cfg.results_db.empty()) {
        try {
            rt.db = std::make_shared<SqliteArtifactSink>(cfg.results_db);
        } catch (const std::exception& e) {
            throw ConfigurationError(e.what());
        }
        sinks.push_back(rt.db);
    }
    rt.setup.sink = std::make_shared<FanoutSink>(std::move(sinks));
    return rt;
}
