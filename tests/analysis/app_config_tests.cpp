#include <gtest/gtest.h>
#include "app_config.hpp"
#include "util.hpp"
#include "support/fake_inference_client.hpp"
#include "support/temp_dir.hpp"
#include <cstdlib>

using json = nlohmann::json;

namespace {
const char* const kEnvKeys[] = {
    "LLM_PROVIDER", "LLM_BASE_URL", "LLM_MODEL", "SILICONFLOW_API_KEY", "LLM_API_KEY", "LLM_TIMEOUT_MS",
    "DATA_ROOT_PATH", "DATA_MAPPING_CONFIG", "OUTPUT_PATH", "RESULTS_DB_PATH", "MAX_CONCURRENT", "MAX_RETRIES",
    "TASK_TIMEOUT_MS", "ENABLE_CHARTS", "ORCHESTRATOR_PORT", "LOG_LEVEL"
};
}

class AppConfigTests : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* k : kEnvKeys) unsetenv(k);
    }

    AppConfig config_for(const TempDir& dir) const {
        AppConfig cfg;
        cfg.data_root = (dir.path() / "data").string();
        cfg.dataset_mapping = (dir.path() / "mapping.json").string();
        cfg.output_path = (dir.path() / "output").string();
        cfg.max_concurrent = 3;
        cfg.base_delay_ms = 1;
        cfg.max_delay_ms = 2;
        cfg.task_timeout_ms = 2000;
        return cfg;
    }
};

// =============================================================================
// Layering
// =============================================================================

TEST_F(AppConfigTests, ConfigFile_OverridesDefaults) {
    TempDir dir;
    auto path = dir.write("analyst.json", R"({
        "llm": {"provider": "ollama", "base_url": "http://localhost:11434", "temperature": 0.4, "max_tokens": 2048},
        "project": {"llm_models": {"main_llm": {"model_name": "qwen2.5:14b"}}},
        "data": {"root_path": "/srv/nev", "mapping": "/srv/nev/mapping.json"},
        "output": {"path": "/tmp/out", "results_db": "/tmp/out/results.db"},
        "analysis": {"focus_areas": ["宏观经济", "财务"], "enable_charts": false},
        "orchestrator": {"max_concurrent": 4, "max_retries": 1, "task_timeout_ms": 60000},
        "server": {"port": 8088},
        "log_level": "debug"
    })");

    AppConfig cfg;
    apply_config_file(cfg, path);

    EXPECT_EQ(cfg.llm.provider, "ollama");
    EXPECT_EQ(cfg.llm.base_url, "http://localhost:11434");
    EXPECT_EQ(cfg.llm.model, "qwen2.5:14b");
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.4);
    EXPECT_EQ(cfg.max_tokens, 2048);
    EXPECT_EQ(cfg.data_root, "/srv/nev");
    EXPECT_EQ(cfg.results_db, "/tmp/out/results.db");
    EXPECT_EQ(cfg.focus, (std::vector<std::string>{"宏观经济", "财务"}));
    EXPECT_FALSE(cfg.enable_charts);
    EXPECT_EQ(cfg.max_concurrent, 4);
    EXPECT_EQ(cfg.max_retries, 1);
    EXPECT_EQ(cfg.task_timeout_ms, 60000);
    EXPECT_EQ(cfg.base_delay_ms, 1000);
    EXPECT_EQ(cfg.server_port, 8088);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(AppConfigTests, ConfigFile_BadInputThrowsConfigurationError) {
    TempDir dir;
    AppConfig cfg;
    EXPECT_THROW(apply_config_file(cfg, dir.path() / "missing.json"), ConfigurationError);
    EXPECT_THROW(apply_config_file(cfg, dir.write("broken.json", "{ not json")), ConfigurationError);
    EXPECT_THROW(apply_config_file(cfg, dir.write("list.json", "[]")), ConfigurationError);
    EXPECT_THROW(apply_config_file(cfg, dir.write("typed.json", R"({"orchestrator": {"max_concurrent": "two"}})")),
                 ConfigurationError);
    EXPECT_EQ(cfg.max_concurrent, 2);
}

TEST_F(AppConfigTests, Environment_OverridesFileValues) {
    AppConfig cfg;
    cfg.max_concurrent = 4;
    setenv("MAX_CONCURRENT", "6", 1);
    setenv("SILICONFLOW_API_KEY", "sk-silicon", 1);
    setenv("ENABLE_CHARTS", "false", 1);
    setenv("DATA_ROOT_PATH", "/data/nev", 1);
    apply_environment(cfg);

    EXPECT_EQ(cfg.max_concurrent, 6);
    EXPECT_EQ(cfg.llm.api_key, "sk-silicon");
    EXPECT_FALSE(cfg.enable_charts);
    EXPECT_EQ(cfg.data_root, "/data/nev");
    EXPECT_EQ(cfg.max_retries, 2);

    setenv("LLM_API_KEY", "sk-generic", 1);
    apply_environment(cfg);
    EXPECT_EQ(cfg.llm.api_key, "sk-generic");
}

TEST_F(AppConfigTests, Environment_MalformedValuesThrow) {
    AppConfig cfg;
    setenv("MAX_RETRIES", "three", 1);
    EXPECT_THROW(apply_environment(cfg), ConfigurationError);
    unsetenv("MAX_RETRIES");
    setenv("ENABLE_CHARTS", "maybe", 1);
    EXPECT_THROW(apply_environment(cfg), ConfigurationError);
}

TEST_F(AppConfigTests, RunOptions_CarryOrchestratorSettings) {
    AppConfig cfg;
    cfg.max_concurrent = 5;
    cfg.max_retries = 0;
    cfg.base_delay_ms = 250;
    cfg.max_delay_ms = 4000;
    cfg.task_timeout_ms = 9000;
    cfg.enable_charts = false;
    auto o = make_run_options(cfg);
    EXPECT_EQ(o.max_concurrent, 5);
    EXPECT_EQ(o.retry.max_retries, 0);
    EXPECT_EQ(o.retry.base_delay.count(), 250);
    EXPECT_EQ(o.retry.max_delay.count(), 4000);
    EXPECT_EQ(o.task_timeout.count(), 9000);
    EXPECT_FALSE(o.enable_charts);
}

TEST_F(AppConfigTests, Focus_MapsLabelsAndRejectsUnknown) {
    EXPECT_EQ(resolve_focus({"宏观经济", " finance ", "MarketAgent"}),
              (std::set<std::string>{"finance", "macro", "market"}));
    EXPECT_TRUE(resolve_focus({}).empty());
    try {
        resolve_focus({"macro", "weather", "sports"});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("weather sports"), std::string::npos);
    }
}

// =============================================================================
// Runtime
// =============================================================================

TEST_F(AppConfigTests, Runtime_UnknownProviderIsConfigurationError) {
    TempDir dir;
    auto cfg = config_for(dir);
    cfg.llm.provider = "bard";
    EXPECT_THROW(build_runtime(cfg), ConfigurationError);
}

TEST_F(AppConfigTests, Runtime_BadMappingIsConfigurationError) {
    TempDir dir;
    auto cfg = config_for(dir);
    dir.write("mapping.json", "\"gdp.csv\"");
    EXPECT_THROW(build_runtime(cfg, std::make_shared<FakeInferenceClient>()), ConfigurationError);
}

TEST_F(AppConfigTests, Runtime_WiresRolesAndOptionalDatabase) {
    TempDir dir;
    auto cfg = config_for(dir);
    auto rt = build_runtime(cfg, std::make_shared<FakeInferenceClient>());
    EXPECT_EQ(rt.setup.roles.size(), 5u);
    EXPECT_EQ(rt.setup.synthesis.role, "report");
    EXPECT_TRUE(rt.setup.data != nullptr);
    EXPECT_TRUE(rt.setup.sink != nullptr);
    EXPECT_TRUE(rt.db == nullptr);

    cfg.results_db = (dir.path() / "results.db").string();
    EXPECT_TRUE(build_runtime(cfg, std::make_shared<FakeInferenceClient>()).db != nullptr);
}

TEST_F(AppConfigTests, Runtime_FullRunWritesArtifacts) {
    TempDir dir;
    for (const char* f : {"gdp.csv", "cpi.csv", "industry_data.csv", "company_data.csv",
                          "production_data.csv", "charging_data.csv"}) {
        dir.write(std::string("data/") + f, "year,value\n2022,1\n2023,2\n");
    }
    auto cfg = config_for(dir);
    cfg.results_db = (dir.path() / "results.db").string();
    auto client = std::make_shared<FakeInferenceClient>();
    auto rt = build_runtime(cfg, client);

    auto summary = run_analysis(rt.setup, {}, make_run_options(cfg));

    EXPECT_EQ(summary.status, RunStatus::Completed);
    EXPECT_EQ(summary.results.size(), 5u);
    EXPECT_NE(client->prompts("macro").at(0).find("gdp.csv: 2 rows"), std::string::npos);
    auto run_dir = dir.path() / "output" / summary.run_id;
    EXPECT_EQ(read_text_file(run_dir / "report.md"), "report output");
    EXPECT_TRUE(std::filesystem::exists(run_dir / "forecast_results.json"));
    EXPECT_TRUE(std::filesystem::exists(run_dir / "analysis_summary.md"));
    EXPECT_EQ(rt.db->load_report(summary.run_id), std::optional<std::string>("report output"));
}

TEST_F(AppConfigTests, Runtime_MissingDataDegradesDependentRoles) {
    TempDir dir;
    dir.write("data/GDP_2015_2024.csv", "year,gdp\n2022,120\n2023,126\n");
    dir.write("mapping.json", R"({"gdp.csv": "GDP_2015_2024.csv"})");
    auto cfg = config_for(dir);
    auto client = std::make_shared<FakeInferenceClient>();
    auto rt = build_runtime(cfg, client);

    auto summary = run_analysis(rt.setup, {}, make_run_options(cfg));

    EXPECT_EQ(summary.status, RunStatus::CompletedWithErrors);
    EXPECT_EQ(summary.find_role("macro")->state, TaskState::Succeeded);
    EXPECT_EQ(summary.find_role("policy")->state, TaskState::Succeeded);
    EXPECT_EQ(summary.find_role("finance")->state, TaskState::Failed);
    EXPECT_EQ(summary.find_role("finance")->last_error->cls, ErrorClass::InputUnavailable);
    EXPECT_EQ(summary.find_role("forecast")->state, TaskState::Skipped);
    EXPECT_EQ(client->calls("finance"), 0);
    ASSERT_TRUE(summary.report.has_value());
    EXPECT_EQ(summary.report->upstream.size(), 2u);
}
