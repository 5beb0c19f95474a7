#include <gtest/gtest.h>
#include "report_summary.hpp"
#include "roles.hpp"

using json = nlohmann::json;

namespace {
const RoleSpec& find(const std::vector<RoleSpec>& roles, const std::string& name) {
    for (const auto& r : roles) if (r.role == name) return r;
    throw std::runtime_error("missing role " + name);
}

AgentResult result(const std::string& role, json content) {
    AgentResult r;
    r.role = role;
    r.content = std::move(content);
    return r;
}
}

// =============================================================================
// Role table
// =============================================================================

TEST(RolesTests, DefaultRoles_DeclareFiveDomainRoles) {
    auto roles = default_roles();
    ASSERT_EQ(roles.size(), 5u);
    EXPECT_EQ(roles[0].role, "macro");
    EXPECT_EQ(roles[4].role, "forecast");
    for (const auto& r : roles) {
        EXPECT_TRUE(static_cast<bool>(r.build_prompt)) << r.role;
        EXPECT_TRUE(static_cast<bool>(r.parse_response)) << r.role;
    }
}

TEST(RolesTests, Forecast_NeedsMacroAndFinanceAndUsesMarketWhenAvailable) {
    auto roles = default_roles();
    const auto& f = find(roles, "forecast");
    ASSERT_EQ(f.prerequisites.size(), 3u);
    EXPECT_EQ(f.prerequisites[0].role, "macro");
    EXPECT_FALSE(f.prerequisites[0].optional);
    EXPECT_EQ(f.prerequisites[1].role, "finance");
    EXPECT_FALSE(f.prerequisites[1].optional);
    EXPECT_EQ(f.prerequisites[2].role, "market");
    EXPECT_TRUE(f.prerequisites[2].optional);
    EXPECT_FALSE(f.requires_input);
    EXPECT_TRUE(find(roles, "macro").requires_input);
}

TEST(RolesTests, Tuning_ReachesInferenceParams) {
    RoleTuning t;
    t.model = "Qwen/Qwen2.5-72B-Instruct";
    t.temperature = 0.3;
    t.max_tokens = 1234;
    for (const auto& r : default_roles(t)) {
        EXPECT_EQ(r.params.model, t.model);
        EXPECT_DOUBLE_EQ(r.params.temperature, 0.3);
        EXPECT_EQ(r.params.max_tokens, 1234);
    }
    EXPECT_EQ(report_role(t).params.model, t.model);
}

TEST(RolesTests, RoleForFocus_AcceptsNamesAndLabels) {
    EXPECT_EQ(role_for_focus("macro"), std::optional<std::string>("macro"));
    EXPECT_EQ(role_for_focus("宏观经济"), std::optional<std::string>("macro"));
    EXPECT_EQ(role_for_focus("财务"), std::optional<std::string>("finance"));
    EXPECT_EQ(role_for_focus("市场"), std::optional<std::string>("market"));
    EXPECT_EQ(role_for_focus("政策"), std::optional<std::string>("policy"));
    EXPECT_EQ(role_for_focus("预测"), std::optional<std::string>("forecast"));
    EXPECT_EQ(role_for_focus("ForecastAgent"), std::optional<std::string>("forecast"));
    EXPECT_FALSE(role_for_focus("weather").has_value());
    EXPECT_FALSE(role_for_focus("report").has_value());
}

TEST(RolesTests, DatasetsCoverEveryDomainRole) {
    auto datasets = default_role_datasets();
    for (const auto& r : default_roles()) {
        ASSERT_TRUE(datasets.count(r.role)) << r.role;
        EXPECT_FALSE(datasets[r.role].empty());
    }
    EXPECT_EQ(datasets["macro"], (std::vector<std::string>{"gdp.csv", "cpi.csv"}));
}

// =============================================================================
// Prompts and responses
// =============================================================================

TEST(RolesTests, StripCodeFence_RemovesFenceAndReasoning) {
    EXPECT_EQ(strip_code_fence("```json\n{\"a\": 1}\n```"), "{\"a\": 1}");
    EXPECT_EQ(strip_code_fence("<think>let me see</think>\n\nanswer"), "answer");
    EXPECT_EQ(strip_code_fence("  plain  "), "plain");
}

TEST(RolesTests, ParseStructured_JsonKeepsFieldsAndFillsDefaults) {
    auto j = parse_structured_response("```json\n{\"macro_summary\": \"steady\", \"key_insights\": [\"x\"]}\n```",
                                       "macro_summary",
                                       {{"key_insights", json::array()}, {"macro_corr_matrix", json::object()}});
    EXPECT_EQ(j["macro_summary"], "steady");
    EXPECT_EQ(j["key_insights"], json::array({"x"}));
    EXPECT_TRUE(j["macro_corr_matrix"].is_object());
}

TEST(RolesTests, ParseStructured_PlainTextBecomesSummary) {
    auto j = parse_structured_response("Sales doubled.", "market_trend_summary", {{"market_forecast", ""}});
    EXPECT_EQ(j["market_trend_summary"], "Sales doubled.");
    EXPECT_EQ(j["market_forecast"], "");
}

TEST(RolesTests, DomainPrompt_IncludesDataAndRequestedFields) {
    auto roles = default_roles();
    TaskInput in;
    in.role = "macro";
    in.raw = json{{"datasets", json::array({json{{"dataset", "gdp.csv"}, {"summary", "gdp.csv: 10 rows"}}})},
                  {"missing", json::array({"cpi.csv"})}};
    auto prompt = find(roles, "macro").build_prompt(in);
    EXPECT_NE(prompt.find("gdp.csv: 10 rows"), std::string::npos);
    EXPECT_NE(prompt.find("cpi.csv"), std::string::npos);
    EXPECT_NE(prompt.find("macro_summary"), std::string::npos);
    EXPECT_NE(prompt.find("macro_corr_matrix"), std::string::npos);
}

TEST(RolesTests, ForecastPrompt_MentionsUpstreamAndOmissions) {
    auto roles = default_roles();
    TaskInput in;
    in.role = "forecast";
    in.upstream.push_back(result("macro", {{"macro_summary", "GDP is growing"}}));
    in.omitted.push_back({"market", TaskState::Failed, "optional prerequisite failed"});
    auto prompt = find(roles, "forecast").build_prompt(in);
    EXPECT_NE(prompt.find("GDP is growing"), std::string::npos);
    EXPECT_NE(prompt.find("market (failed)"), std::string::npos);
}

TEST(RolesTests, ReportRole_BuildsSectionsAndParsesMarkdown) {
    auto report = report_role();
    EXPECT_EQ(report.role, kReportRole);
    TaskInput in;
    in.role = report.role;
    in.upstream.push_back(result("finance", {{"finance_summary", "Margins improved"}, {"key_insights", {"ROE up"}}}));
    in.omitted.push_back({"macro", TaskState::Failed, "timeout"});
    auto prompt = report.build_prompt(in);
    EXPECT_NE(prompt.find("Margins improved"), std::string::npos);
    EXPECT_NE(prompt.find("- ROE up"), std::string::npos);
    EXPECT_NE(prompt.find(display_name("macro")), std::string::npos);

    auto content = report.parse_response("```markdown\n# Report\nbody\n```");
    EXPECT_EQ(content["report_content"], "# Report\nbody");
    EXPECT_EQ(content["report_type"], "markdown");
}

// =============================================================================
// Key insights
// =============================================================================

TEST(RolesTests, KeyInsights_PrefersInsightArrayCappedAtFive) {
    auto r = result("macro", {{"key_insights", {"a1", "a2", "a3", "a4", "a5", "a6"}}, {"macro_summary", "ignored."}});
    auto insights = extract_key_insights(r);
    ASSERT_EQ(insights.size(), 5u);
    EXPECT_EQ(insights[0], "a1");
}

TEST(RolesTests, KeyInsights_FallsBackToSummarySentences) {
    auto r = result("finance", {{"finance_summary", "Revenue grew 20% last year. Margins held steady overall. Ok."}});
    auto insights = extract_key_insights(r);
    ASSERT_EQ(insights.size(), 2u);
    EXPECT_EQ(insights[0], "Revenue grew 20% last year.");
    EXPECT_EQ(insights[1], "Margins held steady overall.");
}

TEST(RolesTests, KeyInsights_SplitsOnChineseFullStop) {
    auto r = result("policy", {{"policy_insight", "补贴政策持续推动新能源汽车销量增长。充电基础设施建设明显加快。"}});
    auto insights = extract_key_insights(r);
    ASSERT_EQ(insights.size(), 2u);
    EXPECT_EQ(insights[1], "充电基础设施建设明显加快。");
}

TEST(RolesTests, AnalysisSummary_ListsInsightsAndUnavailableRoles) {
    RunSummary s;
    s.run_id = "20240501-120000-abcd0123";
    s.status = RunStatus::CompletedWithErrors;
    s.results.push_back(result("finance", {{"key_insights", {"ROE recovered"}}}));
    s.roles.push_back({"finance", TaskState::Succeeded, 1, std::nullopt});
    FailureRecord f;
    f.role = "macro";
    f.cls = ErrorClass::TransientInference;
    f.message = "timed out";
    s.roles.push_back({"macro", TaskState::Failed, 3, f});

    auto md = render_analysis_summary(s);
    EXPECT_NE(md.find("completed_with_errors"), std::string::npos);
    EXPECT_NE(md.find("- ROE recovered"), std::string::npos);
    EXPECT_NE(md.find("## Unavailable analyses"), std::string::npos);
    EXPECT_NE(md.find("transient_inference: timed out"), std::string::npos);
}
