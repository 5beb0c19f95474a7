#include "../include/roles.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <sstream>

using json = nlohmann::json;

const char* const kReportRole = "report";

namespace {
struct RoleTemplate {
    std::string role;
    std::string display;
    std::string description;
    std::string task;
    std::vector<std::string> focus;
    std::string summary_field;
    FieldDefaults fields; // excluding summary_field
    std::vector<Prerequisite> prerequisites;
    std::vector<std::string> datasets;
    bool requires_input{true};
};

const std::vector<RoleTemplate>& templates() {
    static const std::vector<RoleTemplate> table = {
        {"macro", "Macro-economic environment",
         "Relates macro-economic data (GDP, CPI) to the industry trend.",
         "As a macro-economic analyst, analyse how the GDP and CPI data relate to the new-energy-vehicle industry.",
         {"Correlation between GDP growth and the development of the NEV industry",
          "How CPI movements affect consumers' willingness to buy NEVs",
          "Potential impact of the overall macro environment on the industry"},
         "macro_summary",
         {{"macro_corr_matrix", json::object()}, {"key_insights", json::array()}, {"recommendations", json::array()}},
         {}, {"gdp.csv", "cpi.csv"}},
        {"finance", "Industry financial performance",
         "Analyses financial indicators of listed NEV companies.",
         "As a financial analyst, analyse the financial performance of listed new-energy-vehicle companies.",
         {"Profitability trend of the industry as a whole",
          "Asset-liability structure and solvency",
          "Growth indicators and investment value",
          "Comparison of the leading companies' financial performance"},
         "finance_summary",
         {{"key_metrics", json::object()}, {"company_comparison", json::object()},
          {"investment_insights", ""}, {"risk_factors", ""}, {"key_insights", json::array()}},
         {}, {"industry_data.csv", "company_data.csv"}},
        {"market", "Market production and sales trends",
         "Analyses production/sales trends, market structure and penetration.",
         "As a market analyst, analyse production and sales trends and structural change in the NEV market.",
         {"Seasonality and long-term trend of production and sales",
          "Market-share shifts among the main manufacturers",
          "Relationship between charging infrastructure and market growth",
          "Penetration rate and remaining headroom"},
         "market_trend_summary",
         {{"penetration_rate", json::object()}, {"manufacturer_analysis", json::object()},
          {"infrastructure_insights", ""}, {"market_forecast", ""}, {"key_insights", json::array()}},
         {}, {"production_data.csv", "charging_data.csv"}},
        {"policy", "Policy and environmental impact",
         "Combines macro and industry data to assess policy and market signals.",
         "As a policy analyst, assess how the policy environment affects the NEV industry.",
         {"Synergy between macro-economic policy and industrial policy",
          "How industrial policy drives market development",
          "Fit between infrastructure policy and market demand",
          "Likely effects of future policy changes"},
         "policy_insight",
         {{"impact_analysis", json::object()}, {"policy_recommendations", ""}, {"regulatory_risks", ""},
          {"future_outlook", ""}, {"key_insights", json::array()}},
         {}, {"gdp.csv", "industry_data.csv"}},
        {"forecast", "Forecast and outlook",
         "Forecasts the next period from historical trends and the upstream analyses.",
         "As a forecasting analyst, forecast the development of the NEV industry from the data and analyses below.",
         {"Short- and medium-term growth forecast",
          "Likely changes in market structure",
          "Impact of technology development on the market",
          "Risk factors and uncertainty"},
         "forecast_summary",
         {{"growth_forecast", json::object()}, {"market_structure_changes", json::object()},
          {"technology_impact", ""}, {"risk_factors", ""}, {"key_insights", json::array()}},
         {{"macro", false}, {"finance", false}, {"market", true}},
         {"industry_data.csv", "production_data.csv"}, false},
    };
    return table;
}

const RoleTemplate* find_template(const std::string& role) {
    for (const auto& t : templates()) if (t.role == role) return &t;
    return nullptr;
}

InferenceParams make_params(const RoleTuning& tuning) {
    InferenceParams p;
    p.model = tuning.model;
    p.system_prompt = tuning.system_prompt;
    p.temperature = tuning.temperature;
    p.max_tokens = tuning.max_tokens;
    return p;
}

std::string build_domain_prompt(const RoleTemplate& t, const TaskInput& input) {
    std::ostringstream os;
    os << t.task << "\n\n" << render_inputs(input) << "\nFocus on:\n";
    for (std::size_t i = 0; i < t.focus.size(); ++i) os << (i + 1) << ". " << t.focus[i] << "\n";
    os << "\nReturn the analysis as a JSON object with these fields:\n- " << t.summary_field
       << ": overall summary of the analysis\n";
    for (const auto& f : t.fields) os << "- " << f.first << "\n";
    return os.str();
}

std::string build_report_prompt(const TaskInput& input) {
    std::ostringstream os;
    os << "Write a complete new-energy-vehicle industry analysis report from the specialist analyses below.\n\n";
    for (const auto& r : input.upstream) {
        os << "## " << display_name(r.role) << "\n";
        const auto& field = summary_field(r.role);
        if (r.content.is_object() && r.content.contains(field) && r.content[field].is_string()) {
            os << r.content[field].get<std::string>() << "\n";
        } else {
            os << r.content.dump(2) << "\n";
        }
        if (r.content.is_object() && r.content.contains("key_insights") && r.content["key_insights"].is_array()) {
            for (const auto& k : r.content["key_insights"]) {
                os << "- " << (k.is_string() ? k.get<std::string>() : k.dump()) << "\n";
            }
        }
        os << "\n";
    }
    if (!input.omitted.empty()) {
        os << "The following analyses are unavailable; say so in the report instead of inventing content:\n";
        for (const auto& o : input.omitted) {
            os << "- " << display_name(o.role) << " (" << to_string(o.state) << ")\n";
        }
        os << "\n";
    }
    os << "Structure the report as:\n"
       << "# New-Energy-Vehicle Industry Analysis Report\n";
    int n = 1;
    for (const auto& r : input.upstream) os << "## " << n++ << ". " << display_name(r.role) << "\n";
    os << "## " << n << ". Conclusions and recommendations\n"
       << "(summarise the industry trend and the investment implications across all sections)\n";
    return os.str();
}
}

std::vector<RoleSpec> default_roles(const RoleTuning& tuning) {
    std::vector<RoleSpec> out;
    for (const auto& t : templates()) {
        RoleSpec spec;
        spec.role = t.role;
        spec.description = t.description;
        spec.prerequisites = t.prerequisites;
        spec.requires_input = t.requires_input;
        spec.params = make_params(tuning);
        const RoleTemplate* tp = &t; // table entries live for the whole program
        spec.build_prompt = [tp](const TaskInput& input){ return build_domain_prompt(*tp, input); };
        spec.parse_response = [tp](const std::string& text){
            return parse_structured_response(text, tp->summary_field, tp->fields);
        };
        out.push_back(std::move(spec));
    }
    return out;
}

RoleSpec report_role(const RoleTuning& tuning) {
    RoleSpec spec;
    spec.role = kReportRole;
    spec.description = "Merges every specialist analysis into the final Markdown report.";
    spec.params = make_params(tuning);
    spec.build_prompt = build_report_prompt;
    spec.parse_response = [](const std::string& text){
        return json{{"report_content", strip_code_fence(text)}, {"report_type", "markdown"}};
    };
    return spec;
}

std::map<std::string, std::vector<std::string>> default_role_datasets() {
    std::map<std::string, std::vector<std::string>> out;
    for (const auto& t : templates()) out[t.role] = t.datasets;
    return out;
}

std::optional<std::string> role_for_focus(const std::string& label) {
    static const std::map<std::string, std::string> labels = {
        {"宏观经济", "macro"}, {"财务", "finance"}, {"市场", "market"}, {"政策", "policy"}, {"预测", "forecast"},
        {"MacroAgent", "macro"}, {"FinanceAgent", "finance"}, {"MarketAgent", "market"},
        {"PolicyAgent", "policy"}, {"ForecastAgent", "forecast"}
    };
    if (find_template(label)) return label;
    auto it = labels.find(label);
    if (it != labels.end()) return it->second;
    return std::nullopt;
}

std::string display_name(const std::string& role) {
    if (const auto* t = find_template(role)) return t->display;
    if (role == kReportRole) return "Synthesis report";
    return role;
}

const std::string& summary_field(const std::string& role) {
    static const std::string fallback = "summary";
    if (const auto* t = find_template(role)) return t->summary_field;
    return fallback;
}

std::string strip_code_fence(const std::string& text) {
    std::string s = trim(text);
    // Reasoning models may prepend their chain of thought.
    if (s.rfind("<think>", 0) == 0) {
        auto end = s.find("</think>");
        if (end != std::string::npos) s = trim(s.substr(end + 8));
    }
    if (s.rfind("```", 0) == 0) {
        auto nl = s.find('\n');
        s = nl == std::string::npos ? std::string() : s.substr(nl + 1);
        auto close = s.rfind("```");
        if (close != std::string::npos) s = s.substr(0, close);
        s = trim(s);
    }
    return s;
}

json parse_structured_response(const std::string& text, const std::string& summary_field,
                               const FieldDefaults& fields) {
    std::string body = strip_code_fence(text);
    json parsed = json::parse(body, nullptr, false);
    json out;
    if (!parsed.is_discarded() && parsed.is_object()) {
        out = std::move(parsed);
    } else {
        out = json::object();
        out[summary_field] = body;
    }
    if (!out.contains(summary_field)) out[summary_field] = "";
    for (const auto& f : fields) {
        if (!out.contains(f.first)) out[f.first] = f.second;
    }
    return out;
}

std::string render_inputs(const TaskInput& input) {
    std::ostringstream os;
    if (input.raw) {
        const json& raw = *input.raw;
        os << "Input data:\n";
        if (raw.contains("datasets") && raw["datasets"].is_array()) {
            for (const auto& d : raw["datasets"]) {
                os << "### " << d.value("dataset", std::string("dataset")) << "\n";
                if (d.contains("summary") && d["summary"].is_string()) os << d["summary"].get<std::string>() << "\n";
                else os << d.dump(2) << "\n";
            }
        } else {
            os << raw.dump(2) << "\n";
        }
        if (raw.contains("missing") && raw["missing"].is_array() && !raw["missing"].empty()) {
            os << "Datasets not found: " << raw["missing"].dump() << "\n";
        }
        os << "\n";
    }
    if (!input.upstream.empty()) {
        os << "Upstream analyses:\n";
        for (const auto& r : input.upstream) {
            os << "### " << display_name(r.role) << " (" << r.role << ")\n" << r.content.dump(2) << "\n";
        }
        os << "\n";
    }
    if (!input.omitted.empty()) {
        os << "Unavailable upstream analyses (work without them):\n";
        for (const auto& o : input.omitted) {
            os << "- " << o.role << " (" << to_string(o.state) << ")\n";
        }
        os << "\n";
    }
    return os.str();
}
