#pragma once
#include "../../../services/orchestrator/include/run_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct RoleTuning {
    std::string model;         // empty: client default
    std::string system_prompt;
    double temperature{0.1};
    int max_tokens{4000};
};

// Fields a domain role is asked to return, with the value used when the
// model answers with plain text instead of JSON.
using FieldDefaults = std::vector<std::pair<std::string, nlohmann::json>>;

extern const char* const kReportRole;

// macro, finance, market, policy, forecast (forecast needs macro and finance,
// and uses market when available).
std::vector<RoleSpec> default_roles(const RoleTuning& tuning = {});
RoleSpec report_role(const RoleTuning& tuning = {});

// Logical dataset names each role reads.
std::map<std::string, std::vector<std::string>> default_role_datasets();

// Accepts role names and the original focus-area labels (宏观经济, 财务, ...).
std::optional<std::string> role_for_focus(const std::string& label);
std::string display_name(const std::string& role);
const std::string& summary_field(const std::string& role);

std::string strip_code_fence(const std::string& text);
nlohmann::json parse_structured_response(const std::string& text, const std::string& summary_field,
                                         const FieldDefaults& fields);

// Renders raw datasets, upstream results and omissions for a prompt.
std::string render_inputs(const TaskInput& input);
