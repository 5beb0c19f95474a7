#pragma once
#include "../../../services/orchestrator/include/run_types.hpp"
#include <string>
#include <vector>

// Up to five insights: the key_insights array if present, otherwise the first
// sentences of the role's summary field, otherwise of any long text field.
std::vector<std::string> extract_key_insights(const AgentResult& result);

// Markdown digest of a run: status line, per-role insights, failures.
std::string render_analysis_summary(const RunSummary& summary);
