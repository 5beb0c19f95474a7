#pragma once
#include "collaborators.hpp"
#include "dependency_graph.hpp"
#include "run_types.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

// Everything a run needs, built once by the caller. Nothing here is global.
struct AnalysisSetup {
    std::vector<RoleSpec> roles;          // domain roles, declared order
    RoleSpec synthesis;                   // aggregation role
    std::shared_ptr<InferenceClient> client;
    std::shared_ptr<DataProvider> data;   // optional
    std::shared_ptr<ArtifactSink> sink;   // optional
};

// Throws ConfigurationError.
void validate(const RunOptions& options);
void validate(const AnalysisSetup& setup);
DependencyGraph build_graph(const std::vector<RoleSpec>& roles);

// Checks selected against the declared roles and closes it over prerequisites.
// Empty selection means every role. Throws ConfigurationError for unknown roles.
std::vector<std::string> resolve_selection(const AnalysisSetup& setup, const std::set<std::string>& selected);

// YYYYMMDD-HHMMSS-xxxxxxxx (UTC time plus random suffix).
std::string make_run_id();

// Runs the selected roles and the aggregator. Only ConfigurationError is
// thrown; every other failure is reported in the returned summary.
RunSummary run_analysis(const AnalysisSetup& setup, const std::set<std::string>& selected,
                        const RunOptions& options);
