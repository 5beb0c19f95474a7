#pragma once
#include "../../../services/orchestrator/include/collaborators.hpp"
#include <filesystem>
#include <mutex>

// Writes one directory per run under the output root:
//   <role>_results.json, report.md, report.json, run_summary.json, analysis_summary.md
class FileArtifactSink : public ArtifactSink {
public:
    explicit FileArtifactSink(std::filesystem::path output_root) : root_(std::move(output_root)) {}

    void write_result(const std::string& run_id, const AgentResult& result) override;
    void write_report(const std::string& run_id, const ReportArtifact& report) override;
    void write_summary(const RunSummary& summary) override;

    // Throws std::invalid_argument unless run_id is a plain name (see is_safe_name).
    std::filesystem::path run_dir(const std::string& run_id) const;

private:
    std::filesystem::path root_;
    std::mutex mtx_;
};
