#include "../include/file_sink.hpp"
#include "../include/report_summary.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <stdexcept>

using json = nlohmann::json;

std::filesystem::path FileArtifactSink::run_dir(const std::string& run_id) const {
    if (!is_safe_name(run_id)) throw std::invalid_argument("unsafe run id: '" + run_id + "'");
    return root_ / run_id;
}

void FileArtifactSink::write_result(const std::string& run_id, const AgentResult& result) {
    if (!is_safe_name(result.role)) throw std::invalid_argument("unsafe role name: '" + result.role + "'");
    std::lock_guard<std::mutex> lock(mtx_);
    json j = result;
    write_text_file(run_dir(run_id) / (result.role + "_results.json"), j.dump(2));
}

void FileArtifactSink::write_report(const std::string& run_id, const ReportArtifact& report) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto dir = run_dir(run_id);
    json j = report;
    write_text_file(dir / "report.json", j.dump(2));
    std::string markdown;
    if (report.content.is_object() && report.content.contains("report_content") &&
        report.content["report_content"].is_string()) {
        markdown = report.content["report_content"].get<std::string>();
    } else {
        markdown = report.content.dump(2);
    }
    write_text_file(dir / "report.md", markdown);
    log_info("files", "report written to " + (dir / "report.md").string());
}

void FileArtifactSink::write_summary(const RunSummary& summary) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto dir = run_dir(summary.run_id);
    json j = summary;
    write_text_file(dir / "run_summary.json", j.dump(2));
    write_text_file(dir / "analysis_summary.md", render_analysis_summary(summary));
}
