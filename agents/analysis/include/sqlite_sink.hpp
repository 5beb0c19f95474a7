#pragma once
#include "../../../services/orchestrator/include/collaborators.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct StoredRun {
    std::string run_id;
    std::string status;
    std::string started_at;
    std::string finished_at;
    int result_count{0};
    bool has_report{false};
};

// Persists run artifacts in SQLite, keyed by run id and role.
class SqliteArtifactSink : public ArtifactSink {
public:
    SqliteArtifactSink(const std::string& db_path);
    ~SqliteArtifactSink();
    SqliteArtifactSink(const SqliteArtifactSink&) = delete;
    SqliteArtifactSink& operator=(const SqliteArtifactSink&) = delete;

    void write_result(const std::string& run_id, const AgentResult& result) override;
    void write_report(const std::string& run_id, const ReportArtifact& report) override;
    void write_summary(const RunSummary& summary) override;

    std::optional<nlohmann::json> load_summary(const std::string& run_id);
    std::optional<nlohmann::json> load_result(const std::string& run_id, const std::string& role);
    std::optional<std::string> load_report(const std::string& run_id);
    std::vector<StoredRun> list_runs(int limit = 50);

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_result_stmt_ {nullptr};
    struct sqlite3_stmt* insert_report_stmt_ {nullptr};
    struct sqlite3_stmt* insert_run_stmt_ {nullptr};
    struct sqlite3_stmt* delete_failures_stmt_ {nullptr};
    struct sqlite3_stmt* insert_failure_stmt_ {nullptr};
    struct sqlite3_stmt* summary_stmt_ {nullptr};
    struct sqlite3_stmt* result_stmt_ {nullptr};
    struct sqlite3_stmt* report_stmt_ {nullptr};
    struct sqlite3_stmt* list_stmt_ {nullptr};
};
