#include "../include/sqlite_sink.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <sqlite3.h>
#include <stdexcept>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

static void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
    int rc = sqlite3_step(st);
    sqlite3_reset(st);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
    }
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }
    return st;
}

SqliteArtifactSink::SqliteArtifactSink(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteArtifactSink::~SqliteArtifactSink() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteArtifactSink::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS agent_results (\n"
         "  run_id TEXT NOT NULL,\n"
         "  role TEXT NOT NULL,\n"
         "  attempt INTEGER,\n"
         "  produced_at TEXT,\n"
         "  latency_ms INTEGER,\n"
         "  prompt_tokens INTEGER,\n"
         "  completion_tokens INTEGER,\n"
         "  content TEXT,\n"
         "  PRIMARY KEY (run_id, role)\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS reports (\n"
         "  run_id TEXT PRIMARY KEY,\n"
         "  role TEXT,\n"
         "  produced_at TEXT,\n"
         "  markdown TEXT,\n"
         "  artifact TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS runs (\n"
         "  run_id TEXT PRIMARY KEY,\n"
         "  status TEXT,\n"
         "  started_at TEXT,\n"
         "  finished_at TEXT,\n"
         "  result_count INTEGER,\n"
         "  has_report INTEGER,\n"
         "  summary TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS failures (\n"
         "  run_id TEXT NOT NULL,\n"
         "  role TEXT NOT NULL,\n"
         "  attempt INTEGER,\n"
         "  error_class TEXT,\n"
         "  message TEXT,\n"
         "  at TEXT\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_failures_run ON failures(run_id);");
}

void SqliteArtifactSink::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteArtifactSink::prepare_statements() {
    insert_result_stmt_ = prepare(db_,
        "INSERT OR REPLACE INTO agent_results \n"
        "(run_id, role, attempt, produced_at, latency_ms, prompt_tokens, completion_tokens, content) \n"
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    insert_report_stmt_ = prepare(db_,
        "INSERT OR REPLACE INTO reports (run_id, role, produced_at, markdown, artifact) VALUES (?, ?, ?, ?, ?);");
    insert_run_stmt_ = prepare(db_,
        "INSERT OR REPLACE INTO runs \n"
        "(run_id, status, started_at, finished_at, result_count, has_report, summary) \n"
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    delete_failures_stmt_ = prepare(db_, "DELETE FROM failures WHERE run_id = ?;");
    insert_failure_stmt_ = prepare(db_,
        "INSERT INTO failures (run_id, role, attempt, error_class, message, at) VALUES (?, ?, ?, ?, ?, ?);");
    summary_stmt_ = prepare(db_, "SELECT summary FROM runs WHERE run_id = ?;");
    result_stmt_ = prepare(db_, "SELECT content FROM agent_results WHERE run_id = ? AND role = ?;");
    report_stmt_ = prepare(db_, "SELECT markdown FROM reports WHERE run_id = ?;");
    list_stmt_ = prepare(db_,
        "SELECT run_id, status, started_at, finished_at, result_count, has_report \n"
        "FROM runs ORDER BY started_at DESC LIMIT ?;");
}

void SqliteArtifactSink::close_statements() {
    for (sqlite3_stmt** st : {&insert_result_stmt_, &insert_report_stmt_, &insert_run_stmt_, &delete_failures_stmt_,
                              &insert_failure_stmt_, &summary_stmt_, &result_stmt_, &report_stmt_, &list_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

void SqliteArtifactSink::write_result(const std::string& run_id, const AgentResult& result) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_result_stmt_);
    sqlite3_clear_bindings(insert_result_stmt_);
    bind_text(insert_result_stmt_, 1, run_id);
    bind_text(insert_result_stmt_, 2, result.role);
    sqlite3_bind_int(insert_result_stmt_, 3, result.attempt);
    bind_text(insert_result_stmt_, 4, format_utc(result.produced_at));
    sqlite3_bind_int64(insert_result_stmt_, 5, (sqlite3_int64)result.latency.count());
    sqlite3_bind_int(insert_result_stmt_, 6, result.prompt_tokens);
    sqlite3_bind_int(insert_result_stmt_, 7, result.completion_tokens);
    bind_text(insert_result_stmt_, 8, result.content.dump());
    step_done(db_, insert_result_stmt_, "insert result");
}

void SqliteArtifactSink::write_report(const std::string& run_id, const ReportArtifact& report) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string markdown;
    if (report.content.is_object() && report.content.contains("report_content") &&
        report.content["report_content"].is_string()) {
        markdown = report.content["report_content"].get<std::string>();
    }
    json artifact = report;
    sqlite3_reset(insert_report_stmt_);
    sqlite3_clear_bindings(insert_report_stmt_);
    bind_text(insert_report_stmt_, 1, run_id);
    bind_text(insert_report_stmt_, 2, report.role);
    bind_text(insert_report_stmt_, 3, format_utc(report.produced_at));
    bind_text(insert_report_stmt_, 4, markdown);
    bind_text(insert_report_stmt_, 5, artifact.dump());
    step_done(db_, insert_report_stmt_, "insert report");
}

void SqliteArtifactSink::write_summary(const RunSummary& summary) {
    std::lock_guard<std::mutex> lock(mtx_);
    json j = summary;
    exec("BEGIN;");
    try {
        sqlite3_reset(insert_run_stmt_);
        sqlite3_clear_bindings(insert_run_stmt_);
        bind_text(insert_run_stmt_, 1, summary.run_id);
        bind_text(insert_run_stmt_, 2, to_string(summary.status));
        bind_text(insert_run_stmt_, 3, format_utc(summary.started_at));
        bind_text(insert_run_stmt_, 4, format_utc(summary.finished_at));
        sqlite3_bind_int(insert_run_stmt_, 5, (int)summary.results.size());
        sqlite3_bind_int(insert_run_stmt_, 6, summary.report ? 1 : 0);
        bind_text(insert_run_stmt_, 7, j.dump());
        step_done(db_, insert_run_stmt_, "insert run");

        bind_text(delete_failures_stmt_, 1, summary.run_id);
        step_done(db_, delete_failures_stmt_, "delete failures");

        for (const auto& f : summary.failures) {
            sqlite3_clear_bindings(insert_failure_stmt_);
            bind_text(insert_failure_stmt_, 1, summary.run_id);
            bind_text(insert_failure_stmt_, 2, f.role);
            sqlite3_bind_int(insert_failure_stmt_, 3, f.attempt);
            bind_text(insert_failure_stmt_, 4, to_string(f.cls));
            bind_text(insert_failure_stmt_, 5, f.message);
            bind_text(insert_failure_stmt_, 6, format_utc(f.at));
            step_done(db_, insert_failure_stmt_, "insert failure");
        }
        exec("COMMIT;");
    } catch (...) {
        char* err = nullptr;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err);
        sqlite3_free(err);
        throw;
    }
}

std::optional<json> SqliteArtifactSink::load_summary(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(summary_stmt_);
    bind_text(summary_stmt_, 1, run_id);
    std::optional<json> out;
    if (sqlite3_step(summary_stmt_) == SQLITE_ROW) out = json::parse(column_text(summary_stmt_, 0));
    sqlite3_reset(summary_stmt_);
    return out;
}

std::optional<json> SqliteArtifactSink::load_result(const std::string& run_id, const std::string& role) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(result_stmt_);
    bind_text(result_stmt_, 1, run_id);
    bind_text(result_stmt_, 2, role);
    std::optional<json> out;
    if (sqlite3_step(result_stmt_) == SQLITE_ROW) out = json::parse(column_text(result_stmt_, 0));
    sqlite3_reset(result_stmt_);
    return out;
}

std::optional<std::string> SqliteArtifactSink::load_report(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(report_stmt_);
    bind_text(report_stmt_, 1, run_id);
    std::optional<std::string> out;
    if (sqlite3_step(report_stmt_) == SQLITE_ROW) out = column_text(report_stmt_, 0);
    sqlite3_reset(report_stmt_);
    return out;
}

std::vector<StoredRun> SqliteArtifactSink::list_runs(int limit) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<StoredRun> out;
    sqlite3_reset(list_stmt_);
    sqlite3_bind_int(list_stmt_, 1, limit);
    while (sqlite3_step(list_stmt_) == SQLITE_ROW) {
        StoredRun r;
        r.run_id = column_text(list_stmt_, 0);
        r.status = column_text(list_stmt_, 1);
        r.started_at = column_text(list_stmt_, 2);
        r.finished_at = column_text(list_stmt_, 3);
        r.result_count = sqlite3_column_int(list_stmt_, 4);
        r.has_report = sqlite3_column_int(list_stmt_, 5) != 0;
        out.push_back(std::move(r));
    }
    sqlite3_reset(list_stmt_);
    return out;
}
