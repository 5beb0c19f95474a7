#pragma once
#include "../../../services/orchestrator/include/collaborators.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct CsvTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
};

// Parses RFC 4180-ish CSV: quoted fields, doubled quotes, CRLF, UTF-8 BOM.
CsvTable parse_csv(const std::string& text);

// Row/column counts, numeric column statistics, a preview and the file's SHA-1.
nlohmann::json summarize_csv(const CsvTable& table, const std::string& dataset, const std::string& sha1);

// Serves each role the summaries of the CSV datasets it reads.
class CsvDataProvider : public DataProvider {
public:
    // mapping: {"gdp.csv": "GDP_2015_2024.csv"} or {"gdp.csv": {"actual_file": "..."}}
    CsvDataProvider(std::filesystem::path data_root,
                    std::map<std::string, std::vector<std::string>> role_datasets,
                    nlohmann::json mapping = nlohmann::json::object());

    // nullopt when none of the role's datasets exist. Otherwise
    // {"datasets": [...], "missing": [...]}.
    std::optional<nlohmann::json> load_input(const std::string& role) override;

    // Path the logical name resolves to; nullopt if no file matches.
    std::optional<std::filesystem::path> resolve(const std::string& logical) const;

    // Throws std::runtime_error if the dataset cannot be resolved or read.
    nlohmann::json dataset_summary(const std::string& logical);

private:
    std::filesystem::path root_;
    std::map<std::string, std::vector<std::string>> role_datasets_;
    nlohmann::json mapping_;
    std::mutex mtx_;
    std::map<std::string, nlohmann::json> cache_;
};

// Reads a mapping file (JSON object). A missing file yields an empty mapping.
nlohmann::json load_dataset_mapping(const std::filesystem::path& p);
