#include "../include/csv_data_provider.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

static bool parse_number(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    t.erase(std::remove(t.begin(), t.end(), ','), t.end()); // 1,234.5
    char* end = nullptr;
    out = std::strtod(t.c_str(), &end);
    return end && *end == '\0' && std::isfinite(out);
}

static std::string fmt(double v) {
    std::ostringstream os;
    os.precision(6);
    os << v;
    return os.str();
}

CsvTable parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool quoted = false;
    bool any = false;
    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    auto end_record = [&]{
        record.push_back(std::move(field));
        field.clear();
        bool blank = record.size() == 1 && trim(record[0]).empty();
        if (!blank) records.push_back(std::move(record));
        record.clear();
        any = false;
    };

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') { field += '"'; ++i; }
                else quoted = false;
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') { quoted = true; any = true; }
        else if (c == ',') { record.push_back(std::move(field)); field.clear(); any = true; }
        else if (c == '\r') continue;
        else if (c == '\n') end_record();
        else { field += c; any = true; }
    }
    if (any || !field.empty() || !record.empty()) end_record();

    CsvTable t;
    if (records.empty()) return t;
    for (auto& h : records.front()) t.columns.push_back(trim(h));
    for (size_t r = 1; r < records.size(); ++r) {
        auto row = std::move(records[r]);
        row.resize(t.columns.size());
        t.rows.push_back(std::move(row));
    }
    return t;
}

json summarize_csv(const CsvTable& table, const std::string& dataset, const std::string& sha1) {
    json numeric = json::object();
    std::vector<std::string> numeric_cols;
    for (size_t c = 0; c < table.columns.size(); ++c) {
        std::vector<double> vals;
        size_t filled = 0;
        for (const auto& row : table.rows) {
            if (trim(row[c]).empty()) continue;
            ++filled;
            double v;
            if (parse_number(row[c], v)) vals.push_back(v);
        }
        // A column is numeric when every non-empty cell parses.
        if (vals.empty() || vals.size() != filled) continue;
        double sum = 0, mn = vals[0], mx = vals[0];
        for (double v : vals) { sum += v; mn = std::min(mn, v); mx = std::max(mx, v); }
        double mean = sum / vals.size();
        double var = 0;
        for (double v : vals) var += (v - mean) * (v - mean);
        double stddev = vals.size() > 1 ? std::sqrt(var / (vals.size() - 1)) : 0.0;
        numeric[table.columns[c]] = {{"count", vals.size()}, {"mean", mean}, {"std", stddev}, {"min", mn}, {"max", mx}};
        numeric_cols.push_back(table.columns[c]);
    }

    json preview = json::array();
    for (size_t r = 0; r < table.rows.size() && r < 5; ++r) {
        json row = json::object();
        for (size_t c = 0; c < table.columns.size(); ++c) row[table.columns[c]] = table.rows[r][c];
        preview.push_back(row);
    }

    std::ostringstream text;
    text << dataset << ": " << table.rows.size() << " rows, " << table.columns.size() << " columns";
    if (!table.columns.empty()) {
        text << " (";
        for (size_t c = 0; c < table.columns.size(); ++c) text << (c ? ", " : "") << table.columns[c];
        text << ")";
    }
    text << "\n";
    for (const auto& name : numeric_cols) {
        const auto& s = numeric[name];
        text << "  " << name << ": mean " << fmt(s["mean"].get<double>()) << ", std " << fmt(s["std"].get<double>())
             << ", min " << fmt(s["min"].get<double>()) << ", max " << fmt(s["max"].get<double>()) << "\n";
    }
    if (!table.rows.empty()) {
        text << "  first rows:\n";
        for (const auto& row : preview) text << "    " << row.dump() << "\n";
    }

    return {
        {"dataset", dataset},
        {"rows", table.rows.size()},
        {"columns", table.columns},
        {"numeric_summary", numeric},
        {"preview", preview},
        {"sha1", sha1},
        {"summary", text.str()}
    };
}

CsvDataProvider::CsvDataProvider(fs::path data_root,
                                 std::map<std::string, std::vector<std::string>> role_datasets,
                                 json mapping)
    : root_(std::move(data_root)), role_datasets_(std::move(role_datasets)), mapping_(std::move(mapping)) {
    if (!mapping_.is_object()) mapping_ = json::object();
}

std::optional<fs::path> CsvDataProvider::resolve(const std::string& logical) const {
    auto it = mapping_.find(logical);
    if (it != mapping_.end()) {
        std::string actual;
        if (it->is_string()) actual = it->get<std::string>();
        else if (it->is_object() && it->contains("actual_file")) actual = (*it)["actual_file"].get<std::string>();
        if (!actual.empty()) {
            auto p = root_ / actual;
            if (fs::exists(p)) return p;
            log_warn("data", "mapped file " + actual + " for " + logical + " does not exist");
        }
    }

    auto direct = root_ / logical;
    if (fs::exists(direct)) return direct;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return std::nullopt;
    std::string stem = lower(fs::path(logical).stem().string());
    std::vector<fs::path> candidates;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (!entry.is_regular_file()) continue;
        if (lower(entry.path().extension().string()) != ".csv") continue;
        if (lower(entry.path().filename().string()).find(stem) != std::string::npos) candidates.push_back(entry.path());
    }
    if (candidates.empty()) return std::nullopt;
    std::sort(candidates.begin(), candidates.end());
    log_info("data", "resolved " + logical + " to " + candidates.front().filename().string());
    return candidates.front();
}

json CsvDataProvider::dataset_summary(const std::string& logical) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = cache_.find(logical);
        if (it != cache_.end()) return it->second;
    }
    auto path = resolve(logical);
    if (!path) throw std::runtime_error("dataset not found: " + logical);
    auto text = read_text_file(*path);
    auto table = parse_csv(text);
    auto summary = summarize_csv(table, logical, sha1_file(*path));
    summary["file"] = path->filename().string();
    log_debug("data", "loaded " + path->string() + " (" + std::to_string(table.rows.size()) + " rows)");

    std::lock_guard<std::mutex> lock(mtx_);
    cache_[logical] = summary;
    return summary;
}

std::optional<json> CsvDataProvider::load_input(const std::string& role) {
    auto it = role_datasets_.find(role);
    if (it == role_datasets_.end() || it->second.empty()) return std::nullopt;

    json datasets = json::array();
    json missing = json::array();
    for (const auto& name : it->second) {
        try {
            datasets.push_back(dataset_summary(name));
        } catch (const std::exception& e) {
            log_warn("data", role + ": " + e.what());
            missing.push_back(name);
        }
    }
    if (datasets.empty()) return std::nullopt;
    return json{{"datasets", datasets}, {"missing", missing}};
}

json load_dataset_mapping(const fs::path& p) {
    if (!fs::exists(p)) return json::object();
    auto j = json::parse(read_text_file(p));
    if (!j.is_object()) throw std::runtime_error("dataset mapping must be a JSON object: " + p.string());
    return j;
}
