#include "../include/report_summary.hpp"
#include "../include/roles.hpp"
#include "../../../shared/cpp/agent_sdk/include/util.hpp"
#include <sstream>

using json = nlohmann::json;

static const size_t kMaxInsights = 5;
static const size_t kMinSentence = 10;

// Splits on the Chinese full stop and on ". "; keeps the terminator.
static std::vector<std::string> sentences(const std::string& text) {
    static const std::string cjk_stop = "\xE3\x80\x82"; // 。
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]{
        auto s = trim(cur);
        if (!s.empty()) out.push_back(s);
        cur.clear();
    };
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, cjk_stop.size(), cjk_stop) == 0) {
            cur += cjk_stop;
            i += cjk_stop.size() - 1;
            flush();
        } else if (text[i] == '.' && (i + 1 == text.size() || text[i + 1] == ' ' || text[i + 1] == '\n')) {
            cur += '.';
            flush();
        } else {
            cur += text[i] == '\n' ? ' ' : text[i];
        }
    }
    flush();
    return out;
}

static void take_sentences(const std::string& text, size_t n, std::vector<std::string>& out) {
    size_t taken = 0;
    for (const auto& s : sentences(text)) {
        if (taken == n) break;
        ++taken;
        if (s.size() > kMinSentence) out.push_back(s);
    }
}

std::vector<std::string> extract_key_insights(const AgentResult& result) {
    std::vector<std::string> out;
    const json& c = result.content;
    if (!c.is_object()) {
        if (c.is_string()) take_sentences(c.get<std::string>(), 3, out);
        if (out.size() > kMaxInsights) out.resize(kMaxInsights);
        return out;
    }

    if (c.contains("key_insights") && c["key_insights"].is_array()) {
        for (const auto& k : c["key_insights"]) {
            if (k.is_string()) {
                auto s = trim(k.get<std::string>());
                if (!s.empty()) out.push_back(s);
            } else if (!k.is_null()) {
                out.push_back(k.dump());
            }
        }
    }
    if (out.empty()) {
        for (const auto& field : {summary_field(result.role), std::string("summary"), std::string("analysis")}) {
            if (c.contains(field) && c[field].is_string()) {
                take_sentences(c[field].get<std::string>(), 3, out);
                break;
            }
        }
    }
    if (out.empty()) {
        for (const auto& item : c.items()) {
            if (!item.value().is_string()) continue;
            const auto& s = item.value().get_ref<const std::string&>();
            if (s.size() <= 50) continue;
            take_sentences(s, 2, out);
            if (out.size() >= 3) break;
        }
    }
    if (out.size() > kMaxInsights) out.resize(kMaxInsights);
    return out;
}

std::string render_analysis_summary(const RunSummary& summary) {
    std::ostringstream os;
    os << "# New-Energy-Vehicle Industry Analysis Summary\n\n"
       << "- Run: " << summary.run_id << "\n"
       << "- Status: " << to_string(summary.status) << (summary.cancelled ? " (cancelled)" : "") << "\n"
       << "- Started: " << format_utc(summary.started_at) << "\n"
       << "- Finished: " << format_utc(summary.finished_at) << "\n"
       << "- Report: " << (summary.report ? "available" : "not produced") << "\n\n";

    for (const auto& r : summary.results) {
        auto insights = extract_key_insights(r);
        if (insights.empty()) continue;
        os << "## " << display_name(r.role) << "\n\n";
        for (const auto& i : insights) os << "- " << i << "\n";
        os << "\n";
    }

    bool header = false;
    for (const auto& s : summary.roles) {
        if (s.state == TaskState::Succeeded) continue;
        if (!header) { os << "## Unavailable analyses\n\n"; header = true; }
        os << "- " << display_name(s.role) << ": " << to_string(s.state);
        if (s.last_error) os << " (" << to_string(s.last_error->cls) << ": " << s.last_error->message << ")";
        os << "\n";
    }
    if (header) os << "\n";
    return os.str();
}
