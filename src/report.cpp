#include "report.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "time_utils.hpp"

static std::string age_of(const RepoRecord& rec, std::time_t now) {
    if (!rec.last_commit_time)
        return "no commits";
    return format_age(std::chrono::seconds(static_cast<long long>(now) -
                                           static_cast<long long>(*rec.last_commit_time)));
}

static std::string format_json(const ScanResult& result) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& rec : result.records) {
        nlohmann::json j;
        j["path"] = rec.path.string();
        j["branch"] = rec.branch;
        j["commit"] = rec.commit;
        j["dirty"] = rec.is_dirty;
        if (rec.last_commit_time) {
            j["last_commit_time"] = static_cast<long long>(*rec.last_commit_time);
            j["last_commit_date"] = format_commit_time(*rec.last_commit_time);
        } else {
            j["last_commit_time"] = nullptr;
            j["last_commit_date"] = nullptr;
        }
        j["author"] = rec.last_commit_author;
        if (rec.remote_url)
            j["remote_url"] = *rec.remote_url;
        else
            j["remote_url"] = nullptr;
        nlohmann::json remotes = nlohmann::json::array();
        for (const auto& [name, url] : rec.remotes)
            remotes.push_back({{"name", name}, {"url", url}});
        j["remotes"] = remotes;
        if (rec.corrupt)
            j["error"] = rec.error;
        arr.push_back(std::move(j));
    }
    return arr.dump(2) + "\n";
}

static void format_full(std::ostringstream& out, const ScanResult& result, std::time_t now) {
    for (const auto& rec : result.records) {
        out << rec.path.string() << "\n";
        out << "  branch:  " << (rec.branch.empty() ? "-" : rec.branch) << "\n";
        out << "  commit:  " << (rec.commit.empty() ? "-" : rec.commit) << "\n";
        out << "  dirty:   " << (rec.is_dirty ? "yes" : "no") << "\n";
        if (rec.last_commit_time)
            out << "  date:    " << format_commit_time(*rec.last_commit_time) << " ("
                << age_of(rec, now) << ")\n";
        else
            out << "  date:    -\n";
        out << "  author:  " << (rec.last_commit_author.empty() ? "-" : rec.last_commit_author)
            << "\n";
        out << "  remote:  " << rec.remote_url.value_or("-") << "\n";
        for (const auto& [name, url] : rec.remotes)
            out << "  remotes: " << name << " " << url << "\n";
        if (rec.corrupt)
            out << "  error:   " << rec.error << "\n";
    }
    out << result.records.size() << (result.records.size() == 1 ? " repository" : " repositories")
        << ", " << result.warnings.size()
        << (result.warnings.size() == 1 ? " warning" : " warnings") << "\n";
}

std::string format_report(const ScanResult& result, const ReportOptions& opts) {
    if (opts.json)
        return format_json(result);
    std::time_t now = opts.now != 0 ? opts.now : std::time(nullptr);
    std::ostringstream out;
    if (opts.full) {
        format_full(out, result, now);
        return out.str();
    }
    if (opts.style == ReportStyle::Paths) {
        for (const auto& rec : result.records)
            out << rec.path.string() << "\n";
        return out.str();
    }
    size_t width = 0;
    for (const auto& rec : result.records)
        width = std::max(width, rec.path.string().size());
    for (const auto& rec : result.records) {
        std::string p = rec.path.string();
        out << p << std::string(width - p.size() + 2, ' ') << age_of(rec, now);
        if (rec.is_dirty)
            out << " *";
        out << "\n";
    }
    return out.str();
}

std::string format_warnings(const std::vector<ScanWarning>& warnings) {
    std::ostringstream out;
    for (const auto& w : warnings)
        out << "warning: " << w.path.string() << ": " << error_kind_name(w.kind) << ": "
            << w.message << "\n";
    return out.str();
}
