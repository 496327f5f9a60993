#include "metadata_reader.hpp"

#include <ctime>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "repo.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> GitCliReader::read_remote(const fs::path& repo,
                                                    const std::string& remote) const {
    std::string out;
    int rc = procutil::run_process({git_, "--git-dir", (repo / ".git").string(), "config", "--get",
                                    "remote." + remote + ".url"},
                                   &out);
    // git config exits 1 when the key is missing.
    if (rc == 1)
        return std::nullopt;
    if (rc != 0)
        throw MetadataError("git config failed with status " + std::to_string(rc));
    std::string url = trim(out);
    if (url.empty())
        return std::nullopt;
    return url;
}

RepoRecord GitCliReader::read(const fs::path& repo, const ReadOptions& opts) const {
    // Pin both directories so git never falls back to a parent repository.
    const std::vector<std::string> base{git_, "--git-dir", (repo / ".git").string(),
                                        "--work-tree", repo.string()};
    auto git = [&](std::vector<std::string> args, std::string& out) {
        std::vector<std::string> cmd = base;
        cmd.insert(cmd.end(), args.begin(), args.end());
        return procutil::run_process(cmd, &out);
    };

    std::string out;
    int rc = git({"rev-parse", "--git-dir"}, out);
    if (rc != 0)
        throw MetadataError("git rev-parse failed with status " + std::to_string(rc));

    RepoRecord rec;
    rec.path = repo;
    std::vector<std::string> problems;

    rc = git({"symbolic-ref", "--quiet", "--short", "HEAD"}, out);
    if (rc == 0)
        rec.branch = trim(out);
    else if (rc == 1)
        rec.branch = DETACHED_HEAD;
    else
        problems.push_back("HEAD: git symbolic-ref exited with " + std::to_string(rc));

    rc = git({"rev-parse", "--verify", "--quiet", "HEAD"}, out);
    if (rc == 0) {
        rc = git({"log", "-1", "--format=%ct%n%h%n%an", "HEAD"}, out);
        std::istringstream iss(out);
        std::string ts;
        std::string hash;
        std::string author;
        std::getline(iss, ts);
        std::getline(iss, hash);
        std::getline(iss, author);
        try {
            if (rc != 0)
                throw std::invalid_argument("status " + std::to_string(rc));
            rec.last_commit_time = static_cast<std::time_t>(std::stoll(trim(ts)));
            rec.commit = trim(hash).substr(0, 7);
            rec.last_commit_author = trim(author);
        } catch (const std::exception& e) {
            problems.push_back(std::string("last commit: ") + e.what());
        }
    } else if (rc != 1) {
        problems.push_back("HEAD: git rev-parse exited with " + std::to_string(rc));
    }

    rc = git({"status", "--porcelain",
              opts.include_untracked ? "--untracked-files=normal" : "--untracked-files=no"},
             out);
    if (rc == 0)
        rec.is_dirty = !trim(out).empty();
    else
        problems.push_back("status: git status exited with " + std::to_string(rc));

    rc = git({"remote", "-v"}, out);
    if (rc == 0) {
        std::istringstream iss(out);
        std::string line;
        while (std::getline(iss, line)) {
            // <name>\t<url> (fetch|push)
            size_t tab = line.find('\t');
            if (tab == std::string::npos)
                continue;
            std::string name = line.substr(0, tab);
            std::string rest = line.substr(tab + 1);
            size_t kind = rest.rfind(" (");
            if (kind == std::string::npos || rest.compare(kind, 8, " (fetch)") != 0)
                continue;
            std::string url = rest.substr(0, kind);
            rec.remotes.emplace_back(name, url);
            if (name == opts.remote_name)
                rec.remote_url = url;
        }
    }

    if (!problems.empty()) {
        rec.corrupt = true;
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0)
                rec.error += "; ";
            rec.error += problems[i];
        }
    }
    return rec;
}
