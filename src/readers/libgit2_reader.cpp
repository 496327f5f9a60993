#include "metadata_reader.hpp"

#include <string>
#include <vector>

#include "git_utils.hpp"

namespace fs = std::filesystem;

std::optional<std::string> LibGit2Reader::read_remote(const fs::path& repo,
                                                      const std::string& remote) const {
    git::GitInitGuard guard;
    std::string err;
    git_repository* raw = git::open_repo(repo, &err);
    if (!raw)
        throw MetadataError(err);
    git::repo_ptr r(raw);
    return git::get_remote_url(r.get(), remote);
}

RepoRecord LibGit2Reader::read(const fs::path& repo, const ReadOptions& opts) const {
    git::GitInitGuard guard;
    std::string err;
    git_repository* raw = git::open_repo(repo, &err);
    if (!raw)
        throw MetadataError(err);
    git::repo_ptr r(raw);

    RepoRecord rec;
    rec.path = repo;
    std::vector<std::string> problems;

    err.clear();
    auto branch = git::get_current_branch(r.get(), &err);
    if (branch)
        rec.branch = *branch;
    else
        problems.push_back("HEAD: " + err);

    err.clear();
    rec.last_commit_time = git::get_last_commit_time(r.get(), &err);
    if (!err.empty())
        problems.push_back("last commit: " + err);
    if (rec.last_commit_time) {
        rec.commit = git::get_local_hash(r.get()).value_or("");
        if (rec.commit.size() > 7)
            rec.commit = rec.commit.substr(0, 7);
        rec.last_commit_author = git::get_last_commit_author(r.get());
    }

    err.clear();
    auto dirty = git::has_uncommitted_changes(r.get(), opts.include_untracked, &err);
    if (dirty)
        rec.is_dirty = *dirty;
    else
        problems.push_back("status: " + err);

    rec.remote_url = git::get_remote_url(r.get(), opts.remote_name);
    rec.remotes = git::list_remotes(r.get());

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
