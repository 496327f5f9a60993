#include "lifecycle.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

#include "git_utils.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

int ProcessGitClient::clone(const std::string& url, const fs::path& dest) {
    if (!procutil::program_available(git_))
        return -1;
    return procutil::run_process({git_, "clone", url, dest.string()});
}

int ProcessGitClient::push_all(const fs::path& repo, const std::string& target) {
    if (!procutil::program_available(git_))
        return -1;
    return procutil::run_process({git_, "-C", repo.string(), "push", "--all", target});
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return 0;
    case ErrorKind::PathNotFound:
        return 2;
    case ErrorKind::NotARepository:
        return 3;
    case ErrorKind::AlreadyExists:
        return 4;
    case ErrorKind::PermissionDenied:
    case ErrorKind::CorruptRepository:
    case ErrorKind::ExternalOperationFailed:
        break;
    }
    return 1;
}

static OpResult external_result(const std::string& what, int status) {
    OpResult res;
    if (status == 0)
        return res;
    res.kind = ErrorKind::ExternalOperationFailed;
    if (status < 0) {
        res.exit_code = 1;
        res.message = what + " failed: git could not be started";
    } else {
        res.exit_code = status;
        res.message = what + " failed with exit status " + std::to_string(status);
    }
    return res;
}

std::optional<fs::path> find_existing_clone(const std::string& url, const fs::path& root,
                                            const RepoInspector& inspector,
                                            const WalkOptions& walk) {
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec))
        return std::nullopt;
    const std::string wanted = git::normalize_remote_url(url);
    RepoWalker walker(root, inspector, walk);
    while (auto dir = walker.next()) {
        auto url = inspector.remote_url(*dir);
        if (url && git::normalize_remote_url(*url) == wanted)
            return *dir;
    }
    return std::nullopt;
}

OpResult clone_repository(const std::string& url, const fs::path& dest,
                          const RepoInspector& inspector, GitClient& client,
                          const fs::path& search_root, const WalkOptions& walk) {
    fs::path target = dest;
    if (target.empty()) {
        std::string name = git::clone_dir_name(url);
        if (name.empty() || name == "." || name == "..")
            throw std::runtime_error("Cannot derive a destination directory from " + url);
        target = name;
    }

    OpResult res;
    if (inspector.is_repository(target)) {
        res.kind = ErrorKind::AlreadyExists;
        res.exit_code = exit_code_for(res.kind);
        res.message = target.string() + " already contains a repository";
        return res;
    }
    if (auto existing = find_existing_clone(url, search_root, inspector, walk)) {
        res.kind = ErrorKind::AlreadyExists;
        res.exit_code = exit_code_for(res.kind);
        res.message = url + " is already cloned at " + existing->string();
        return res;
    }

    if (logger_initialized())
        log_info("Cloning", {{"url", url}, {"dest", target.string()}});
    res = external_result("clone", client.clone(url, target));
    if (!res.ok() && logger_initialized())
        log_error("Clone failed", {{"url", url}, {"status", std::to_string(res.exit_code)}});
    return res;
}

OpResult upload_repository(const fs::path& path, const std::string& target,
                           const RepoInspector& inspector, GitClient& client) {
    OpResult res;
    if (!inspector.is_repository(path)) {
        res.kind = ErrorKind::NotARepository;
        res.exit_code = exit_code_for(res.kind);
        res.message = path.string() + " is not a git repository";
        return res;
    }
    if (logger_initialized())
        log_info("Uploading", {{"path", path.string()}, {"target", target}});
    res = external_result("upload", client.push_all(path, target));
    if (!res.ok() && logger_initialized())
        log_error("Upload failed",
                  {{"path", path.string()}, {"status", std::to_string(res.exit_code)}});
    return res;
}
