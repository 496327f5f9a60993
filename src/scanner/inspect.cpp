#include "metadata_reader.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::NotARepository:
        return "not-a-repository";
    case ErrorKind::PermissionDenied:
        return "permission-denied";
    case ErrorKind::CorruptRepository:
        return "corrupt-repository";
    case ErrorKind::ExternalOperationFailed:
        return "external-operation-failed";
    case ErrorKind::AlreadyExists:
        return "already-exists";
    case ErrorKind::PathNotFound:
        return "path-not-found";
    }
    return "unknown";
}

bool MetadataReader::is_repository(const fs::path& dir) const { return git::is_git_repo(dir); }

std::unique_ptr<MetadataReader> make_reader(const std::string& backend) {
    if (backend.empty() || backend == "libgit2")
        return std::make_unique<LibGit2Reader>();
    if (backend == "cli")
        return std::make_unique<GitCliReader>();
    throw std::runtime_error("Unknown backend: " + backend + " (expected libgit2 or cli)");
}

std::optional<std::string> RepoInspector::remote_url(const fs::path& dir) const {
    if (!reader_.is_repository(dir))
        return std::nullopt;
    try {
        return reader_.read_remote(dir, opts_.remote_name);
    } catch (const MetadataError& e) {
        if (logger_initialized())
            log_warning("Unreadable remote", {{"path", dir.string()}, {"error", e.what()}});
        return std::nullopt;
    }
}

std::optional<RepoRecord> RepoInspector::inspect(const fs::path& dir) const {
    if (!reader_.is_repository(dir))
        return std::nullopt;
    std::error_code ec;
    fs::path abs = fs::absolute(dir, ec);
    if (ec)
        abs = dir;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs != abs.root_path())
        abs = abs.parent_path();
    try {
        RepoRecord rec = reader_.read(abs, opts_);
        rec.path = abs;
        if (rec.corrupt && logger_initialized())
            log_warning("Partial metadata", {{"path", abs.string()}, {"error", rec.error}});
        return rec;
    } catch (const std::exception& e) {
        RepoRecord rec;
        rec.path = abs;
        rec.corrupt = true;
        rec.error = e.what();
        if (logger_initialized())
            log_warning("Unreadable repository", {{"path", abs.string()}, {"error", rec.error}});
        return rec;
    }
}
