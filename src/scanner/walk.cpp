#include "scanner.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

RepoWalker::RepoWalker(const fs::path& root, const RepoInspector& inspector, WalkOptions opts)
    : inspector_(inspector), opts_(std::move(opts)) {
    std::error_code ec;
    fs::path start = fs::absolute(root, ec);
    if (ec)
        start = root;
    start = start.lexically_normal();
    if (!start.has_filename() && start.has_parent_path() && start != start.root_path())
        start = start.parent_path();
    if (fs::is_directory(start, ec))
        stack_.push_back({start, 0});
}

bool RepoWalker::ignored(const fs::path& dir) const {
    return !opts_.ignore.empty() && ignore::matches(dir, opts_.ignore);
}

void RepoWalker::push_children(const Pending& entry) {
    auto warn = [&](const std::error_code& err) {
        ScanWarning w{entry.dir, ErrorKind::PermissionDenied, err.message()};
        if (logger_initialized())
            log_warning("Cannot read directory",
                        {{"path", entry.dir.string()}, {"error", w.message}});
        warnings_.push_back(std::move(w));
    };

    std::error_code ec;
    fs::directory_iterator it(entry.dir, ec);
    if (ec) {
        warn(ec);
        return;
    }
    std::vector<fs::path> children;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code st_ec;
        // Links are never entered, whatever they point to.
        if (it->is_symlink(st_ec) || !it->is_directory(st_ec))
            continue;
        const fs::path& p = it->path();
        if (p.filename() == ".git" || ignored(p))
            continue;
        children.push_back(p);
    }
    if (ec)
        warn(ec);
    std::sort(children.begin(), children.end());
    // Reverse push so the stack pops children in name order.
    for (auto rit = children.rbegin(); rit != children.rend(); ++rit)
        stack_.push_back({std::move(*rit), entry.depth + 1});
}

std::optional<fs::path> RepoWalker::next() {
    while (!stack_.empty()) {
        Pending entry = std::move(stack_.back());
        stack_.pop_back();
        ++visited_;
        if (inspector_.is_repository(entry.dir))
            return entry.dir;
        if (opts_.max_depth > 0 && entry.depth >= opts_.max_depth)
            continue;
        push_children(entry);
    }
    return std::nullopt;
}

std::vector<fs::path> build_repo_list(const fs::path& root, const RepoInspector& inspector,
                                      const WalkOptions& opts, std::vector<ScanWarning>* warnings,
                                      size_t* visited) {
    RepoWalker walker(root, inspector, opts);
    std::vector<fs::path> result;
    while (auto p = walker.next())
        result.push_back(std::move(*p));
    if (warnings)
        warnings->insert(warnings->end(), walker.warnings().begin(), walker.warnings().end());
    if (visited)
        *visited = walker.visited();
    return result;
}
