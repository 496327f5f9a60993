#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference counts init/shutdown calls, so every thread that touches
 * repositories may hold its own guard.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;

// The utility functions below assume libgit2 is already initialized, except
// is_git_repo which only looks at the filesystem.

/**
 * @brief Determine whether the given path is a repository root.
 *
 * @param p Filesystem path to check.
 * @return `true` if a `.git` directory exists directly inside @a p. Symbolic
 *         links named `.git` are not accepted.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Open the repository rooted at @p repo without searching parents.
 *
 * @param repo  Path to a repository root.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Owned handle or `nullptr` on failure.
 */
git_repository* open_repo(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Open repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` when HEAD
 *         is unborn or unreadable.
 */
std::optional<std::string> get_local_hash(git_repository* repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * A detached HEAD is reported as @ref DETACHED_HEAD. For a repository without
 * commits the branch HEAD points to is returned.
 *
 * @param repo  Open repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(git_repository* repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo   Open repository.
 * @param remote Remote name, usually `origin`.
 * @param error  Optional output string receiving a libgit2 error message.
 * @return Remote URL or `std::nullopt` when the remote is not configured.
 */
std::optional<std::string> get_remote_url(git_repository* repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief List every configured remote as (name, url) pairs in config order.
 */
std::vector<std::pair<std::string, std::string>> list_remotes(git_repository* repo);

/**
 * @brief Check if there are uncommitted changes in the repository.
 *
 * Staged and unstaged modifications always count. Untracked files count
 * only when @p include_untracked is set. Ignored files never count.
 *
 * @param error Optional output string; set when the status could not be read.
 * @return `std::nullopt` if the status list could not be built.
 */
std::optional<bool> has_uncommitted_changes(git_repository* repo, bool include_untracked,
                                            std::string* error = nullptr);

/**
 * @brief Commit time of HEAD, or `std::nullopt` when there are no commits.
 */
std::optional<std::time_t> get_last_commit_time(git_repository* repo,
                                                std::string* error = nullptr);

/**
 * @brief Author name of the HEAD commit, or an empty string.
 */
std::string get_last_commit_author(git_repository* repo);

/**
 * @brief Reduce a remote URL to a comparable form.
 *
 * Lower-cases the host, strips credentials, a trailing slash and a `.git`
 * suffix and maps `git@host:owner/repo` to `host/owner/repo`, so the HTTPS
 * and SSH spellings of one repository compare equal.
 */
std::string normalize_remote_url(const std::string& url);

/**
 * @brief Directory name `git clone` would pick for @p url.
 */
std::string clone_dir_name(const std::string& url);

} // namespace git

#endif // GIT_UTILS_HPP
