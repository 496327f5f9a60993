#ifndef LIFECYCLE_HPP
#define LIFECYCLE_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "metadata_reader.hpp"
#include "repo.hpp"
#include "scanner.hpp"

/**
 * @brief Outcome of a clone or upload.
 */
struct OpResult {
    ErrorKind kind = ErrorKind::None;
    int exit_code = 0;   ///< Process exit status to report
    std::string message; ///< Human readable description, empty on success

    bool ok() const { return kind == ErrorKind::None; }
};

/**
 * @brief External client performing the networked git operations.
 *
 * Each call blocks until the operation finishes and returns its exit status;
 * `-1` means the client could not be started.
 */
class GitClient {
  public:
    virtual ~GitClient() = default;
    virtual int clone(const std::string& url, const std::filesystem::path& dest) = 0;
    virtual int push_all(const std::filesystem::path& repo, const std::string& target) = 0;
};

/**
 * @brief GitClient running the `git` executable with inherited stdio.
 */
class ProcessGitClient : public GitClient {
  public:
    explicit ProcessGitClient(std::string git_program = "git") : git_(std::move(git_program)) {}
    int clone(const std::string& url, const std::filesystem::path& dest) override;
    int push_all(const std::filesystem::path& repo, const std::string& target) override;

  private:
    std::string git_;
};

/**
 * @brief Find a repository under @p root whose primary remote is @p url.
 *
 * URLs are compared after git::normalize_remote_url(), so the HTTPS and SSH
 * spellings of one repository match.
 */
std::optional<std::filesystem::path> find_existing_clone(const std::string& url,
                                                         const std::filesystem::path& root,
                                                         const RepoInspector& inspector,
                                                         const WalkOptions& walk = {});

/**
 * @brief Clone @p url into @p dest unless it is already present.
 *
 * When @p dest is empty the directory name is derived from the URL. Returns
 * ErrorKind::AlreadyExists without calling @p client when @p dest already
 * holds a repository, or when @p search_root is set and a clone of the same
 * remote exists under it. A non-zero client status becomes
 * ErrorKind::ExternalOperationFailed carrying that status.
 *
 * @throws std::runtime_error when no destination can be derived from @p url.
 */
OpResult clone_repository(const std::string& url, const std::filesystem::path& dest,
                          const RepoInspector& inspector, GitClient& client,
                          const std::filesystem::path& search_root = {},
                          const WalkOptions& walk = {});

/**
 * @brief Push every branch of the repository at @p path to @p target.
 *
 * Returns ErrorKind::NotARepository without calling @p client when @p path is
 * not a repository root.
 */
OpResult upload_repository(const std::filesystem::path& path, const std::string& target,
                           const RepoInspector& inspector, GitClient& client);

/** @return Exit code of the `pplaces` process for a failed operation of @p kind. */
int exit_code_for(ErrorKind kind);

#endif // LIFECYCLE_HPP
