#ifndef REPO_HPP
#define REPO_HPP
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Marker stored in RepoRecord::branch when HEAD is detached.
 */
constexpr const char* DETACHED_HEAD = "(detached)";

/**
 * @brief Metadata collected for one discovered repository.
 */
struct RepoRecord {
    std::filesystem::path path;                 ///< Absolute repository root
    std::optional<std::time_t> last_commit_time; ///< Commit time of HEAD, if any
    bool is_dirty = false;                      ///< Working tree differs from HEAD
    std::optional<std::string> remote_url;      ///< URL of the primary remote
    std::string branch;                         ///< Branch name or DETACHED_HEAD
    std::string commit;                         ///< Short hash of HEAD
    std::string last_commit_author;             ///< Author of HEAD commit
    std::vector<std::pair<std::string, std::string>> remotes; ///< All remotes (name, url)
    bool corrupt = false;                       ///< Metadata present but unreadable
    std::string error;                          ///< Reason when @ref corrupt is set
};

/**
 * @brief Classification of errors raised by scanning and lifecycle operations.
 */
enum class ErrorKind {
    None,
    NotARepository,
    PermissionDenied,
    CorruptRepository,
    ExternalOperationFailed,
    AlreadyExists,
    PathNotFound
};

/** @return Stable name of @p kind used in messages and JSON output. */
const char* error_kind_name(ErrorKind kind);

/**
 * @brief A recovered problem met during discovery.
 */
struct ScanWarning {
    std::filesystem::path path;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

/**
 * @brief Filtered, sorted outcome of one scan.
 */
struct ScanResult {
    std::vector<RepoRecord> records;
    std::vector<ScanWarning> warnings;
    size_t candidates = 0; ///< Directories visited by the walker
};

#endif // REPO_HPP
