#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "metadata_reader.hpp"
#include "repo.hpp"

/**
 * @brief Traversal limits applied by RepoWalker.
 */
struct WalkOptions {
    std::vector<std::filesystem::path> ignore; ///< Directories never entered
    size_t max_depth = 0;                      ///< 0 means unlimited
};

/**
 * @brief Lazy depth-first walk yielding repository roots under a directory.
 *
 * Each call to next() resumes the walk. A repository root is yielded and its
 * contents are never visited, symbolic links are never followed and
 * unreadable directories are skipped with a PermissionDenied warning.
 * Construct a new walker to restart.
 */
class RepoWalker {
  public:
    RepoWalker(const std::filesystem::path& root, const RepoInspector& inspector,
               WalkOptions opts = {});

    /** @return Next repository root, or nothing when the walk is complete. */
    std::optional<std::filesystem::path> next();

    /** @return Warnings collected so far. */
    const std::vector<ScanWarning>& warnings() const { return warnings_; }

    /** @return Number of directories visited so far. */
    size_t visited() const { return visited_; }

  private:
    struct Pending {
        std::filesystem::path dir;
        size_t depth;
    };

    bool ignored(const std::filesystem::path& dir) const;
    void push_children(const Pending& entry);

    const RepoInspector& inspector_;
    WalkOptions opts_;
    std::vector<Pending> stack_;
    std::vector<ScanWarning> warnings_;
    size_t visited_ = 0;
};

/**
 * @brief Drain a RepoWalker into a vector.
 *
 * @param warnings Receives the walker's warnings when non-null.
 */
std::vector<std::filesystem::path> build_repo_list(const std::filesystem::path& root,
                                                   const RepoInspector& inspector,
                                                   const WalkOptions& opts,
                                                   std::vector<ScanWarning>* warnings = nullptr,
                                                   size_t* visited = nullptr);

/**
 * @brief Explicit configuration of one scan.
 */
struct ScanConfig {
    std::filesystem::path root;
    WalkOptions walk;
    size_t concurrency = 1; ///< Inspection workers; 1 runs inline
};

/**
 * @brief Row selection and verbosity for a report.
 */
struct FilterCriteria {
    std::optional<unsigned int> days_to_show; ///< Keep commits at most N days old
    bool full = false;                        ///< Include every field in output
    std::time_t now = 0;                      ///< Reference time; 0 means current time
};

/**
 * @brief Raised when a scan cannot start.
 */
class ScanError : public std::runtime_error {
  public:
    ScanError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
};

/**
 * @brief Check whether a record passes the age filter in @p criteria.
 *
 * Records without a commit never pass a day filter.
 */
bool passes_filter(const RepoRecord& rec, const FilterCriteria& criteria);

/**
 * @brief Sort records by path, comparing path components in order.
 */
void sort_records(std::vector<RepoRecord>& records);

/**
 * @brief Walk, inspect, filter and sort.
 *
 * Discovery problems are returned as warnings and never stop the scan.
 *
 * @throws ScanError with ErrorKind::PathNotFound when the root is not a
 *         directory.
 */
ScanResult aggregate(const ScanConfig& config, const FilterCriteria& criteria,
                     const RepoInspector& inspector);

#endif // SCANNER_HPP
