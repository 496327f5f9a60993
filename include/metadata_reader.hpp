#ifndef METADATA_READER_HPP
#define METADATA_READER_HPP
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "repo.hpp"

/**
 * @brief Settings that influence how repository metadata is read.
 */
struct ReadOptions {
    std::string remote_name = "origin"; ///< Remote reported as RepoRecord::remote_url
    bool include_untracked = true;      ///< Untracked files make a repository dirty
};

/**
 * @brief Raised by a reader when a repository cannot be opened at all.
 */
class MetadataError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Capability reading git metadata for one repository.
 *
 * Implementations must be safe to call from several threads at once for
 * different paths.
 */
class MetadataReader {
  public:
    virtual ~MetadataReader() = default;

    /** @return `true` when @p dir directly contains git metadata. */
    virtual bool is_repository(const std::filesystem::path& dir) const;

    /**
     * @brief Read everything cheaply available about the repository.
     *
     * Fields that cannot be read are left at their defaults and the record is
     * flagged `corrupt` with a message. Throws MetadataError only when the
     * repository cannot be opened.
     */
    virtual RepoRecord read(const std::filesystem::path& repo, const ReadOptions& opts) const = 0;

    /**
     * @brief Read only the URL of @p remote, without touching the work tree.
     *
     * @return Nothing when the remote is not configured. Throws MetadataError
     *         when the repository cannot be opened.
     */
    virtual std::optional<std::string> read_remote(const std::filesystem::path& repo,
                                                   const std::string& remote) const = 0;
};

/**
 * @brief Reader backed by libgit2.
 */
class LibGit2Reader : public MetadataReader {
  public:
    RepoRecord read(const std::filesystem::path& repo, const ReadOptions& opts) const override;
    std::optional<std::string> read_remote(const std::filesystem::path& repo,
                                           const std::string& remote) const override;
};

/**
 * @brief Reader that runs the `git` executable for each query.
 */
class GitCliReader : public MetadataReader {
  public:
    explicit GitCliReader(std::string git_program = "git") : git_(std::move(git_program)) {}
    RepoRecord read(const std::filesystem::path& repo, const ReadOptions& opts) const override;
    std::optional<std::string> read_remote(const std::filesystem::path& repo,
                                           const std::string& remote) const override;

  private:
    std::string git_;
};

/**
 * @brief Create the reader named @p backend (`libgit2` or `cli`).
 *
 * @throws std::runtime_error for an unknown backend name.
 */
std::unique_ptr<MetadataReader> make_reader(const std::string& backend);

/**
 * @brief Classifies candidate directories and builds their records.
 */
class RepoInspector {
  public:
    RepoInspector(const MetadataReader& reader, ReadOptions opts)
        : reader_(reader), opts_(std::move(opts)) {}

    /** @return `true` if @p dir is a repository root. */
    bool is_repository(const std::filesystem::path& dir) const {
        return reader_.is_repository(dir);
    }

    /**
     * @brief Inspect @p dir.
     *
     * @return Nothing when @p dir is not a repository root; otherwise a record,
     *         flagged `corrupt` when the metadata could not be read.
     */
    std::optional<RepoRecord> inspect(const std::filesystem::path& dir) const;

    /**
     * @brief URL of the configured remote of the repository at @p dir.
     *
     * Nothing when @p dir is not a repository, has no such remote or cannot
     * be opened.
     */
    std::optional<std::string> remote_url(const std::filesystem::path& dir) const;

  private:
    const MetadataReader& reader_;
    ReadOptions opts_;
};

#endif // METADATA_READER_HPP
