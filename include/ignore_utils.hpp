#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <vector>

namespace ignore {

/**
 * Read a list of ignore patterns from a file.
 *
 * Each non-empty, non-comment line is trimmed and kept as one pattern. Lines
 * beginning with '#' are comments. A trailing carriage return is stripped.
 * Missing or unreadable files result in an empty list.
 */
std::vector<std::filesystem::path> read_ignore_file(const std::filesystem::path& file);

/**
 * Check whether a directory matches any ignore pattern.
 *
 * Patterns without a '/' are compared against the directory name, patterns
 * with a '/' against the whole path. `*` and `?` glob characters are honored
 * through fnmatch(3).
 */
bool matches(const std::filesystem::path& path,
             const std::vector<std::filesystem::path>& patterns);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
