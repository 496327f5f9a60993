#ifndef REPORT_HPP
#define REPORT_HPP
#include <ctime>
#include <string>
#include <vector>
#include "repo.hpp"

/**
 * @brief Terse layouts used when neither `full` nor `json` is requested.
 */
enum class ReportStyle {
    Paths,  ///< One repository path per line
    Summary ///< Path, age of the last commit and a `*` when dirty
};

struct ReportOptions {
    ReportStyle style = ReportStyle::Paths;
    bool full = false;   ///< Per-repository block with every field
    bool json = false;   ///< JSON array; takes precedence over the other layouts
    std::time_t now = 0; ///< Reference time for ages; 0 means current time
};

/**
 * @brief Render the records of @p result.
 *
 * Records are printed in the order they appear in @p result. The returned
 * text ends with a newline unless it is empty.
 */
std::string format_report(const ScanResult& result, const ReportOptions& opts);

/**
 * @brief Render one line per warning: `warning: <path>: <kind>: <message>`.
 */
std::string format_warnings(const std::vector<ScanWarning>& warnings);

#endif // REPORT_HPP
