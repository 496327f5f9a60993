#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <map>
#include <cstring>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--days-to-show", "-d", "<n>", "Only list repos with a commit in the last N days",
         "Report"},
        {"--full", "-f", "", "Show branch, commit, dirtiness, author and remotes", "Report"},
        {"--json", "-j", "", "Print the report as JSON", "Report"},
        {"--silent", "-s", "", "Do not print scan warnings", "Report"},
        {"--root", "-o", "<path>", "Root used by show and the clone check", "Discovery"},
        {"--ignore", "-I", "<dir>", "Directory or glob to skip (repeatable)", "Discovery"},
        {"--ignore-file", "", "<file>", "Read skip patterns from a file", "Discovery"},
        {"--max-depth", "-D", "<n>", "Limit recursion depth below the root", "Discovery"},
        {"--threads", "-t", "<n>", "Inspect repositories with N workers (0 = cores)",
         "Discovery"},
        {"--remote", "", "<name>", "Remote reported as the repo URL (default origin)",
         "Discovery"},
        {"--backend", "", "<libgit2|cli>", "How git metadata is read", "Discovery"},
        {"--ignore-untracked", "", "", "Untracked files do not make a repo dirty", "Discovery"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<file>", "Write a log file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log above this size (K/M/G)", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Mirror the log file to syslog (needs --log-file)", "Logging"},
        {"--version", "-V", "", "Print the version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    os << "pplaces - find and summarize git repositories\n\n";
    os << "Usage: " << prog << " [options] scan <path>\n";
    os << "       " << prog << " [options] show\n";
    os << "       " << prog << " [options] clone <url> [<dest>]\n";
    os << "       " << prog << " [options] upload <path> <target>\n";
    os << "       " << prog << " help\n\n";
    os << "Options are also read from $XDG_CONFIG_HOME/pplaces/config.yaml or config.json.\n\n";
    const std::vector<std::string> order{"Basics", "Report", "Discovery", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o) << o->desc
               << "\n";
        os << "\n";
    }
}
