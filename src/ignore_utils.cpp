#include "ignore_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <string>

namespace {

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

} // namespace

namespace ignore {

std::vector<std::filesystem::path> read_ignore_file(const std::filesystem::path& file) {
    std::vector<std::filesystem::path> entries;
    std::ifstream ifs(file);
    if (!ifs)
        return entries;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.emplace_back(line);
    }
    return entries;
}

bool matches(const std::filesystem::path& path,
             const std::vector<std::filesystem::path>& patterns) {
    const std::string full = path.generic_string();
    const std::string name = path.filename().generic_string();

    for (const auto& pat : patterns) {
        std::string pat_str = pat.generic_string();
        while (pat_str.size() > 1 && pat_str.back() == '/')
            pat_str.pop_back();
        const bool has_dirsep = pat_str.find('/') != std::string::npos;
        const std::string& subject = has_dirsep ? full : name;
        const bool has_glob =
            pat_str.find('*') != std::string::npos || pat_str.find('?') != std::string::npos;
        if (!has_glob) {
            if (subject == pat_str)
                return true;
            continue;
        }
        if (fnmatch(pat_str.c_str(), subject.c_str(), 0) == 0)
            return true;
    }
    return false;
}

} // namespace ignore
