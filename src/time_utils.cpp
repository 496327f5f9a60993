#include "time_utils.hpp"
#include <chrono>
#include <ctime>

static std::string format_local(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    return format_local(std::chrono::system_clock::to_time_t(now));
}

std::string format_commit_time(std::time_t t) { return format_local(t); }

std::string format_duration_short(std::chrono::seconds dur) {
    long long total = dur.count();
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = (total / 3600) % 24;
    long long d = total / 86400;
    std::string out;
    if (d > 0)
        out += std::to_string(d) + "d";
    if (h > 0 || d > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0 || d > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}

std::string format_age(std::chrono::seconds dur) {
    long long total = dur.count();
    if (total < 0)
        return "in future";
    if (total < 60)
        return "just now";
    if (total < 3600)
        return std::to_string(total / 60) + "m ago";
    if (total < 86400)
        return std::to_string(total / 3600) + "h ago";
    return std::to_string(total / 86400) + "d ago";
}
