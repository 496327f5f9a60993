#include "scanner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "logger.hpp"
#include "thread_compat.hpp"
#include "time_utils.hpp"

namespace fs = std::filesystem;

bool passes_filter(const RepoRecord& rec, const FilterCriteria& criteria) {
    if (!criteria.days_to_show)
        return true;
    if (!rec.last_commit_time)
        return false;
    std::time_t now = criteria.now != 0 ? criteria.now : std::time(nullptr);
    long long age = static_cast<long long>(now) - static_cast<long long>(*rec.last_commit_time);
    long long limit = static_cast<long long>(*criteria.days_to_show) * 86400LL;
    return age <= limit;
}

void sort_records(std::vector<RepoRecord>& records) {
    std::sort(records.begin(), records.end(),
              [](const RepoRecord& a, const RepoRecord& b) { return a.path < b.path; });
}

static void inspect_all(const std::vector<fs::path>& candidates, const RepoInspector& inspector,
                        size_t concurrency, std::vector<std::optional<RepoRecord>>& slots) {
    slots.assign(candidates.size(), std::nullopt);
    concurrency = std::min(concurrency, candidates.size());
    if (concurrency <= 1) {
        for (size_t i = 0; i < candidates.size(); ++i)
            slots[i] = inspector.inspect(candidates[i]);
        return;
    }

    // Each worker owns the slots it claims, so results need no lock.
    std::atomic<size_t> next_index{0};
    std::atomic<bool> running{true};
    std::exception_ptr failure;
    std::mutex failure_mtx;
    auto worker = [&]() {
        try {
            while (running) {
                size_t idx = next_index.fetch_add(1);
                if (idx >= candidates.size())
                    break;
                slots[idx] = inspector.inspect(candidates[idx]);
            }
        } catch (const std::exception& e) {
            if (logger_initialized())
                log_error(std::string("Worker thread exception: ") + e.what());
            std::lock_guard<std::mutex> lk(failure_mtx);
            if (!failure)
                failure = std::current_exception();
            running = false;
        }
    };

    {
        std::vector<th_compat::jthread> threads;
        threads.reserve(concurrency);
        for (size_t i = 0; i < concurrency; ++i)
            threads.emplace_back(worker);
    }
    if (failure)
        std::rethrow_exception(failure);
}

ScanResult aggregate(const ScanConfig& config, const FilterCriteria& criteria,
                     const RepoInspector& inspector) {
    std::error_code ec;
    if (config.root.empty() || !fs::is_directory(config.root, ec))
        throw ScanError(ErrorKind::PathNotFound, config.root.string() + " is not a directory");

    if (logger_initialized())
        log_debug("Scanning", {{"root", config.root.string()},
                               {"threads", std::to_string(config.concurrency)}});

    auto start = std::chrono::steady_clock::now();
    ScanResult result;
    std::vector<fs::path> candidates =
        build_repo_list(config.root, inspector, config.walk, &result.warnings, &result.candidates);

    std::vector<std::optional<RepoRecord>> slots;
    inspect_all(candidates, inspector, std::max<size_t>(config.concurrency, 1), slots);

    for (auto& slot : slots) {
        if (!slot)
            continue;
        if (slot->corrupt)
            result.warnings.push_back({slot->path, ErrorKind::CorruptRepository, slot->error});
        if (passes_filter(*slot, criteria))
            result.records.push_back(std::move(*slot));
    }
    sort_records(result.records);
    std::stable_sort(result.warnings.begin(), result.warnings.end(),
                     [](const ScanWarning& a, const ScanWarning& b) { return a.path < b.path; });

    if (logger_initialized()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start);
        log_info("Scan complete", {{"root", config.root.string()},
                                   {"repositories", std::to_string(candidates.size())},
                                   {"shown", std::to_string(result.records.size())},
                                   {"warnings", std::to_string(result.warnings.size())},
                                   {"elapsed", format_duration_short(elapsed)}});
    }
    return result;
}
