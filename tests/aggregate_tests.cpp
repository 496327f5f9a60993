#include "test_common.hpp"
#include <algorithm>

using pplaces::test_support::make_marker_repo;
using pplaces::test_support::write_file;

static const std::time_t kNow = 1700000000;
static const std::time_t kDay = 86400;

static void fake_repo(const fs::path& repo, std::time_t commit_time, bool dirty = false) {
    make_marker_repo(repo);
    if (commit_time != 0)
        write_file(repo / ".git" / "time", std::to_string(static_cast<long long>(commit_time)));
    if (dirty)
        write_file(repo / ".git" / "dirty", "");
}

static ScanResult run(const fs::path& root, std::optional<unsigned int> days, size_t threads = 1) {
    FakeReader reader;
    RepoInspector inspector(reader, {});
    ScanConfig cfg;
    cfg.root = root;
    cfg.concurrency = threads;
    FilterCriteria criteria;
    criteria.days_to_show = days;
    criteria.now = kNow;
    return aggregate(cfg, criteria, inspector);
}

static std::vector<fs::path> paths(const ScanResult& r) {
    std::vector<fs::path> out;
    for (const auto& rec : r.records)
        out.push_back(rec.path);
    return out;
}

TEST_CASE("Aggregate day filter examples") {
    TempDir dir("agg_filter");
    fake_repo(dir.path / "A", kNow - 2 * kDay);
    fake_repo(dir.path / "B", kNow - 10 * kDay);
    fake_repo(dir.path / "C", 0);
    ScanResult r = run(dir.path, 5u);
    REQUIRE(paths(r) == std::vector<fs::path>{dir.path / "A"});

    ScanResult all = run(dir.path, std::nullopt);
    REQUIRE(all.records.size() == 3);
}

TEST_CASE("passes_filter boundary is inclusive") {
    RepoRecord rec;
    FilterCriteria criteria;
    criteria.now = kNow;
    criteria.days_to_show = 1u;
    rec.last_commit_time = kNow - kDay;
    REQUIRE(passes_filter(rec, criteria));
    rec.last_commit_time = kNow - kDay - 1;
    REQUIRE_FALSE(passes_filter(rec, criteria));
    rec.last_commit_time = kNow + kDay;
    REQUIRE(passes_filter(rec, criteria));
    rec.last_commit_time.reset();
    REQUIRE_FALSE(passes_filter(rec, criteria));
    criteria.days_to_show.reset();
    REQUIRE(passes_filter(rec, criteria));
}

TEST_CASE("sort_records compares path components") {
    std::vector<RepoRecord> recs(3);
    recs[0].path = "/r/a-b";
    recs[1].path = "/r/a/b";
    recs[2].path = "/r/a";
    sort_records(recs);
    REQUIRE(recs[0].path == fs::path("/r/a"));
    REQUIRE(recs[1].path == fs::path("/r/a/b"));
    REQUIRE(recs[2].path == fs::path("/r/a-b"));
}

TEST_CASE("Aggregate results are identical for any thread count") {
    TempDir dir("agg_threads");
    for (int i = 0; i < 24; ++i) {
        fs::path repo = dir.path / ("g" + std::to_string(i % 4)) / ("repo" + std::to_string(i));
        fake_repo(repo, kNow - i * kDay, i % 3 == 0);
    }
    ScanResult seq = run(dir.path, 12u, 1);
    ScanResult par = run(dir.path, 12u, 8);
    REQUIRE(seq.records.size() == 13);
    REQUIRE(paths(seq) == paths(par));
    for (size_t i = 0; i < seq.records.size(); ++i)
        REQUIRE(seq.records[i].is_dirty == par.records[i].is_dirty);
    std::vector<fs::path> sorted = paths(seq);
    std::sort(sorted.begin(), sorted.end());
    REQUIRE(sorted == paths(seq));
}

TEST_CASE("Aggregate is idempotent") {
    TempDir dir("agg_idem");
    fake_repo(dir.path / "x", kNow);
    fake_repo(dir.path / "y" / "z", kNow - kDay);
    REQUIRE(paths(run(dir.path, std::nullopt)) == paths(run(dir.path, std::nullopt)));
}

TEST_CASE("Aggregate keeps corrupt repositories as warnings") {
    TempDir dir("agg_corrupt");
    fake_repo(dir.path / "good", kNow);
    fake_repo(dir.path / "bad", kNow);
    write_file(dir.path / "bad" / ".git" / "broken", "");
    ScanResult r = run(dir.path, std::nullopt, 4);
    REQUIRE(r.records.size() == 2);
    REQUIRE(r.records[0].path == dir.path / "bad");
    REQUIRE(r.records[0].corrupt);
    REQUIRE_FALSE(r.records[0].last_commit_time);
    REQUIRE(r.warnings.size() == 1);
    REQUIRE(r.warnings[0].kind == ErrorKind::CorruptRepository);
    REQUIRE(r.warnings[0].message == "bad object database");

    // Without a commit time a corrupt record is dropped by a day filter.
    ScanResult filtered = run(dir.path, 30u);
    REQUIRE(paths(filtered) == std::vector<fs::path>{dir.path / "good"});
    REQUIRE(filtered.warnings.size() == 1);
}

TEST_CASE("Aggregate rejects a missing root") {
    FakeReader reader;
    RepoInspector inspector(reader, {});
    ScanConfig cfg;
    cfg.root = "/nonexistent/pplaces/root";
    try {
        aggregate(cfg, FilterCriteria{}, inspector);
        FAIL("expected ScanError");
    } catch (const ScanError& e) {
        REQUIRE(e.kind() == ErrorKind::PathNotFound);
    }
}

TEST_CASE("Aggregate counts visited directories") {
    TempDir dir("agg_count");
    fake_repo(dir.path / "a" / "r", kNow);
    fs::create_directories(dir.path / "b");
    ScanResult r = run(dir.path, std::nullopt);
    // root, a, a/r, b
    REQUIRE(r.candidates == 4);
}
