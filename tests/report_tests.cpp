#include "test_common.hpp"
#include <nlohmann/json.hpp>

static const std::time_t kNow = 1700000000;

static RepoRecord record(const std::string& path, std::optional<std::time_t> when,
                         bool dirty = false) {
    RepoRecord rec;
    rec.path = path;
    rec.last_commit_time = when;
    rec.is_dirty = dirty;
    rec.branch = "main";
    rec.commit = "abc1234";
    rec.last_commit_author = "Ada";
    return rec;
}

TEST_CASE("Paths report lists one path per line") {
    ScanResult r;
    r.records = {record("/w/a", kNow), record("/w/b", std::nullopt)};
    ReportOptions opts;
    opts.now = kNow;
    REQUIRE(format_report(r, opts) == "/w/a\n/w/b\n");
    REQUIRE(format_report(ScanResult{}, opts).empty());
}

TEST_CASE("Summary report aligns ages and marks dirty trees") {
    ScanResult r;
    r.records = {record("/w/long-name", kNow - 3 * 3600, true), record("/w/x", std::nullopt)};
    ReportOptions opts;
    opts.style = ReportStyle::Summary;
    opts.now = kNow;
    REQUIRE(format_report(r, opts) == "/w/long-name  3h ago *\n"
                                      "/w/x          no commits\n");
}

TEST_CASE("Full report prints every field") {
    ScanResult r;
    RepoRecord rec = record("/w/a", kNow - 2 * 86400, true);
    rec.remote_url = "https://example.com/a.git";
    rec.remotes = {{"origin", "https://example.com/a.git"}, {"fork", "git@example.com:me/a"}};
    RepoRecord bad = record("/w/b", std::nullopt);
    bad.branch.clear();
    bad.commit.clear();
    bad.last_commit_author.clear();
    bad.corrupt = true;
    bad.error = "bad object database";
    r.records = {rec, bad};
    r.warnings = {{"/w/b", ErrorKind::CorruptRepository, "bad object database"}};

    ReportOptions opts;
    opts.full = true;
    opts.now = kNow;
    std::string expected = "/w/a\n"
                           "  branch:  main\n"
                           "  commit:  abc1234\n"
                           "  dirty:   yes\n"
                           "  date:    " +
                           format_commit_time(kNow - 2 * 86400) +
                           " (2d ago)\n"
                           "  author:  Ada\n"
                           "  remote:  https://example.com/a.git\n"
                           "  remotes: origin https://example.com/a.git\n"
                           "  remotes: fork git@example.com:me/a\n"
                           "/w/b\n"
                           "  branch:  -\n"
                           "  commit:  -\n"
                           "  dirty:   no\n"
                           "  date:    -\n"
                           "  author:  -\n"
                           "  remote:  -\n"
                           "  error:   bad object database\n"
                           "2 repositories, 1 warning\n";
    REQUIRE(format_report(r, opts) == expected);
}

TEST_CASE("JSON report is an array of records") {
    ScanResult r;
    RepoRecord rec = record("/w/a", kNow, false);
    rec.remote_url = "https://example.com/a.git";
    rec.remotes = {{"origin", "https://example.com/a.git"}};
    RepoRecord empty = record("/w/b", std::nullopt);
    empty.corrupt = true;
    empty.error = "oops";
    r.records = {rec, empty};

    ReportOptions opts;
    opts.json = true;
    opts.full = true;
    auto j = nlohmann::json::parse(format_report(r, opts));
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["path"] == "/w/a");
    REQUIRE(j[0]["branch"] == "main");
    REQUIRE(j[0]["commit"] == "abc1234");
    REQUIRE(j[0]["dirty"] == false);
    REQUIRE(j[0]["last_commit_time"] == static_cast<long long>(kNow));
    REQUIRE(j[0]["last_commit_date"] == format_commit_time(kNow));
    REQUIRE(j[0]["author"] == "Ada");
    REQUIRE(j[0]["remote_url"] == "https://example.com/a.git");
    REQUIRE(j[0]["remotes"][0]["name"] == "origin");
    REQUIRE_FALSE(j[0].contains("error"));
    REQUIRE(j[1]["last_commit_time"].is_null());
    REQUIRE(j[1]["remote_url"].is_null());
    REQUIRE(j[1]["error"] == "oops");

    REQUIRE(nlohmann::json::parse(format_report(ScanResult{}, opts)).empty());
}

TEST_CASE("Warnings name the path and kind") {
    std::vector<ScanWarning> w{{"/w/locked", ErrorKind::PermissionDenied, "Permission denied"}};
    REQUIRE(format_warnings(w) ==
            "warning: /w/locked: permission-denied: Permission denied\n");
    REQUIRE(format_warnings({}).empty());
}
