#include "test_common.hpp"
#include <catch2/generators/catch_generators.hpp>
#include <algorithm>
#include <memory>

using pplaces::test_support::git_in;
using pplaces::test_support::make_git_repo;
using pplaces::test_support::make_marker_repo;
using pplaces::test_support::write_file;

static const std::time_t kCommitTime = 1600000000;

static std::optional<RepoRecord> inspect_with(const std::string& backend, const fs::path& repo,
                                              ReadOptions opts = {}) {
    std::unique_ptr<MetadataReader> reader = make_reader(backend);
    RepoInspector inspector(*reader, opts);
    return inspector.inspect(repo);
}

TEST_CASE("make_reader selects a backend") {
    REQUIRE(dynamic_cast<LibGit2Reader*>(make_reader("libgit2").get()) != nullptr);
    REQUIRE(dynamic_cast<GitCliReader*>(make_reader("cli").get()) != nullptr);
    REQUIRE_THROWS_AS(make_reader("svn"), std::runtime_error);
}

TEST_CASE("Inspector skips plain directories") {
    TempDir dir("insp_plain");
    REQUIRE_FALSE(inspect_with("libgit2", dir.path));
    REQUIRE_FALSE(inspect_with("cli", dir.path));
}

TEST_CASE("Inspector reads a committed repository") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_commit");
    fs::path repo = dir.path / "proj";
    make_git_repo(repo, kCommitTime);
    git_in(repo, "branch -m trunk");

    auto rec = inspect_with(backend, repo);
    REQUIRE(rec);
    REQUIRE(rec->path == repo);
    REQUIRE_FALSE(rec->corrupt);
    REQUIRE(rec->last_commit_time);
    REQUIRE(*rec->last_commit_time == kCommitTime);
    REQUIRE(rec->branch == "trunk");
    REQUIRE(rec->commit.size() == 7);
    REQUIRE(rec->last_commit_author == "tester");
    REQUIRE_FALSE(rec->is_dirty);
    REQUIRE_FALSE(rec->remote_url);
    REQUIRE(rec->remotes.empty());
}

TEST_CASE("Inspector reports a repository without commits") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_unborn");
    make_git_repo(dir.path);
    git_in(dir.path, "symbolic-ref HEAD refs/heads/fresh");

    auto rec = inspect_with(backend, dir.path);
    REQUIRE(rec);
    REQUIRE_FALSE(rec->corrupt);
    REQUIRE_FALSE(rec->last_commit_time);
    REQUIRE(rec->commit.empty());
    REQUIRE(rec->branch == "fresh");
    REQUIRE_FALSE(rec->is_dirty);
}

TEST_CASE("Inspector detects dirty working trees") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_dirty");
    make_git_repo(dir.path, kCommitTime);

    SECTION("untracked file counts unless disabled") {
        write_file(dir.path / "new.txt", "x");
        REQUIRE(inspect_with(backend, dir.path)->is_dirty);
        ReadOptions opts;
        opts.include_untracked = false;
        REQUIRE_FALSE(inspect_with(backend, dir.path, opts)->is_dirty);
    }
    SECTION("modified tracked file") {
        write_file(dir.path / "file.txt", "changed");
        ReadOptions opts;
        opts.include_untracked = false;
        REQUIRE(inspect_with(backend, dir.path, opts)->is_dirty);
    }
    SECTION("staged change") {
        write_file(dir.path / "staged.txt", "s");
        git_in(dir.path, "add staged.txt");
        ReadOptions opts;
        opts.include_untracked = false;
        REQUIRE(inspect_with(backend, dir.path, opts)->is_dirty);
    }
    SECTION("ignored file does not count") {
        write_file(dir.path / ".git" / "info" / "exclude", "*.log\n");
        write_file(dir.path / "build.log", "x");
        REQUIRE_FALSE(inspect_with(backend, dir.path)->is_dirty);
    }
}

TEST_CASE("Inspector reports a detached HEAD") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_detached");
    make_git_repo(dir.path, kCommitTime);
    REQUIRE(git_in(dir.path, "checkout -q --detach") == 0);
    auto rec = inspect_with(backend, dir.path);
    REQUIRE(rec);
    REQUIRE(rec->branch == DETACHED_HEAD);
    REQUIRE(*rec->last_commit_time == kCommitTime);
}

TEST_CASE("Inspector reads remotes") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_remote");
    make_git_repo(dir.path, kCommitTime);
    git_in(dir.path, "remote add origin https://example.com/team/proj.git");
    git_in(dir.path, "remote add upstream git@example.com:up/proj.git");

    auto rec = inspect_with(backend, dir.path);
    REQUIRE(rec);
    REQUIRE(rec->remote_url == std::optional<std::string>("https://example.com/team/proj.git"));
    REQUIRE(rec->remotes.size() == 2);
    auto has = [&](const std::string& name, const std::string& url) {
        return std::find(rec->remotes.begin(), rec->remotes.end(),
                         std::make_pair(name, url)) != rec->remotes.end();
    };
    REQUIRE(has("origin", "https://example.com/team/proj.git"));
    REQUIRE(has("upstream", "git@example.com:up/proj.git"));

    ReadOptions opts;
    opts.remote_name = "upstream";
    REQUIRE(inspect_with(backend, dir.path, opts)->remote_url ==
            std::optional<std::string>("git@example.com:up/proj.git"));
    opts.remote_name = "missing";
    REQUIRE_FALSE(inspect_with(backend, dir.path, opts)->remote_url);
}

TEST_CASE("Inspector reads a single remote without a full read") {
    if (!have_git()) {
        WARN("git not available");
        return;
    }
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_remote_only");
    make_git_repo(dir.path);
    git_in(dir.path, "remote add origin https://example.com/team/proj.git");
    std::unique_ptr<MetadataReader> reader = make_reader(backend);
    RepoInspector inspector(*reader, {});
    REQUIRE(inspector.remote_url(dir.path) ==
            std::optional<std::string>("https://example.com/team/proj.git"));
    REQUIRE_FALSE(reader->read_remote(dir.path, "upstream"));
    REQUIRE_FALSE(inspector.remote_url(dir.path / ".git"));
}

TEST_CASE("Inspector flags unreadable metadata as corrupt") {
    std::string backend = GENERATE(as<std::string>{}, "libgit2", "cli");
    INFO("backend " << backend);
    TempDir dir("insp_corrupt");
    make_marker_repo(dir.path / "broken");
    auto rec = inspect_with(backend, dir.path / "broken");
    REQUIRE(rec);
    REQUIRE(rec->corrupt);
    REQUIRE_FALSE(rec->error.empty());
    REQUIRE_FALSE(rec->last_commit_time);
}

TEST_CASE("Inspector records absolute paths") {
    TempDir dir("insp_abs");
    make_marker_repo(dir.path / "r");
    FakeReader reader;
    RepoInspector inspector(reader, {});
    std::error_code ec;
    fs::path old = fs::current_path();
    fs::current_path(dir.path);
    auto rec = inspector.inspect("r/");
    fs::current_path(old, ec);
    REQUIRE(rec);
    REQUIRE(rec->path == dir.path / "r");
}
