#include "test_common.hpp"
#include "ignore_utils.hpp"

TEST_CASE("read_ignore_file trims whitespace and skips comments") {
    TempDir dir("ign_parse");
    fs::path file = dir.path / "ignore.txt";
    std::ofstream ofs(file);
    ofs << "  foo  \n#comment\nbar\r\n   \n\t#another\n\tbaz  \n";
    ofs.close();
    auto entries = ignore::read_ignore_file(file);
    std::vector<fs::path> expected{"foo", "bar", "baz"};
    REQUIRE(entries == expected);
}

TEST_CASE("read_ignore_file returns nothing for a missing file") {
    REQUIRE(ignore::read_ignore_file("/nonexistent/pplaces/ignore").empty());
}

TEST_CASE("ignore patterns match names or whole paths") {
    std::vector<fs::path> patterns{"node_modules", "/srv/cache", "vendor/"};
    REQUIRE(ignore::matches("/home/u/app/node_modules", patterns));
    REQUIRE(ignore::matches("/srv/cache", patterns));
    REQUIRE(ignore::matches("/home/u/vendor", patterns));
    REQUIRE_FALSE(ignore::matches("/srv/cache2", patterns));
    REQUIRE_FALSE(ignore::matches("/home/u/node_modules_old", patterns));
    REQUIRE_FALSE(ignore::matches("/srv/cache/inner", patterns));
}

TEST_CASE("ignore pattern matching supports wildcards") {
    std::vector<fs::path> patterns{"**/build/*", "*.tmp", "tmp-?"};
    REQUIRE(ignore::matches(fs::path("foo/build/output"), patterns));
    REQUIRE(ignore::matches(fs::path("dir/file.tmp"), patterns));
    REQUIRE(ignore::matches(fs::path("/w/tmp-1"), patterns));
    REQUIRE_FALSE(ignore::matches(fs::path("/w/tmp-10"), patterns));
    REQUIRE_FALSE(ignore::matches(fs::path("src/main"), patterns));
}
