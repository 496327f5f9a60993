#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    TempDir dir("cfg_yaml");
    fs::path cfg = dir.path / "cfg.yaml";
    pplaces::test_support::write_file(cfg, "days-to-show: 7\nfull: true\nroot: /srv/code\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--days-to-show"] == "7");
    REQUIRE(opts["--full"] == "true");
    REQUIRE(opts["--root"] == "/srv/code");
}

TEST_CASE("YAML config categories and lists") {
    TempDir dir("cfg_yaml_cat");
    fs::path cfg = dir.path / "cfg.yaml";
    pplaces::test_support::write_file(cfg, "Discovery:\n  ignore:\n    - node_modules\n    - build\n"
                                           "Logging:\n  log-level: DEBUG\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--ignore"] == "node_modules\nbuild");
    REQUIRE(opts["--log-level"] == "DEBUG");
}

TEST_CASE("YAML config with a scalar root is rejected") {
    TempDir dir("cfg_yaml_bad");
    fs::path cfg = dir.path / "cfg.yaml";
    pplaces::test_support::write_file(cfg, "- just\n- a list\n");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("JSON config categories") {
    TempDir dir("cfg_json");
    fs::path cfg = dir.path / "cfg_cat.json";
    pplaces::test_support::write_file(
        cfg, "{\n  \"Report\": {\n    \"days-to-show\": 10,\n    \"json\": true\n  },\n  "
             "\"Logging\": {\n    \"log-level\": \"DEBUG\"\n  },\n  \"ignore\": [\"a\", \"b\"]\n}");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--days-to-show"] == "10");
    REQUIRE(opts["--json"] == "true");
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--ignore"] == "a\nb");
}

TEST_CASE("JSON config reports parse errors") {
    TempDir dir("cfg_json_bad");
    fs::path cfg = dir.path / "bad.json";
    pplaces::test_support::write_file(cfg, "{ \"full\": ");
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("Missing config file") {
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/pplaces.yaml", opts, err));
    REQUIRE(err == "Failed to open file");
}
