#include "cli_commands.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "git_utils.hpp"
#include "logger.hpp"
#include "metadata_reader.hpp"
#include "report.hpp"

namespace fs = std::filesystem;

namespace cli {

void setup_logging(const LoggingOptions& opts) {
    if (!opts.log_file.empty()) {
        set_json_logging(opts.json_log);
        set_log_compression(opts.compress_logs);
        init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
    }
    if (opts.use_syslog)
        init_syslog();
}

ScanConfig make_scan_config(const Options& opts) {
    ScanConfig cfg;
    cfg.root = opts.root;
    cfg.walk.ignore = opts.ignore_dirs;
    cfg.walk.max_depth = opts.max_depth;
    cfg.concurrency = opts.concurrency;
    return cfg;
}

static ReadOptions read_options(const Options& opts) {
    ReadOptions ro;
    ro.remote_name = opts.remote_name;
    ro.include_untracked = opts.include_untracked;
    return ro;
}

static int run_report(const Options& opts, ReportStyle style, std::ostream& out,
                      std::ostream& err) {
    std::unique_ptr<MetadataReader> reader = make_reader(opts.backend);
    RepoInspector inspector(*reader, read_options(opts));
    FilterCriteria criteria;
    criteria.days_to_show = opts.days_to_show;
    criteria.full = opts.full;

    ScanResult result;
    try {
        // Keeps libgit2 initialized across the whole scan.
        git::GitInitGuard guard;
        result = aggregate(make_scan_config(opts), criteria, inspector);
    } catch (const ScanError& e) {
        err << e.what() << "\n";
        if (logger_initialized())
            log_error(e.what());
        return exit_code_for(e.kind());
    }

    ReportOptions ropts;
    ropts.style = style;
    ropts.full = opts.full;
    ropts.json = opts.json;
    out << format_report(result, ropts);
    out.flush();
    if (!opts.silent)
        err << format_warnings(result.warnings);
    return 0;
}

int handle_scan(const Options& opts, std::ostream& out, std::ostream& err) {
    return run_report(opts, ReportStyle::Paths, out, err);
}

int handle_show(const Options& opts, std::ostream& out, std::ostream& err) {
    return run_report(opts, ReportStyle::Summary, out, err);
}

int handle_clone(const Options& opts, GitClient& client, std::ostream& err) {
    std::unique_ptr<MetadataReader> reader = make_reader(opts.backend);
    RepoInspector inspector(*reader, read_options(opts));
    const std::string& url = opts.args.at(0);
    fs::path dest = opts.args.size() > 1 ? fs::path(opts.args[1]) : fs::path();
    WalkOptions walk;
    walk.ignore = opts.ignore_dirs;
    walk.max_depth = opts.max_depth;
    OpResult res = [&] {
        git::GitInitGuard guard;
        return clone_repository(url, dest, inspector, client, opts.search_root, walk);
    }();
    if (!res.ok())
        err << "clone: " << res.message << "\n";
    return res.exit_code;
}

int handle_upload(const Options& opts, GitClient& client, std::ostream& err) {
    std::unique_ptr<MetadataReader> reader = make_reader(opts.backend);
    RepoInspector inspector(*reader, read_options(opts));
    OpResult res = upload_repository(opts.args.at(0), opts.args.at(1), inspector, client);
    if (!res.ok())
        err << "upload: " << res.message << "\n";
    return res.exit_code;
}

int run_command(const Options& opts, GitClient& client) {
    switch (opts.command) {
    case Command::Scan:
        return handle_scan(opts);
    case Command::Show:
        return handle_show(opts);
    case Command::Clone:
        return handle_clone(opts, client);
    case Command::Upload:
        return handle_upload(opts, client);
    case Command::Help:
    case Command::None:
        break;
    }
    return 1;
}

} // namespace cli
