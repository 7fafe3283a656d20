// sshcopy: copy a selection of local files to a remote host over SFTP.
//
//     sshcopy job.toml
//     sshcopy --dry-run -v job.toml
//     sshcopy -c shared.toml job.toml
//
// Exit status: 0 on success, 1 when the copy run fails, 2 for usage or
// configuration errors.

#include <sshcopy/config.hpp>
#include <sshcopy/log.hpp>
#include <sshcopy/orchestrator.hpp>
#include <sshcopy/result.hpp>
#include <sshcopy/sftp_transport.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace sshcopy;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "usage: sshcopy [options] <job.toml>\n"
    "\n"
    "options:\n"
    "  -c, --config <file>  global config (default ~/.sshcopy/config.toml)\n"
    "  -v, --verbose        debug output\n"
    "  -q, --quiet          warnings and errors only\n"
    "      --no-color       disable colored output\n"
    "      --dry-run        show what would be copied without connecting\n"
    "  -h, --help           show this help\n";

struct CliArgs {
    std::string job_file;
    std::string global_config;
    bool verbose = false;
    bool quiet = false;
    bool no_color = false;
    bool dry_run = false;
    bool help = false;
};

Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            args.help = true;
        } else if (a == "-v" || a == "--verbose") {
            args.verbose = true;
        } else if (a == "-q" || a == "--quiet") {
            args.quiet = true;
        } else if (a == "--no-color") {
            args.no_color = true;
        } else if (a == "--dry-run") {
            args.dry_run = true;
        } else if (a == "-c" || a == "--config") {
            if (i + 1 >= argc) {
                return CopyError{CopyError::InvalidArg, a + " needs a file argument"};
            }
            args.global_config = argv[++i];
        } else if (!a.empty() && a[0] == '-') {
            return CopyError{CopyError::InvalidArg, "unknown option: " + a,
                "run 'sshcopy --help' for the list of options"};
        } else if (args.job_file.empty()) {
            args.job_file = a;
        } else {
            return CopyError{CopyError::InvalidArg, "unexpected argument: " + a};
        }
    }

    if (!args.help && args.job_file.empty()) {
        return CopyError{CopyError::InvalidArg, "no job file specified",
            "usage: sshcopy [options] <job.toml>"};
    }
    if (args.verbose && args.quiet) {
        return CopyError{CopyError::InvalidArg, "--verbose and --quiet are mutually exclusive"};
    }
    return Result<CliArgs>::ok(std::move(args));
}

// Global config is optional unless named explicitly with -c.
Result<std::optional<CopyConfig>> load_global(const CliArgs& args) {
    std::string path = args.global_config;
    bool required = !path.empty();
    if (path.empty()) path = global_config_path();

    std::error_code ec;
    if (path.empty() || (!required && !fs::exists(path, ec))) {
        return Result<std::optional<CopyConfig>>::ok(std::nullopt);
    }

    auto loaded = CopyConfig::load(path);
    SSHCOPY_TRY(loaded);
    log::debug("loaded global config %s", path.c_str());
    return Result<std::optional<CopyConfig>>::ok(std::move(loaded).value());
}

Result<CopyConfig> load_config(const CliArgs& args) {
    auto global = load_global(args);
    SSHCOPY_TRY(global);

    auto job = CopyConfig::load(args.job_file);
    SSHCOPY_TRY(job);

    CopyConfig cfg = CopyConfig::effective(global.value(), job.value());
    SSHCOPY_TRY(cfg.validate());
    return Result<CopyConfig>::ok(std::move(cfg));
}

void apply_log_settings(const CliArgs& args, const CopyConfig& cfg) {
    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (args.verbose) log::set_level(log::Debug);
    if (args.quiet) log::set_level(log::Warn);
    if (args.no_color) log::set_color_enabled(false);
}

int dry_run(const CopyOptions& opts) {
    if (is_whole_tree(opts.contents)) {
        std::cout << "copy directory " << normalize_source_root(opts.source_folder)
                  << " -> " << normalize_target_folder(opts.target_folder) << "\n";
        return kExitOk;
    }

    auto plan = plan_copy(opts);
    if (plan.is_err()) {
        std::cerr << plan.error().format() << "\n";
        return kExitRunFailed;
    }

    const CopyPlan& p = plan.value();
    if (p.files.empty()) {
        std::cout << "nothing to copy\n";
        return opts.fail_on_empty_source ? kExitRunFailed : kExitOk;
    }
    for (const auto& dir : p.directories) {
        std::cout << "mkdir  " << dir << "\n";
    }
    for (const auto& f : p.files) {
        std::cout << "copy   " << f.local << " -> " << f.remote << "\n";
    }
    std::cout << p.files.size() << " file(s), " << p.directories.size()
              << " folder(s)\n";
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return kExitUsage;
    }
    if (args.value().help) {
        std::cout << kUsage;
        return kExitOk;
    }

    if (args.value().no_color) log::set_color_enabled(false);

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return kExitUsage;
    }
    apply_log_settings(args.value(), cfg.value());

    CopyOptions opts = cfg.value().copy_options();
    if (args.value().dry_run) {
        return dry_run(opts);
    }

    SftpTransport transport(cfg.value().connection);
    auto result = run_copy(opts, transport);
    if (result.is_err()) {
        log::error("copy failed");
        std::cerr << result.error().format() << "\n";
        return kExitRunFailed;
    }

    const CopyReport& report = result.value();
    if (report.whole_tree) {
        log::info("copied %s", opts.source_folder.c_str());
    } else if (!report.nothing_to_copy) {
        log::info("%zu file(s) copied, %zu folder(s) created",
                  report.files_copied, report.directories_created);
    }
    return kExitOk;
}
