#include <catch2/catch.hpp>
#include <sshcopy/config.hpp>
#include "temp_dir.hpp"
#include <cstdlib>

using namespace sshcopy;
using sshcopy::testing::TempDir;

static const char* kJob = R"(
[connection]
host = "deploy.example.com"
username = "ci"
password = "hunter2"

[copy]
source-folder = "build/out"
contents = ["**/*.so", "!**/test_*"]
target-folder = "~/app"
)";

// ===== Parsing =====

TEST_CASE("parse a full job file", "[config]") {
    auto r = CopyConfig::parse(R"(
[connection]
host = "10.0.0.5"
port = 2222
username = "deploy"
private-key-file = "/home/ci/.ssh/id_ed25519"
ready-timeout = 5000
strict-host-key-checking = true

[copy]
source-folder = "out"
contents = "**/*.bin\n!**/*.map\n"
target-folder = "/opt/app"
clean-target-folder = true
clean-hidden-files-in-target = true
is-windows-on-target = false
overwrite = false
fail-on-empty-source = true
flatten-folders = true
batch-size = 4

[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.connection.host == "10.0.0.5");
    REQUIRE(cfg.connection.effective_port() == 2222);
    REQUIRE(cfg.connection.private_key_file == "/home/ci/.ssh/id_ed25519");
    REQUIRE(cfg.connection.effective_ready_timeout_ms() == 5000);
    REQUIRE(cfg.connection.strict_host_key_checking == true);
    REQUIRE_FALSE(cfg.connection.password.has_value());

    REQUIRE(*cfg.copy.contents == std::vector<std::string>{"**/*.bin", "!**/*.map"});
    REQUIRE(*cfg.copy.overwrite == false);
    REQUIRE(*cfg.copy.batch_size == 4);
    REQUIRE(*cfg.log_level == log::Debug);

    auto opts = cfg.copy_options();
    REQUIRE(opts.target_folder == "/opt/app");
    REQUIRE(opts.clean_target_folder);
    REQUIRE(opts.clean_hidden_files_in_target);
    REQUIRE(opts.fail_on_empty_source);
    REQUIRE(opts.flatten_folders);
    REQUIRE_FALSE(opts.overwrite);
}

TEST_CASE("defaults apply to unset keys", "[config]") {
    auto r = CopyConfig::parse(kJob);
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE_FALSE(cfg.connection.port.has_value());
    REQUIRE(cfg.connection.effective_port() == 22);
    REQUIRE(cfg.connection.effective_ready_timeout_ms() == 20000);

    auto opts = cfg.copy_options();
    REQUIRE(opts.target_folder == "./app");
    REQUIRE(opts.overwrite);
    REQUIRE_FALSE(opts.clean_target_folder);
    REQUIRE_FALSE(opts.flatten_folders);
    REQUIRE(opts.batch_size == kDefaultBatchSize);
    REQUIRE(opts.contents == std::vector<std::string>{"**/*.so", "!**/test_*"});
}

TEST_CASE("parse empty config", "[config]") {
    auto r = CopyConfig::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().connection.host.empty());
    REQUIRE(r.value().copy_options().target_folder == "./");
}

TEST_CASE("invalid TOML is a parse error with a line", "[config]") {
    auto r = CopyConfig::parse("[copy]\nsource-folder = \n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CopyError::Parse);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("type mismatches are config errors", "[config]") {
    auto port = CopyConfig::parse("[connection]\nport = \"22\"\n");
    REQUIRE(port.is_err());
    REQUIRE(port.error().code == CopyError::Config);
    REQUIRE(port.error().message.find("connection.port") != std::string::npos);

    auto flag = CopyConfig::parse("[copy]\noverwrite = \"yes\"\n");
    REQUIRE(flag.error().message.find("copy.overwrite") != std::string::npos);

    auto contents = CopyConfig::parse("[copy]\ncontents = [1, 2]\n");
    REQUIRE(contents.error().code == CopyError::Config);

    auto batch = CopyConfig::parse("[copy]\nbatch-size = 0\n");
    REQUIRE(batch.error().message.find("batch-size") != std::string::npos);

    auto level = CopyConfig::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(level.error().code == CopyError::Config);
}

TEST_CASE("integers too wide for their setting are rejected", "[config]") {
    auto wrapped = CopyConfig::parse("[connection]\nport = 4294967318\n");
    REQUIRE(wrapped.is_err());
    REQUIRE(wrapped.error().code == CopyError::Config);
    REQUIRE(wrapped.error().message.find("connection.port") != std::string::npos);

    auto zero_port = CopyConfig::parse("[connection]\nport = 0\n");
    REQUIRE(zero_port.error().code == CopyError::Config);

    auto timeout = CopyConfig::parse("[connection]\nready-timeout = 3000000000\n");
    REQUIRE(timeout.is_err());
    REQUIRE(timeout.error().message.find("connection.ready-timeout") != std::string::npos);

    auto command = CopyConfig::parse("[connection]\ncommand-timeout = -1\n");
    REQUIRE(command.error().message.find("connection.command-timeout") != std::string::npos);

    auto top = CopyConfig::parse("[connection]\nport = 65535\n");
    REQUIRE(top.is_ok());
    REQUIRE(top.value().connection.effective_port() == 65535);
}

TEST_CASE("command timeout has a default and can be set", "[config]") {
    auto unset = CopyConfig::parse(kJob);
    REQUIRE(unset.value().connection.effective_command_timeout_ms() == kDefaultCommandTimeoutMs);

    auto set = CopyConfig::parse("[connection]\ncommand-timeout = 1500\n");
    REQUIRE(set.is_ok());
    REQUIRE(set.value().connection.effective_command_timeout_ms() == 1500);
}

TEST_CASE("unknown keys are tolerated", "[config]") {
    auto r = CopyConfig::parse("[copy]\nsource-folder = \"x\"\nspeed = 11\n");
    REQUIRE(r.is_ok());
    REQUIRE(*r.value().copy.source_folder == "x");
}

// ===== Layers =====

TEST_CASE("job layer overrides only the keys it sets", "[config]") {
    auto global = CopyConfig::parse(R"(
[connection]
host = "shared.example.com"
port = 2200
username = "shared"

[copy]
overwrite = false
)");
    auto job = CopyConfig::parse(R"(
[connection]
username = "job"

[copy]
source-folder = "dist"
contents = ["**"]
)");
    REQUIRE(global.is_ok());
    REQUIRE(job.is_ok());

    auto cfg = CopyConfig::effective(global.value(), job.value());
    REQUIRE(cfg.connection.host == "shared.example.com");
    REQUIRE(cfg.connection.effective_port() == 2200);
    REQUIRE(cfg.connection.username == "job");
    REQUIRE(*cfg.copy.source_folder == "dist");
    REQUIRE(cfg.copy_options().overwrite == false);
}

TEST_CASE("explicit false in a later layer wins", "[config]") {
    auto base = CopyConfig::parse("[copy]\nflatten-folders = true\n");
    auto top = CopyConfig::parse("[copy]\nflatten-folders = false\n");
    CopyConfig cfg = base.value();
    cfg.merge(top.value());
    REQUIRE(cfg.copy_options().flatten_folders == false);
}

#ifndef _WIN32
TEST_CASE("password comes from the environment when no layer sets it", "[config]") {
    setenv("SSHCOPY_PASSWORD", "from-env", 1);

    auto no_pw = CopyConfig::parse("[connection]\nhost = \"h\"\n");
    auto cfg = CopyConfig::effective(std::nullopt, no_pw.value());
    REQUIRE(cfg.connection.password == std::string("from-env"));

    auto with_pw = CopyConfig::parse(kJob);
    auto cfg2 = CopyConfig::effective(std::nullopt, with_pw.value());
    REQUIRE(cfg2.connection.password == std::string("hunter2"));

    unsetenv("SSHCOPY_PASSWORD");
}
#endif

// ===== Validation =====

TEST_CASE("validate accepts a complete job", "[config]") {
    auto r = CopyConfig::parse(kJob);
    REQUIRE(r.value().validate().is_ok());
}

TEST_CASE("validate reports missing and out-of-range settings", "[config]") {
    auto cfg = CopyConfig::parse(kJob).value();

    auto no_host = cfg;
    no_host.connection.host.clear();
    REQUIRE(no_host.validate().error().message.find("connection.host") != std::string::npos);

    auto bad_port = cfg;
    bad_port.connection.port = 70000;
    REQUIRE(bad_port.validate().error().code == CopyError::Config);

    auto both_keys = cfg;
    both_keys.connection.private_key_file = "/k";
    both_keys.connection.private_key = "inline";
    REQUIRE(both_keys.validate().error().message.find("mutually exclusive") != std::string::npos);

    auto no_source = cfg;
    no_source.copy.source_folder.reset();
    REQUIRE(no_source.validate().error().message.find("source-folder") != std::string::npos);

    auto no_patterns = cfg;
    no_patterns.copy.contents = std::vector<std::string>{};
    auto err = no_patterns.validate();
    REQUIRE(err.error().message.find("contents") != std::string::npos);
    REQUIRE(err.error().hint.find("**") != std::string::npos);
}

TEST_CASE("load reads a file and tags errors with its path", "[config]") {
    TempDir td;
    td.write_file("job.toml", kJob);
    td.write_file("broken.toml", "[copy\n");

    auto ok = CopyConfig::load(td.root() + "/job.toml");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().connection.username == "ci");

    auto broken = CopyConfig::load(td.root() + "/broken.toml");
    REQUIRE(broken.is_err());
    REQUIRE(broken.error().file == td.root() + "/broken.toml");

    auto missing = CopyConfig::load(td.root() + "/nope.toml");
    REQUIRE(missing.error().code == CopyError::IO);
}

TEST_CASE("split_patterns", "[config]") {
    REQUIRE(split_patterns("a\n\n  b  \r\n!c") == std::vector<std::string>{"a", "b", "!c"});
    REQUIRE(split_patterns("").empty());
}
