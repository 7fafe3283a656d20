#include <sshcopy/config.hpp>
#include <sshcopy/pattern.hpp>
#include <sshcopy/remote_path.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace sshcopy {

namespace {

CopyError type_error(const std::string& key, const char* expected) {
    return CopyError{CopyError::Config, key + " must be " + expected};
}

Status read_string(const toml::table& tbl, const char* section, const char* key,
                   std::optional<std::string>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<std::string>();
    if (!v) return type_error(std::string(section) + "." + key, "a string");
    out = *v;
    return ok_status();
}

Status read_bool(const toml::table& tbl, const char* section, const char* key,
                 std::optional<bool>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    if (!node.is_boolean()) return type_error(std::string(section) + "." + key, "true or false");
    out = node.value<bool>();
    return ok_status();
}

Status read_int(const toml::table& tbl, const char* section, const char* key,
                std::optional<int64_t>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    if (!node.is_integer()) return type_error(std::string(section) + "." + key, "an integer");
    out = node.value<int64_t>();
    return ok_status();
}

// Integer key that must fit in [lo, hi] before it is stored as an int.
Status read_int_in_range(const toml::table& tbl, const char* section, const char* key,
                         int64_t lo, int64_t hi, std::optional<int>& out) {
    std::optional<int64_t> n;
    SSHCOPY_TRY(read_int(tbl, section, key, n));
    if (!n) return ok_status();
    if (*n < lo || *n > hi) {
        std::string range = "an integer between " + std::to_string(lo) + " and " +
                            std::to_string(hi);
        return type_error(std::string(section) + "." + key, range.c_str());
    }
    out = static_cast<int>(*n);
    return ok_status();
}

void warn_unknown_keys(const toml::table& tbl, const char* section,
                       std::initializer_list<const char*> known) {
    for (const auto& [key, val] : tbl) {
        (void)val;
        bool found = false;
        for (const char* k : known) {
            if (key.str() == k) found = true;
        }
        if (!found) {
            log::warn("unknown key '%s.%s' in config", section, std::string(key.str()).c_str());
        }
    }
}

Status parse_connection(const toml::table& tbl, ConnectionConfig& conn) {
    warn_unknown_keys(tbl, "connection", {"host", "port", "username", "password",
        "private-key-file", "private-key", "ready-timeout", "command-timeout",
        "strict-host-key-checking"});

    std::optional<std::string> s;
    SSHCOPY_TRY(read_string(tbl, "connection", "host", s));
    if (s) conn.host = *s;
    s.reset();
    SSHCOPY_TRY(read_string(tbl, "connection", "username", s));
    if (s) conn.username = *s;
    s.reset();
    SSHCOPY_TRY(read_string(tbl, "connection", "private-key-file", s));
    if (s) conn.private_key_file = *s;
    s.reset();
    SSHCOPY_TRY(read_string(tbl, "connection", "private-key", s));
    if (s) conn.private_key = *s;
    SSHCOPY_TRY(read_string(tbl, "connection", "password", conn.password));

    constexpr int64_t kIntMax = std::numeric_limits<int>::max();
    SSHCOPY_TRY(read_int_in_range(tbl, "connection", "port", 1, 65535, conn.port));
    SSHCOPY_TRY(read_int_in_range(tbl, "connection", "ready-timeout", 1, kIntMax,
                                  conn.ready_timeout_ms));
    SSHCOPY_TRY(read_int_in_range(tbl, "connection", "command-timeout", 1, kIntMax,
                                  conn.command_timeout_ms));

    SSHCOPY_TRY(read_bool(tbl, "connection", "strict-host-key-checking",
                          conn.strict_host_key_checking));
    return ok_status();
}

Status parse_contents(const toml::table& tbl, CopySection& copy) {
    auto node = tbl["contents"];
    if (!node) return ok_status();

    // Either an array of patterns or one newline-separated block
    if (auto block = node.value<std::string>()) {
        copy.contents = split_patterns(*block);
        return ok_status();
    }

    auto arr = node.as_array();
    if (!arr) return type_error("copy.contents", "a string or an array of strings");

    std::vector<std::string> patterns;
    for (const auto& el : *arr) {
        auto v = el.value<std::string>();
        if (!v) return type_error("copy.contents", "a string or an array of strings");
        std::string p = trim(*v);
        if (!p.empty()) patterns.push_back(std::move(p));
    }
    copy.contents = std::move(patterns);
    return ok_status();
}

Status parse_copy(const toml::table& tbl, CopySection& copy) {
    warn_unknown_keys(tbl, "copy", {"source-folder", "contents", "target-folder",
        "clean-target-folder", "clean-hidden-files-in-target", "is-windows-on-target",
        "overwrite", "fail-on-empty-source", "flatten-folders", "batch-size"});

    SSHCOPY_TRY(read_string(tbl, "copy", "source-folder", copy.source_folder));
    SSHCOPY_TRY(read_string(tbl, "copy", "target-folder", copy.target_folder));
    SSHCOPY_TRY(parse_contents(tbl, copy));

    SSHCOPY_TRY(read_bool(tbl, "copy", "clean-target-folder", copy.clean_target_folder));
    SSHCOPY_TRY(read_bool(tbl, "copy", "clean-hidden-files-in-target",
                          copy.clean_hidden_files_in_target));
    SSHCOPY_TRY(read_bool(tbl, "copy", "is-windows-on-target", copy.is_windows_on_target));
    SSHCOPY_TRY(read_bool(tbl, "copy", "overwrite", copy.overwrite));
    SSHCOPY_TRY(read_bool(tbl, "copy", "fail-on-empty-source", copy.fail_on_empty_source));
    SSHCOPY_TRY(read_bool(tbl, "copy", "flatten-folders", copy.flatten_folders));

    std::optional<int64_t> n;
    SSHCOPY_TRY(read_int(tbl, "copy", "batch-size", n));
    if (n) {
        if (*n <= 0) return type_error("copy.batch-size", "a positive integer");
        copy.batch_size = static_cast<size_t>(*n);
    }
    return ok_status();
}

template<typename T>
void override_if_set(std::optional<T>& dst, const std::optional<T>& src) {
    if (src.has_value()) dst = src;
}

void override_if_set(std::string& dst, const std::string& src) {
    if (!src.empty()) dst = src;
}

} // namespace

std::vector<std::string> split_patterns(const std::string& block) {
    std::vector<std::string> out;
    std::istringstream stream(block);
    std::string line;
    while (std::getline(stream, line)) {
        std::string p = trim(line);
        if (!p.empty()) out.push_back(std::move(p));
    }
    return out;
}

Result<CopyConfig> CopyConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CopyError{CopyError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    CopyConfig cfg;

    if (auto conn = doc["connection"].as_table()) {
        SSHCOPY_TRY(parse_connection(*conn, cfg.connection));
    }

    if (auto copy = doc["copy"].as_table()) {
        SSHCOPY_TRY(parse_copy(*copy, cfg.copy));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            log::Level lvl;
            if (!log::parse_level(*v, lvl)) {
                return CopyError{CopyError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = lvl;
        }
    }

    return Result<CopyConfig>::ok(std::move(cfg));
}

Result<CopyConfig> CopyConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CopyError{CopyError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto parsed = CopyConfig::parse(ss.str());
    if (parsed.is_err()) parsed.error().file = path;
    return parsed;
}

void CopyConfig::merge(const CopyConfig& other) {
    override_if_set(connection.host, other.connection.host);
    override_if_set(connection.username, other.connection.username);
    override_if_set(connection.private_key_file, other.connection.private_key_file);
    override_if_set(connection.private_key, other.connection.private_key);
    override_if_set(connection.port, other.connection.port);
    override_if_set(connection.password, other.connection.password);
    override_if_set(connection.ready_timeout_ms, other.connection.ready_timeout_ms);
    override_if_set(connection.command_timeout_ms, other.connection.command_timeout_ms);
    override_if_set(connection.strict_host_key_checking,
                    other.connection.strict_host_key_checking);

    override_if_set(copy.source_folder, other.copy.source_folder);
    override_if_set(copy.contents, other.copy.contents);
    override_if_set(copy.target_folder, other.copy.target_folder);
    override_if_set(copy.clean_target_folder, other.copy.clean_target_folder);
    override_if_set(copy.clean_hidden_files_in_target, other.copy.clean_hidden_files_in_target);
    override_if_set(copy.is_windows_on_target, other.copy.is_windows_on_target);
    override_if_set(copy.overwrite, other.copy.overwrite);
    override_if_set(copy.fail_on_empty_source, other.copy.fail_on_empty_source);
    override_if_set(copy.flatten_folders, other.copy.flatten_folders);
    override_if_set(copy.batch_size, other.copy.batch_size);

    override_if_set(log_level, other.log_level);
}

void CopyConfig::apply_environment() {
    if (connection.password.has_value()) return;
    if (const char* pw = std::getenv("SSHCOPY_PASSWORD")) {
        connection.password = std::string(pw);
    }
}

Status CopyConfig::validate() const {
    if (connection.host.empty()) {
        return CopyError{CopyError::Config, "connection.host is not set"};
    }
    if (connection.username.empty()) {
        return CopyError{CopyError::Config, "connection.username is not set"};
    }
    int port = connection.effective_port();
    if (port < 1 || port > 65535) {
        return CopyError{CopyError::Config,
            "connection.port out of range: " + std::to_string(port)};
    }
    if (connection.effective_ready_timeout_ms() <= 0) {
        return CopyError{CopyError::Config, "connection.ready-timeout must be positive"};
    }
    if (connection.effective_command_timeout_ms() <= 0) {
        return CopyError{CopyError::Config, "connection.command-timeout must be positive"};
    }
    if (!connection.private_key_file.empty() && !connection.private_key.empty()) {
        return CopyError{CopyError::Config,
            "connection.private-key-file and connection.private-key are mutually exclusive"};
    }
    if (!copy.source_folder.has_value() || copy.source_folder->empty()) {
        return CopyError{CopyError::Config, "copy.source-folder is not set"};
    }
    if (!copy.contents.has_value() || copy.contents->empty()) {
        return CopyError{CopyError::Config, "copy.contents has no patterns",
            "use \"**\" to copy the whole source folder"};
    }
    return ok_status();
}

CopyOptions CopyConfig::copy_options() const {
    CopyOptions opts;
    opts.source_folder = copy.source_folder.value_or("");
    opts.contents = copy.contents.value_or(std::vector<std::string>{});
    opts.target_folder = normalize_target_folder(copy.target_folder.value_or(""));
    opts.clean_target_folder = copy.clean_target_folder.value_or(false);
    opts.clean_hidden_files_in_target = copy.clean_hidden_files_in_target.value_or(false);
    opts.is_windows_on_target = copy.is_windows_on_target.value_or(false);
    opts.overwrite = copy.overwrite.value_or(true);
    opts.fail_on_empty_source = copy.fail_on_empty_source.value_or(false);
    opts.flatten_folders = copy.flatten_folders.value_or(false);
    opts.batch_size = copy.batch_size.value_or(kDefaultBatchSize);
    return opts;
}

CopyConfig CopyConfig::effective(const std::optional<CopyConfig>& global,
                                 const std::optional<CopyConfig>& job) {
    CopyConfig result;
    if (global.has_value()) result.merge(global.value());
    if (job.has_value()) result.merge(job.value());
    result.apply_environment();
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sshcopy/config.toml";
}

} // namespace sshcopy
