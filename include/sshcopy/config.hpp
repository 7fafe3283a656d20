#pragma once

#include <sshcopy/log.hpp>
#include <sshcopy/orchestrator.hpp>
#include <sshcopy/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sshcopy {

inline constexpr int kDefaultSshPort = 22;
inline constexpr int kDefaultReadyTimeoutMs = 20000;
inline constexpr int kDefaultCommandTimeoutMs = 600000;

// [connection] section
struct ConnectionConfig {
    std::string host;
    std::optional<int> port;             // unset -> 22
    std::string username;
    std::optional<std::string> password; // also the private-key passphrase
    std::string private_key_file;
    std::string private_key;             // inline key text
    std::optional<int> ready_timeout_ms;
    std::optional<int> command_timeout_ms; // remote clean command
    std::optional<bool> strict_host_key_checking;

    int effective_port() const { return port.value_or(kDefaultSshPort); }
    int effective_ready_timeout_ms() const {
        return ready_timeout_ms.value_or(kDefaultReadyTimeoutMs);
    }
    int effective_command_timeout_ms() const {
        return command_timeout_ms.value_or(kDefaultCommandTimeoutMs);
    }
};

// [copy] section. Optional fields are unset until a layer provides them.
struct CopySection {
    std::optional<std::string> source_folder;
    std::optional<std::vector<std::string>> contents;
    std::optional<std::string> target_folder;
    std::optional<bool> clean_target_folder;
    std::optional<bool> clean_hidden_files_in_target;
    std::optional<bool> is_windows_on_target;
    std::optional<bool> overwrite;
    std::optional<bool> fail_on_empty_source;
    std::optional<bool> flatten_folders;
    std::optional<size_t> batch_size;
};

// Layered job configuration: global (~/.sshcopy/config.toml) < job file
// < environment. Later layers override only the keys they set.
struct CopyConfig {
    ConnectionConfig connection;
    CopySection copy;
    std::optional<log::Level> log_level;

    // Load from a TOML file
    static Result<CopyConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<CopyConfig> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const CopyConfig& other);

    // Fill gaps from the environment (SSHCOPY_PASSWORD).
    void apply_environment();

    // Check required keys and value ranges.
    Status validate() const;

    // Copy options with defaults applied and the target folder normalized.
    CopyOptions copy_options() const;

    static CopyConfig effective(const std::optional<CopyConfig>& global,
                                const std::optional<CopyConfig>& job);
};

// Discover the global config file path: ~/.sshcopy/config.toml
std::string global_config_path();

// Split a newline-delimited pattern block into trimmed, non-empty patterns.
std::vector<std::string> split_patterns(const std::string& block);

} // namespace sshcopy
