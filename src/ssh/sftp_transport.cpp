#include <sshcopy/sftp_transport.hpp>
#include <sshcopy/log.hpp>
#include <sshcopy/remote_path.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace sshcopy {

namespace {

constexpr size_t kChunkSize = 64 * 1024;
constexpr int kDirMode = 0755;
constexpr int kFileMode = 0644;

// Cumulative prefixes of a remote directory: "a/b/c" -> "a", "a/b", "a/b/c".
std::vector<std::string> directory_prefixes(const std::string& remote_path) {
    std::string norm = posix_normalize(unixy_path(remote_path));
    std::vector<std::string> prefixes;
    if (norm == "." || norm == "/" || norm == "./") return prefixes;
    if (!norm.empty() && norm.back() == '/') norm.pop_back();

    size_t pos = norm[0] == '/' ? 1 : 0;
    while (pos <= norm.size()) {
        size_t slash = norm.find('/', pos);
        if (slash == std::string::npos) slash = norm.size();
        std::string prefix = norm.substr(0, slash);
        // ".." components resolve on the server
        if (!prefix.empty() && base_name(prefix) != "..") prefixes.push_back(prefix);
        pos = slash + 1;
    }
    return prefixes;
}

} // namespace

SftpTransport::SftpTransport(ConnectionConfig config)
    : config_(std::move(config)) {}

SftpTransport::~SftpTransport() {
    close();
}

bool SftpTransport::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr && sftp_ != nullptr;
}

std::string SftpTransport::last_error() const {
    if (!session_) return "no session";
    return ssh_get_error(session_);
}

Status SftpTransport::ensure_connected() const {
    if (!session_ || !sftp_) {
        return CopyError{CopyError::Connection, "not connected"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

Status SftpTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();

    const int port = config_.effective_port();
    if (!config_.port.has_value()) {
        log::info("port not specified, using default port %d", kDefaultSshPort);
    }
    log::debug("connecting to %s@%s:%d", config_.username.c_str(), config_.host.c_str(), port);

    session_ = ssh_new();
    if (!session_) {
        return CopyError{CopyError::Connection, "ssh_new() failed"};
    }

    long timeout_sec = (config_.effective_ready_timeout_ms() + 999) / 1000;
    if (ssh_options_set(session_, SSH_OPTIONS_HOST, config_.host.c_str()) != SSH_OK ||
        ssh_options_set(session_, SSH_OPTIONS_USER, config_.username.c_str()) != SSH_OK ||
        ssh_options_set(session_, SSH_OPTIONS_PORT, &port) != SSH_OK ||
        ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeout_sec) != SSH_OK) {
        CopyError err{CopyError::Connection, "ssh_options_set failed: " + last_error()};
        close_locked();
        return err;
    }

    if (ssh_connect(session_) != SSH_OK) {
        CopyError err{CopyError::Connection,
            "cannot connect to " + config_.host + ":" + std::to_string(port) + ": " + last_error()};
        close_locked();
        return err;
    }

    auto steps = verify_host_key()
        .and_then([this](std::monostate&) { return authenticate(); })
        .and_then([this](std::monostate&) { return open_sftp(); });
    if (steps.is_err()) {
        close_locked();
        return steps;
    }

    log::debug("connected to %s", config_.host.c_str());
    return ok_status();
}

Status SftpTransport::verify_host_key() {
    const bool strict = config_.strict_host_key_checking.value_or(false);

    switch (ssh_session_is_known_server(session_)) {
        case SSH_KNOWN_HOSTS_OK:
            return ok_status();
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            if (strict) {
                return CopyError{CopyError::Connection,
                    "host key for " + config_.host + " does not match known_hosts",
                    "the server key changed or someone is intercepting the connection"};
            }
            log::warn("host key for %s does not match known_hosts", config_.host.c_str());
            return ok_status();
        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            if (strict) {
                return CopyError{CopyError::Connection,
                    "host " + config_.host + " is not in known_hosts",
                    "connect once with ssh to record the key, or disable strict-host-key-checking"};
            }
            log::debug("host %s is not in known_hosts, accepting its key", config_.host.c_str());
            return ok_status();
        case SSH_KNOWN_HOSTS_ERROR:
            break;
    }
    return CopyError{CopyError::Connection, "host key check failed: " + last_error()};
}

Status SftpTransport::authenticate() {
    const char* passphrase = config_.password ? config_.password->c_str() : nullptr;

    if (!config_.private_key_file.empty() || !config_.private_key.empty()) {
        log::debug("using private key for ssh connection");

        ssh_key key = nullptr;
        int rc = config_.private_key_file.empty()
            ? ssh_pki_import_privkey_base64(config_.private_key.c_str(), passphrase,
                                            nullptr, nullptr, &key)
            : ssh_pki_import_privkey_file(config_.private_key_file.c_str(), passphrase,
                                          nullptr, nullptr, &key);
        if (rc != SSH_OK || !key) {
            return CopyError{CopyError::Connection, "cannot load private key",
                "check the key and its passphrase"};
        }

        rc = ssh_userauth_publickey(session_, nullptr, key);
        ssh_key_free(key);
        if (rc != SSH_AUTH_SUCCESS) {
            return CopyError{CopyError::Connection,
                "public key authentication failed: " + last_error()};
        }
        return ok_status();
    }

    if (config_.password) {
        log::debug("using username and password for ssh connection");
        if (ssh_userauth_password(session_, nullptr, passphrase) != SSH_AUTH_SUCCESS) {
            return CopyError{CopyError::Connection,
                "password authentication failed: " + last_error()};
        }
        return ok_status();
    }

    // No credentials configured: agent, then default key files
    if (ssh_userauth_agent(session_, nullptr) == SSH_AUTH_SUCCESS) {
        log::debug("authenticated via ssh agent");
        return ok_status();
    }
    if (ssh_userauth_publickey_auto(session_, nullptr, nullptr) == SSH_AUTH_SUCCESS) {
        log::debug("authenticated via default keys");
        return ok_status();
    }
    return CopyError{CopyError::Connection,
        "authentication failed: " + last_error(),
        "set connection.password or connection.private-key-file"};
}

Status SftpTransport::open_sftp() {
    sftp_ = sftp_new(session_);
    if (!sftp_) {
        return CopyError{CopyError::Connection, "sftp_new failed: " + last_error()};
    }
    if (sftp_init(sftp_) != SSH_OK) {
        CopyError err{CopyError::Connection, "sftp_init failed: " + last_error()};
        sftp_free(sftp_);
        sftp_ = nullptr;
        return err;
    }
    return ok_status();
}

void SftpTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void SftpTransport::close_locked() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        if (ssh_is_connected(session_)) ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// File operations
// ---------------------------------------------------------------------------

Result<bool> SftpTransport::path_exists(const std::string& remote_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    SSHCOPY_TRY(ensure_connected());
    return exists_locked(remote_path);
}

Result<bool> SftpTransport::exists_locked(const std::string& remote_path) {
    sftp_attributes attrs = sftp_stat(sftp_, remote_path.c_str());
    if (attrs) {
        sftp_attributes_free(attrs);
        return Result<bool>::ok(true);
    }

    int code = sftp_get_error(sftp_);
    if (code == SSH_FX_NO_SUCH_FILE || code == SSH_FX_NO_SUCH_PATH) {
        return Result<bool>::ok(false);
    }
    return CopyError{CopyError::Transfer,
        "cannot stat " + remote_path + ": " + last_error()};
}

Status SftpTransport::make_directory(const std::string& remote_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    SSHCOPY_TRY(ensure_connected());
    return mkdir_locked(remote_path);
}

Status SftpTransport::mkdir_locked(const std::string& remote_path) {
    for (const auto& dir : directory_prefixes(remote_path)) {
        auto exists = exists_locked(dir);
        if (exists.is_err()) {
            return CopyError{CopyError::DirectoryCreate, exists.error().message};
        }
        if (exists.value()) continue;

        if (sftp_mkdir(sftp_, dir.c_str(), kDirMode) != SSH_OK &&
            sftp_get_error(sftp_) != SSH_FX_FILE_ALREADY_EXISTS) {
            return CopyError{CopyError::DirectoryCreate,
                "cannot create " + dir + ": " + last_error()};
        }
        log::trace("mkdir %s", dir.c_str());
    }
    return ok_status();
}

Status SftpTransport::upload_file(const std::string& local_path,
                                  const std::string& remote_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    SSHCOPY_TRY(ensure_connected());
    return upload_locked(local_path, remote_path);
}

Status SftpTransport::upload_locked(const std::string& local_path,
                                    const std::string& remote_path) {
    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        return CopyError{CopyError::Transfer, "cannot open local file " + local_path};
    }

    sftp_file f = sftp_open(sftp_, remote_path.c_str(),
                            O_WRONLY | O_CREAT | O_TRUNC, kFileMode);
    if (!f) {
        return CopyError{CopyError::Transfer,
            "cannot open remote file " + remote_path + ": " + last_error()};
    }

    std::vector<char> buf(kChunkSize);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;

        ssize_t w = sftp_write(f, buf.data(), static_cast<size_t>(n));
        if (w != static_cast<ssize_t>(n)) {
            CopyError err{CopyError::Transfer,
                "write to " + remote_path + " failed: " + last_error()};
            sftp_close(f);
            return err;
        }
    }

    if (in.bad()) {
        sftp_close(f);
        return CopyError{CopyError::Transfer, "read error on " + local_path};
    }

    if (sftp_close(f) != SSH_OK) {
        return CopyError{CopyError::Transfer,
            "closing " + remote_path + " failed: " + last_error()};
    }
    log::debug("uploaded %s", remote_path.c_str());
    return ok_status();
}

Result<std::string> SftpTransport::upload_directory(const std::string& local_root,
                                                    const std::string& remote_root) {
    std::lock_guard<std::mutex> lock(mutex_);
    SSHCOPY_TRY(ensure_connected());
    SSHCOPY_TRY(mkdir_locked(remote_root));

    std::error_code ec;
    auto it = fs::recursive_directory_iterator(
        local_root, fs::directory_options::follow_directory_symlink, ec);
    if (ec) {
        return CopyError{CopyError::IO, "cannot enumerate " + local_root + ": " + ec.message()};
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return CopyError{CopyError::IO, "error iterating " + local_root + ": " + ec.message()};
        }
        std::string rel = it->path().lexically_relative(local_root).generic_string();
        std::string remote = posix_join(unixy_path(remote_root), rel);

        std::error_code stat_ec;
        if (it->is_directory(stat_ec)) {
            SSHCOPY_TRY(mkdir_locked(remote));
        } else {
            SSHCOPY_TRY(upload_locked(it->path().string(), remote));
        }
    }
    if (ec) {
        return CopyError{CopyError::IO, "error iterating " + local_root + ": " + ec.message()};
    }

    return Result<std::string>::ok(remote_root);
}

// ---------------------------------------------------------------------------
// Remote commands
// ---------------------------------------------------------------------------

Status SftpTransport::run_command(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    SSHCOPY_TRY(ensure_connected());

    ssh_channel ch = ssh_channel_new(session_);
    if (!ch) {
        return CopyError{CopyError::Command, "ssh_channel_new failed: " + last_error()};
    }

    auto cleanup = [&]() {
        if (ssh_channel_is_open(ch)) {
            ssh_channel_send_eof(ch);
            ssh_channel_close(ch);
        }
        ssh_channel_free(ch);
    };

    auto fail = [&](const std::string& msg) -> Status {
        CopyError err{CopyError::Command, msg + ": " + last_error()};
        cleanup();
        return err;
    };

    if (ssh_channel_open_session(ch) != SSH_OK) return fail("ssh_channel_open_session failed");
    if (ssh_channel_request_exec(ch, command.c_str()) != SSH_OK) {
        return fail("ssh_channel_request_exec failed");
    }

    std::string out_buf;
    std::string err_buf;
    char buf[4096];

    auto drain = [&](int is_stderr, std::string& sink) -> bool {
        int n;
        while ((n = ssh_channel_read_nonblocking(ch, buf, sizeof(buf), is_stderr)) > 0) {
            sink.append(buf, static_cast<size_t>(n));
        }
        return n != SSH_ERROR;
    };

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.effective_command_timeout_ms());
    while (true) {
        int avail = ssh_channel_poll_timeout(ch, 50, 0);
        if (avail == SSH_ERROR) return fail("reading command output failed");
        if (!drain(0, out_buf) || !drain(1, err_buf)) return fail("reading command output failed");
        if (avail == SSH_EOF || ssh_channel_is_eof(ch)) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            cleanup();
            return CopyError{CopyError::Command,
                "command did not finish within " +
                std::to_string(config_.effective_command_timeout_ms()) + " ms",
                "raise connection.command-timeout"};
        }
    }

    ssh_channel_send_eof(ch);
    int exit_status = ssh_channel_get_exit_status(ch);
    cleanup();

    if (!out_buf.empty()) log::debug("%s", out_buf.c_str());
    if (exit_status != 0) {
        return CopyError{CopyError::Command,
            "command exited with status " + std::to_string(exit_status) +
            (err_buf.empty() ? "" : ": " + err_buf)};
    }
    return ok_status();
}

} // namespace sshcopy
