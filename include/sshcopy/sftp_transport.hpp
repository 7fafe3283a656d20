#pragma once

#include <sshcopy/config.hpp>
#include <sshcopy/transport.hpp>
#include <mutex>
#include <string>

// Forward-declare libssh handles to keep libssh headers out of this header.
struct ssh_session_struct;
struct sftp_session_struct;

namespace sshcopy {

// RemoteTransport over libssh: one SSH session and one SFTP subsystem per
// connection. Calls are serialized on an internal mutex, so concurrent
// upload tasks share the connection safely.
class SftpTransport : public RemoteTransport {
public:
    explicit SftpTransport(ConnectionConfig config);
    ~SftpTransport() override;

    SftpTransport(const SftpTransport&) = delete;
    SftpTransport& operator=(const SftpTransport&) = delete;

    Status connect() override;
    Result<bool> path_exists(const std::string& remote_path) override;
    Status make_directory(const std::string& remote_path) override;
    Status upload_file(const std::string& local_path,
                       const std::string& remote_path) override;
    Result<std::string> upload_directory(const std::string& local_root,
                                         const std::string& remote_root) override;
    Status run_command(const std::string& command) override;
    void close() override;

    bool is_connected() const;

private:
    Status authenticate();
    Status verify_host_key();
    Status open_sftp();
    Status ensure_connected() const;

    // Unlocked helpers; callers hold mutex_.
    Result<bool> exists_locked(const std::string& remote_path);
    Status mkdir_locked(const std::string& remote_path);
    Status upload_locked(const std::string& local_path, const std::string& remote_path);
    void close_locked();

    std::string last_error() const;

    ConnectionConfig config_;
    ssh_session_struct* session_ = nullptr;
    sftp_session_struct* sftp_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace sshcopy
