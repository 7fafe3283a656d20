#pragma once

#include <sshcopy/result.hpp>
#include <string>

namespace sshcopy {

// Remote file operations the copy engine drives.
//
// Implementations must accept concurrent calls from the upload tasks of one
// batch. close() may be called more than once.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    virtual Status connect() = 0;

    virtual Result<bool> path_exists(const std::string& remote_path) = 0;

    // Recursive and idempotent: an existing directory is success.
    virtual Status make_directory(const std::string& remote_path) = 0;

    virtual Status upload_file(const std::string& local_path,
                               const std::string& remote_path) = 0;

    // Mirror a whole local tree; returns the remote root on success.
    virtual Result<std::string> upload_directory(const std::string& local_root,
                                                 const std::string& remote_root) = 0;

    virtual Status run_command(const std::string& command) = 0;

    virtual void close() = 0;
};

// Holds a connected transport for one run and closes it on every exit path.
class TransportSession {
public:
    explicit TransportSession(RemoteTransport& transport) : transport_(transport) {}
    ~TransportSession() { transport_.close(); }

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    // close() still runs if this fails part-way through a handshake.
    Status open() { return transport_.connect(); }

    RemoteTransport& transport() { return transport_; }

private:
    RemoteTransport& transport_;
};

} // namespace sshcopy
