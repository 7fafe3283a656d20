#pragma once

#include <sshcopy/transport.hpp>
#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sshcopy::testing {

// In-memory RemoteTransport. Records every call in order and fails the
// operations named in its failure sets. Safe for concurrent upload tasks.
class FakeTransport : public RemoteTransport {
public:
    // ---- knobs ----
    bool fail_connect = false;
    bool fail_command = false;
    bool fail_upload_directory = false;
    std::set<std::string> existing;        // remote paths path_exists() reports
    std::set<std::string> fail_uploads;    // remote paths whose upload fails
    std::set<std::string> fail_mkdirs;

    // ---- recorded calls ----
    int connect_calls = 0;
    int close_calls = 0;
    std::vector<std::string> events;       // "connect", "mkdir <p>", "upload <p>", ...
    std::vector<std::string> mkdirs;
    std::vector<std::string> uploads;      // remote paths, in attempt order
    std::vector<std::string> commands;
    std::vector<std::string> exists_queries;

    Status connect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_calls++;
        events.push_back("connect");
        if (fail_connect) {
            return CopyError{CopyError::Connection, "connection refused"};
        }
        return ok_status();
    }

    Result<bool> path_exists(const std::string& remote_path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        exists_queries.push_back(remote_path);
        return Result<bool>::ok(existing.count(remote_path) > 0);
    }

    Status make_directory(const std::string& remote_path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back("mkdir " + remote_path);
        mkdirs.push_back(remote_path);
        if (fail_mkdirs.count(remote_path)) {
            return CopyError{CopyError::DirectoryCreate, "permission denied"};
        }
        existing.insert(remote_path);
        return ok_status();
    }

    Status upload_file(const std::string& local_path,
                       const std::string& remote_path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        (void)local_path;
        events.push_back("upload " + remote_path);
        uploads.push_back(remote_path);
        if (fail_uploads.count(remote_path)) {
            return CopyError{CopyError::Transfer, "write to " + remote_path + " failed"};
        }
        existing.insert(remote_path);
        return ok_status();
    }

    Result<std::string> upload_directory(const std::string& local_root,
                                         const std::string& remote_root) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back("upload-dir " + local_root + " " + remote_root);
        if (fail_upload_directory) {
            return CopyError{CopyError::Transfer, "disk full"};
        }
        return Result<std::string>::ok(remote_root);
    }

    Status run_command(const std::string& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back("exec");
        commands.push_back(command);
        if (fail_command) {
            return CopyError{CopyError::Command, "command exited with status 1"};
        }
        return ok_status();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        close_calls++;
        events.push_back("close");
    }

    // Index of the first event starting with `prefix`, or -1.
    int first_event(const std::string& prefix) const {
        for (size_t i = 0; i < events.size(); i++) {
            if (events[i].rfind(prefix, 0) == 0) return static_cast<int>(i);
        }
        return -1;
    }

    int last_event(const std::string& prefix) const {
        for (size_t i = events.size(); i > 0; i--) {
            if (events[i - 1].rfind(prefix, 0) == 0) return static_cast<int>(i - 1);
        }
        return -1;
    }

    bool uploaded(const std::string& remote) const {
        return std::find(uploads.begin(), uploads.end(), remote) != uploads.end();
    }

private:
    std::mutex mutex_;
};

} // namespace sshcopy::testing
