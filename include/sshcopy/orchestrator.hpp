#pragma once

#include <sshcopy/remote_path.hpp>
#include <sshcopy/result.hpp>
#include <sshcopy/transport.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace sshcopy {

inline constexpr size_t kDefaultBatchSize = 10;

// Everything one copy run needs besides the transport.
struct CopyOptions {
    std::string source_folder;
    std::vector<std::string> contents;      // glob patterns, '!' excludes
    std::string target_folder = "./";

    bool clean_target_folder = false;
    bool clean_hidden_files_in_target = false;
    bool is_windows_on_target = false;
    bool overwrite = true;
    bool fail_on_empty_source = false;
    bool flatten_folders = false;

    size_t batch_size = kDefaultBatchSize;
};

enum class RunPhase {
    Idle,
    DirectoriesPlanned,
    DirectoriesCreated,
    Uploading,
    Completed,
    Failed
};

const char* phase_name(RunPhase phase);

enum class TransferStatus { Uploaded, Failed };

struct FileOutcome {
    std::string local;
    std::string remote;
    TransferStatus status = TransferStatus::Failed;
    std::string reason;     // empty when uploaded
};

struct CopyReport {
    RunPhase phase = RunPhase::Idle;
    bool whole_tree = false;        // contents was exactly "**"
    bool nothing_to_copy = false;
    size_t directories_created = 0;
    size_t batches_dispatched = 0;
    size_t files_copied = 0;
    size_t files_failed = 0;
    std::vector<FileOutcome> outcomes;
};

// Local half of a run: selected files, their remote paths and the remote
// directories to create.
struct CopyPlan {
    std::string source_root;
    std::string target_folder;
    std::vector<MappedFile> files;
    std::vector<std::string> directories;
};

// True when the pattern list is the single pattern "**".
bool is_whole_tree(const std::vector<std::string>& contents);

// Validate the source folder, enumerate it, select, map and plan.
// Never touches the network.
Result<CopyPlan> plan_copy(const CopyOptions& opts);

// Drives one copy run against a transport.
//
//   Idle -> DirectoriesPlanned -> DirectoriesCreated -> Uploading
//        -> Completed | Failed
//
// Directories are created one at a time; the first failure ends the run.
// Files are uploaded in batches of `batch_size`, all files of a batch at
// once. A batch always runs to completion; if any of its files failed, no
// further batch is started and the run fails.
class TransferOrchestrator {
public:
    TransferOrchestrator(RemoteTransport& transport, CopyOptions opts);

    // Full run: plan locally, connect, optionally clean the target, then
    // upload. The transport is closed before this returns.
    Result<CopyReport> run();

    // Directory and upload phases for an already planned copy. Expects a
    // connected transport.
    Result<CopyReport> transfer(const std::vector<std::string>& directories,
                                const std::vector<MappedFile>& files);

    const CopyReport& report() const { return report_; }
    RunPhase phase() const { return report_.phase; }

private:
    Result<CopyReport> run_connected(const CopyPlan& plan);
    Result<CopyReport> upload_whole_tree(const std::string& source_root);
    Status clean_target();
    Status create_directories(const std::vector<std::string>& directories);
    Status upload_batches(const std::vector<MappedFile>& files);
    FileOutcome transfer_one(const MappedFile& file);
    CopyError fail(CopyError err);

    RemoteTransport& transport_;
    CopyOptions opts_;
    CopyReport report_;
};

// Convenience wrapper: TransferOrchestrator(transport, opts).run().
Result<CopyReport> run_copy(const CopyOptions& opts, RemoteTransport& transport);

} // namespace sshcopy
