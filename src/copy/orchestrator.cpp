#include <sshcopy/orchestrator.hpp>
#include <sshcopy/clean_command.hpp>
#include <sshcopy/directory_plan.hpp>
#include <sshcopy/log.hpp>
#include <sshcopy/match.hpp>
#include <sshcopy/pattern.hpp>
#include <sshcopy/tree.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>

namespace sshcopy {

const char* phase_name(RunPhase phase) {
    switch (phase) {
        case RunPhase::Idle:               return "idle";
        case RunPhase::DirectoriesPlanned: return "directories-planned";
        case RunPhase::DirectoriesCreated: return "directories-created";
        case RunPhase::Uploading:          return "uploading";
        case RunPhase::Completed:          return "completed";
        case RunPhase::Failed:             return "failed";
    }
    return "unknown";
}

bool is_whole_tree(const std::vector<std::string>& contents) {
    return contents.size() == 1 && trim(contents[0]) == "**";
}

Result<CopyPlan> plan_copy(const CopyOptions& opts) {
    CopyPlan plan;
    plan.source_root = normalize_source_root(opts.source_folder);
    plan.target_folder = normalize_target_folder(opts.target_folder);

    auto listing = list_files(plan.source_root);
    SSHCOPY_TRY(listing);

    auto patterns = classify_patterns(opts.contents, plan.source_root);
    auto selected = select_files(patterns, listing.value());
    log::debug("number of files to copy = %zu", selected.size());

    plan.files = map_files(selected, plan.source_root, plan.target_folder,
                           opts.flatten_folders);

    std::vector<std::string> remotes;
    remotes.reserve(plan.files.size());
    for (const auto& f : plan.files) remotes.push_back(f.remote);
    plan.directories = plan_directories(std::move(remotes));

    return Result<CopyPlan>::ok(std::move(plan));
}

// ---------------------------------------------------------------------------
// TransferOrchestrator
// ---------------------------------------------------------------------------

TransferOrchestrator::TransferOrchestrator(RemoteTransport& transport, CopyOptions opts)
    : transport_(transport), opts_(std::move(opts)) {
    if (opts_.batch_size == 0) opts_.batch_size = kDefaultBatchSize;
}

CopyError TransferOrchestrator::fail(CopyError err) {
    report_.phase = RunPhase::Failed;
    return err;
}

Result<CopyReport> TransferOrchestrator::run() {
    report_ = CopyReport{};

    // Source checks come before any remote interaction
    auto source = require_directory(opts_.source_folder);
    if (source.is_err()) return fail(std::move(source).error());

    CopyPlan plan;
    if (!is_whole_tree(opts_.contents)) {
        auto planned = plan_copy(opts_);
        if (planned.is_err()) return fail(std::move(planned).error());
        plan = std::move(planned).value();
        report_.phase = RunPhase::DirectoriesPlanned;
    } else {
        plan.source_root = normalize_source_root(opts_.source_folder);
        plan.target_folder = normalize_target_folder(opts_.target_folder);
    }

    TransportSession session(transport_);
    auto opened = session.open();
    if (opened.is_err()) {
        return fail(std::move(opened).with_context("cannot connect to remote host").error());
    }

    auto result = run_connected(plan);
    log::debug("closing the client connection");
    return result;
}

Result<CopyReport> TransferOrchestrator::run_connected(const CopyPlan& plan) {
    opts_.target_folder = plan.target_folder;

    if (opts_.clean_target_folder) {
        auto cleaned = clean_target();
        if (cleaned.is_err()) return fail(std::move(cleaned).error());
    }

    if (is_whole_tree(opts_.contents)) {
        return upload_whole_tree(plan.source_root);
    }

    if (plan.files.empty()) {
        report_.nothing_to_copy = true;
        if (opts_.fail_on_empty_source) {
            return fail(CopyError{CopyError::NotFound,
                "nothing to copy: no files in " + plan.source_root + " match the patterns"});
        }
        log::warn("nothing to copy: no files in %s match the patterns", plan.source_root.c_str());
        report_.phase = RunPhase::Completed;
        return Result<CopyReport>::ok(report_);
    }

    return transfer(plan.directories, plan.files);
}

Status TransferOrchestrator::clean_target() {
    auto exists = transport_.path_exists(opts_.target_folder);
    if (exists.is_err()) {
        return std::move(exists).with_context("cannot check target folder " + opts_.target_folder).error();
    }
    if (!exists.value()) return ok_status();

    log::info("cleaning target folder %s", opts_.target_folder.c_str());
    std::string cmd = clean_target_folder_command(opts_.target_folder,
                                                  opts_.is_windows_on_target,
                                                  opts_.clean_hidden_files_in_target);
    log::debug("clean command: %s", cmd.c_str());

    auto ran = transport_.run_command(cmd);
    if (ran.is_err()) {
        return CopyError{CopyError::Command,
            "failed to clean target folder " + opts_.target_folder + ": " + ran.error().message};
    }
    return ok_status();
}

Result<CopyReport> TransferOrchestrator::upload_whole_tree(const std::string& source_root) {
    report_.whole_tree = true;
    report_.phase = RunPhase::Uploading;
    log::debug("upload a directory to a remote machine");

    auto uploaded = transport_.upload_directory(source_root, opts_.target_folder);
    if (uploaded.is_err()) {
        CopyError err = std::move(uploaded).error();
        return fail(CopyError{CopyError::Transfer,
            "failed to copy directory " + source_root + ": " + err.message});
    }

    log::info("copied directory to %s", uploaded.value().c_str());
    report_.phase = RunPhase::Completed;
    return Result<CopyReport>::ok(report_);
}

Result<CopyReport> TransferOrchestrator::transfer(const std::vector<std::string>& directories,
                                                  const std::vector<MappedFile>& files) {
    report_.phase = RunPhase::DirectoriesPlanned;
    log::info("copying %zu files", files.size());

    auto created = create_directories(directories);
    if (created.is_err()) return fail(std::move(created).error());
    report_.phase = RunPhase::DirectoriesCreated;

    report_.phase = RunPhase::Uploading;
    auto uploaded = upload_batches(files);
    if (uploaded.is_err()) return fail(std::move(uploaded).error());

    log::info("copied %zu files", report_.files_copied);
    report_.phase = RunPhase::Completed;
    return Result<CopyReport>::ok(report_);
}

Status TransferOrchestrator::create_directories(const std::vector<std::string>& directories) {
    for (const auto& dir : directories) {
        auto made = transport_.make_directory(dir);
        if (made.is_err()) {
            return CopyError{CopyError::DirectoryCreate,
                "unable to create target folder " + dir + ": " + made.error().message};
        }
        report_.directories_created++;
        log::info("created folder %s", dir.c_str());
    }
    log::info("created %zu folders", directories.size());
    return ok_status();
}

FileOutcome TransferOrchestrator::transfer_one(const MappedFile& file) {
    FileOutcome out{file.local, file.remote, TransferStatus::Failed, ""};
    log::info("started copying %s to %s", file.local.c_str(), file.remote.c_str());

    if (!opts_.overwrite) {
        auto exists = transport_.path_exists(file.remote);
        if (exists.is_err()) {
            out.reason = exists.error().message;
            return out;
        }
        if (exists.value()) {
            out.reason = "file " + file.remote + " already exists";
            return out;
        }
    }

    auto uploaded = transport_.upload_file(file.local, file.remote);
    if (uploaded.is_err()) {
        out.reason = uploaded.error().message;
        return out;
    }

    out.status = TransferStatus::Uploaded;
    return out;
}

Status TransferOrchestrator::upload_batches(const std::vector<MappedFile>& files) {
    const size_t batch = opts_.batch_size;

    for (size_t start = 0; start < files.size(); start += batch) {
        const size_t end = std::min(files.size(), start + batch);
        report_.batches_dispatched++;
        log::debug("dispatching batch %zu (%zu files)", report_.batches_dispatched, end - start);

        // One task per file; every task is joined before deciding anything
        std::vector<std::future<FileOutcome>> tasks;
        std::vector<FileOutcome> outcomes(end - start);
        std::vector<bool> launched(end - start, false);
        tasks.reserve(end - start);

        for (size_t i = start; i < end; i++) {
            const MappedFile& file = files[i];
            try {
                tasks.push_back(std::async(std::launch::async,
                    [this, &file]() { return transfer_one(file); }));
                launched[i - start] = true;
            } catch (const std::system_error& e) {
                tasks.emplace_back();
                outcomes[i - start] = FileOutcome{file.local, file.remote,
                    TransferStatus::Failed, std::string("cannot start upload task: ") + e.what()};
            }
        }

        for (size_t k = 0; k < tasks.size(); k++) {
            if (!launched[k]) continue;
            const MappedFile& file = files[start + k];
            try {
                outcomes[k] = tasks[k].get();
            } catch (const std::exception& e) {
                outcomes[k] = FileOutcome{file.local, file.remote,
                    TransferStatus::Failed, e.what()};
            }
        }

        size_t failed = 0;
        for (auto& o : outcomes) {
            if (o.status == TransferStatus::Failed) {
                failed++;
                log::error("%s", o.reason.c_str());
            } else {
                report_.files_copied++;
            }
            report_.outcomes.push_back(std::move(o));
        }

        if (failed > 0) {
            report_.files_failed += failed;
            return CopyError{CopyError::Transfer,
                std::to_string(report_.files_failed) + " file(s) failed to copy"};
        }
    }
    return ok_status();
}

Result<CopyReport> run_copy(const CopyOptions& opts, RemoteTransport& transport) {
    TransferOrchestrator orchestrator(transport, opts);
    return orchestrator.run();
}

} // namespace sshcopy
