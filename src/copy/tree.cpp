#include <sshcopy/tree.hpp>
#include <sshcopy/log.hpp>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace sshcopy {

Status require_directory(const std::string& source_root) {
    std::error_code ec;
    if (!fs::exists(source_root, ec)) {
        return CopyError{CopyError::Config,
            "source folder does not exist: " + source_root,
            "check the source-folder setting"};
    }
    if (!fs::is_directory(source_root, ec)) {
        return CopyError{CopyError::Config,
            "source folder is not a directory: " + source_root};
    }
    return ok_status();
}

Result<std::vector<std::string>> list_files(const std::string& source_root) {
    SSHCOPY_TRY(require_directory(source_root));

    std::string prefix = source_root;
    if (prefix.empty() || prefix.back() != '/') prefix += '/';

    std::vector<std::string> files;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(
        source_root, fs::directory_options::follow_directory_symlink, ec);
    if (ec) {
        return CopyError{CopyError::IO,
            "cannot enumerate " + source_root + ": " + ec.message()};
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return CopyError{CopyError::IO,
                "error iterating " + source_root + ": " + ec.message()};
        }
        std::error_code stat_ec;
        if (it->is_directory(stat_ec)) continue;

        // Lexical, so entries reached through a followed symlink stay under the root
        auto rel = it->path().lexically_relative(source_root);
        files.push_back(prefix + rel.generic_string());
    }
    if (ec) {
        return CopyError{CopyError::IO,
            "error iterating " + source_root + ": " + ec.message()};
    }

    std::sort(files.begin(), files.end());
    log::debug("counted %zu files in the source tree", files.size());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

} // namespace sshcopy
