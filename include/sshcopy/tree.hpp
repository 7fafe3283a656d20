#pragma once

#include <sshcopy/result.hpp>
#include <string>
#include <vector>

namespace sshcopy {

// List every non-directory entry below `source_root`, recursively.
// Paths are returned as `source_root + "/" + relative` with '/' separators,
// sorted, so they can be matched against patterns anchored to the same root.
// Directory symlinks are followed.
Result<std::vector<std::string>> list_files(const std::string& source_root);

// Config error unless `source_root` names an existing directory.
Status require_directory(const std::string& source_root);

} // namespace sshcopy
