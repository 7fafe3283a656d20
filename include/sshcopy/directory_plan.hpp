#pragma once

#include <string>
#include <vector>

namespace sshcopy {

// True when `ancestor` equals `path` or is one of its parent directories,
// compared segment by segment ("a/b" is not an ancestor of "a/bc").
bool is_same_or_ancestor(const std::string& ancestor, const std::string& path);

// Remote directories that must exist before `remote_paths` can be uploaded.
//
// Paths are sorted first. No planned entry is the same as, or an ancestor
// of, another: each directory is created recursively, so only the deepest
// ones need a round trip.
std::vector<std::string> plan_directories(std::vector<std::string> remote_paths);

} // namespace sshcopy
