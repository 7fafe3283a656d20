#pragma once

#include <string>
#include <vector>

namespace sshcopy {

// A selected local file and where it lands on the remote host.
struct MappedFile {
    std::string local;
    std::string remote;
};

// Replace every backslash with '/'.
std::string unixy_path(const std::string& p);

// "\\server\share..." network-share paths.
bool is_unc_path(const std::string& p);

// Rooted at '/' or '\', or a drive-letter path such as "C:/deploy".
bool is_absolute_remote_path(const std::string& p);

// POSIX lexical normalization: duplicate '/' collapsed, "." dropped, ".."
// folded into its parent where one exists. Leading '/' and a trailing '/'
// are kept. An empty result becomes ".".
std::string posix_normalize(const std::string& p);

// posix_normalize(a + "/" + b), skipping empty parts.
std::string posix_join(const std::string& a, const std::string& b);

// Everything before the last '/' ("." when there is none, "/" for the root).
std::string posix_dirname(const std::string& p);

// Last component after either separator style.
std::string base_name(const std::string& p);

// Target folder as used remotely: empty becomes "./" and a home-relative
// "~/" prefix becomes "./".
std::string normalize_target_folder(const std::string& target_folder);

// Source root with '/' separators, "."/".." folded and no trailing slash.
std::string normalize_source_root(const std::string& source_root);

// Remote destination for one local file under `source_root`.
std::string map_remote_path(const std::string& local,
                            const std::string& source_root,
                            const std::string& target_folder,
                            bool flatten);

std::vector<MappedFile> map_files(const std::vector<std::string>& files,
                                  const std::string& source_root,
                                  const std::string& target_folder,
                                  bool flatten);

} // namespace sshcopy
