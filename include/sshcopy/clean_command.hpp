#pragma once

#include <string>

namespace sshcopy {

// Shell command that empties `target_folder` on the remote host.
// POSIX targets get an `rm -rf` through `sh -c`; Windows targets get `del`
// followed by `rmdir` over every subfolder. `clean_hidden` also removes
// dotfiles (POSIX) or hidden-attribute files (Windows).
std::string clean_target_folder_command(const std::string& target_folder,
                                        bool windows_target,
                                        bool clean_hidden);

} // namespace sshcopy
