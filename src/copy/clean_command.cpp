#include <sshcopy/clean_command.hpp>

namespace sshcopy {

std::string clean_target_folder_command(const std::string& target_folder,
                                        bool windows_target,
                                        bool clean_hidden) {
    if (windows_target) {
        std::string hidden = clean_hidden ? "/A:H " : "";
        std::string files = "del /q " + hidden + "\"" + target_folder + "\\*\"";
        return files + " && FOR /D %p IN (\"" + target_folder + "\\*\") DO rmdir \"%p\" /s /q";
    }

    std::string quoted = "'" + target_folder + "'";
    std::string globs = quoted + "/*";
    if (clean_hidden) {
        // Dotfiles, never "." or ".."; unmatched globs stay literal and rm -f ignores them
        globs += " " + quoted + "/.[!.]* " + quoted + "/..?*";
    }
    return "sh -c \"rm -rf " + globs + "\"";
}

} // namespace sshcopy
