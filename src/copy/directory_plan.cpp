#include <sshcopy/directory_plan.hpp>
#include <sshcopy/remote_path.hpp>
#include <algorithm>

namespace sshcopy {

bool is_same_or_ancestor(const std::string& ancestor, const std::string& path) {
    if (ancestor == path) return true;
    if (ancestor == ".") {
        // Every relative path hangs off the working directory
        return !is_absolute_remote_path(path);
    }
    if (path.size() <= ancestor.size()) return false;
    if (path.compare(0, ancestor.size(), ancestor) != 0) return false;
    return ancestor.back() == '/' || path[ancestor.size()] == '/';
}

std::vector<std::string> plan_directories(std::vector<std::string> remote_paths) {
    std::sort(remote_paths.begin(), remote_paths.end());

    std::vector<std::string> planned;
    for (const auto& remote : remote_paths) {
        std::string dir = posix_dirname(remote);

        bool covered = std::any_of(planned.begin(), planned.end(),
            [&](const std::string& p) { return is_same_or_ancestor(dir, p); });
        if (covered) continue;

        // A deeper directory makes its planned ancestors redundant
        planned.erase(std::remove_if(planned.begin(), planned.end(),
            [&](const std::string& p) { return is_same_or_ancestor(p, dir); }),
            planned.end());
        planned.push_back(std::move(dir));
    }
    return planned;
}

} // namespace sshcopy
