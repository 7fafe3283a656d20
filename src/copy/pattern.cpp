#include <sshcopy/pattern.hpp>
#include <sshcopy/glob.hpp>
#include <sshcopy/log.hpp>
#include <sshcopy/remote_path.hpp>

namespace sshcopy {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string anchor_pattern(const std::string& source_root, const std::string& pattern) {
    return posix_join(unixy_path(source_root), pattern);
}

ClassifiedPatterns classify_patterns(const std::vector<std::string>& patterns,
                                     const std::string& source_root) {
    ClassifiedPatterns out;

    for (const auto& raw : patterns) {
        std::string pattern = trim(raw);
        if (pattern.empty()) continue;

        std::string body;
        if (glob_is_negation(pattern, body)) {
            log::debug("exclude content pattern: %s", pattern.c_str());
            size_t bangs = pattern.size() - body.size();
            out.excludes.push_back(pattern.substr(0, bangs) + anchor_pattern(source_root, body));
        } else {
            log::debug("include content pattern: %s", pattern.c_str());
            out.includes.push_back(anchor_pattern(source_root, pattern));
        }
    }

    // Excludes alone need something to subtract from
    if (out.includes.empty() && !out.excludes.empty()) {
        out.includes.push_back(kMatchEverything);
    }

    return out;
}

} // namespace sshcopy
