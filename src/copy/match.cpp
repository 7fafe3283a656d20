#include <sshcopy/match.hpp>
#include <sshcopy/log.hpp>
#include <unordered_set>

namespace sshcopy {

MatchOptions selection_match_options() {
    MatchOptions opts = MatchOptions::platform_default();
    opts.match_base = true;
    opts.dot = true;
    return opts;
}

std::vector<std::string> select_files(const ClassifiedPatterns& patterns,
                                      const std::vector<std::string>& files,
                                      const MatchOptions& opts) {
    std::vector<std::string> selected;
    std::unordered_set<std::string> seen;

    for (const auto& pattern : patterns.includes) {
        log::debug("include matching %s", pattern.c_str());
        auto matches = glob_match_list(files, pattern, opts);
        log::debug("include matched %zu files", matches.size());

        for (auto& m : matches) {
            if (seen.insert(m).second) {
                selected.push_back(std::move(m));
            }
        }
    }

    for (const auto& pattern : patterns.excludes) {
        log::debug("exclude matching %s", pattern.c_str());

        std::string body = pattern.substr(glob_negation_count(pattern));

        std::vector<std::string> kept;
        kept.reserve(selected.size());
        for (auto& path : selected) {
            if (!glob_match(body, path, opts)) {
                kept.push_back(std::move(path));
            }
        }
        log::debug("exclude kept %zu of %zu files", kept.size(), selected.size());
        selected = std::move(kept);
    }

    return selected;
}

} // namespace sshcopy
