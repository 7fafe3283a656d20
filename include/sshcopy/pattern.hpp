#pragma once

#include <string>
#include <vector>

namespace sshcopy {

// Include and exclude globs anchored to a source root.
//
// Exclude patterns keep their run of leading '!' characters in front of the
// anchored body (e.g. "!/build/out/**/*.log"); the match engine strips it.
struct ClassifiedPatterns {
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
};

// Pattern injected when only excludes were given.
inline constexpr const char* kMatchEverything = "**";

// Split raw patterns into includes and excludes by the parity of their
// leading '!' run and anchor each one to `source_root`. Patterns are
// trimmed; blank ones are ignored.
ClassifiedPatterns classify_patterns(const std::vector<std::string>& patterns,
                                     const std::string& source_root);

// Join `pattern` onto `source_root` with '/' and normalize the result.
std::string anchor_pattern(const std::string& source_root, const std::string& pattern);

// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

} // namespace sshcopy
