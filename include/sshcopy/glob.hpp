#pragma once

#include <string>
#include <vector>

namespace sshcopy {

// Largest {lo..hi} range expanded; wider ranges are kept as literal text.
inline constexpr long kMaxRangeItems = 10000;

// Knobs for glob_match, modelled on the usual shell-glob switches.
struct MatchOptions {
    // A pattern without '/' is matched against the path's base name only.
    bool match_base = false;
    // Wildcards may match a leading '.' in a path segment.
    bool dot = false;
    // Case-insensitive comparison.
    bool nocase = false;

    // nocase is on where the native filesystem is case-insensitive (Windows).
    static MatchOptions platform_default();
};

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9], [^0-9],
//           {a,b} alternatives and {1..3} numeric ranges
bool glob_match(const std::string& pattern, const std::string& path,
                const MatchOptions& opts = MatchOptions{});

// Count the run of leading '!' characters. Stores the pattern without that
// run in `inner` and returns true when the count is odd (an exclude).
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Number of leading '!' characters in `pattern`.
size_t glob_negation_count(const std::string& pattern);

// Expand brace alternatives into the list of plain patterns they denote.
// A pattern without braces expands to itself.
std::vector<std::string> glob_expand_braces(const std::string& pattern);

// Return the members of `paths` matching `pattern`, in input order.
std::vector<std::string> glob_match_list(const std::vector<std::string>& paths,
                                         const std::string& pattern,
                                         const MatchOptions& opts = MatchOptions{});

} // namespace sshcopy
