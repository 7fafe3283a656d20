#include <sshcopy/glob.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sshcopy {

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

// "." segments are dropped so "./out/a.txt" and "out/*.txt" line up.
static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    auto flush = [&]() {
        if (cur != ".") segs.push_back(cur);
        cur.clear();
    };
    for (char c : s) {
        if (c == '/') {
            flush();
        } else {
            cur.push_back(c);
        }
    }
    flush();
    if (segs.empty()) segs.push_back(".");
    return segs;
}

static char fold(char c, bool nocase) {
    if (!nocase) return c;
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

static bool is_wildcard(char c) {
    return c == '*' || c == '?' || c == '[';
}

// Match the single-character token at pat[pi] ('?', a class, or a literal)
// against `c`, advancing `pi` past the token.
// Supports ?, [abc], [a-z], [!...], [^...].
static bool match_char(const std::string& pat, size_t& pi, char c,
                       const MatchOptions& opts) {
    char pc = pat[pi];

    if (pc == '?') {
        pi++;
        return true;
    }

    if (pc == '[') {
        pi++; // skip '['
        bool negate = false;
        if (pi < pat.size() && (pat[pi] == '!' || pat[pi] == '^')) {
            negate = true;
            pi++;
        }
        bool matched = false;
        char sc = fold(c, opts.nocase);
        while (pi < pat.size() && pat[pi] != ']') {
            char lo = fold(pat[pi], opts.nocase);
            if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                char hi = fold(pat[pi + 2], opts.nocase);
                if (sc >= lo && sc <= hi) matched = true;
                pi += 3;
            } else {
                if (sc == lo) matched = true;
                pi++;
            }
        }
        if (pi < pat.size()) pi++; // skip ']'
        return negate ? !matched : matched;
    }

    pi++;
    return fold(pc, opts.nocase) == fold(c, opts.nocase);
}

// Match a single segment against a pattern segment (no '/' in either).
// On a mismatch only the most recent '*' is retried one character further,
// so the cost stays linear in the segment length times the pattern length.
static bool match_segment(const std::string& pat, const std::string& str,
                          const MatchOptions& opts) {
    // Hidden entries only match a literal leading '.'
    if (!opts.dot && !str.empty() && str[0] == '.' &&
        !pat.empty() && is_wildcard(pat[0])) {
        return false;
    }

    const size_t npos = std::string::npos;
    size_t pi = 0;
    size_t si = 0;
    size_t star_pi = npos; // pattern index just after the last '*'
    size_t star_si = 0;    // string index that '*' currently extends to

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            star_pi = pi;
            star_si = si;
            continue;
        }
        size_t next = pi;
        if (pi < pat.size() && match_char(pat, next, str[si], opts)) {
            pi = next;
            si++;
            continue;
        }
        if (star_pi == npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    // Consume trailing stars in pattern
    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si,
                           const MatchOptions& opts) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            // Collapse consecutive '**' segments
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            // '**' only crosses hidden segments when dot matching is on
            size_t limit = si;
            while (limit < path_segs.size() &&
                   (opts.dot || path_segs[limit].empty() || path_segs[limit][0] != '.')) {
                limit++;
            }
            // If pattern exhausted, '**' matches everything remaining
            if (pi == pat_segs.size()) return limit == path_segs.size();
            // Try matching remaining pattern from every reachable path position
            for (size_t k = si; k <= limit; k++) {
                if (match_segments(pat_segs, pi, path_segs, k, opts)) return true;
            }
            return false;
        }

        if (!match_segment(ps, path_segs[si], opts)) return false;
        pi++;
        si++;
    }

    // Consume trailing '**' in pattern
    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// Index of the '}' closing the '{' at `open`, or npos.
static size_t find_closing_brace(const std::string& s, size_t open) {
    int depth = 0;
    for (size_t i = open; i < s.size(); i++) {
        if (s[i] == '{') {
            depth++;
        } else if (s[i] == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Split the body of a brace group on its top-level commas.
static std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> alts;
    std::string cur;
    int depth = 0;
    for (char c : body) {
        if (c == '{') depth++;
        if (c == '}') depth--;
        if (c == ',' && depth == 0) {
            alts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    alts.push_back(cur);
    return alts;
}

// Signed decimal that fits in a long; anything else is not a range bound.
static bool parse_int(const std::string& s, long& out) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (size_t k = i; k < s.size(); k++) {
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
    }
    errno = 0;
    long v = std::strtol(s.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = v;
    return true;
}

// {lo..hi} numeric sequence; empty when `body` is not a range or spans more
// than kMaxRangeItems values, in which case the group stays literal.
static std::vector<std::string> expand_range(const std::string& body) {
    std::vector<std::string> out;
    auto dots = body.find("..");
    if (dots == std::string::npos) return out;

    long lo = 0;
    long hi = 0;
    if (!parse_int(body.substr(0, dots), lo) || !parse_int(body.substr(dots + 2), hi)) {
        return out;
    }
    // Span computed in floating point so lo/hi at the long limits cannot overflow
    double span = static_cast<double>(hi) - static_cast<double>(lo);
    if (span < 0) span = -span;
    if (span >= static_cast<double>(kMaxRangeItems)) return out;

    long step = lo <= hi ? 1 : -1;
    for (long v = lo;; v += step) {
        out.push_back(std::to_string(v));
        if (v == hi) break;
    }
    return out;
}

// ---- Public API ----

MatchOptions MatchOptions::platform_default() {
    MatchOptions opts;
#ifdef _WIN32
    opts.nocase = true;
#endif
    return opts;
}

std::vector<std::string> glob_expand_braces(const std::string& pattern) {
    for (size_t open = pattern.find('{'); open != std::string::npos;
         open = pattern.find('{', open + 1)) {
        size_t close = find_closing_brace(pattern, open);
        if (close == std::string::npos) break;

        std::string body = pattern.substr(open + 1, close - open - 1);
        std::vector<std::string> alts = split_alternatives(body);
        if (alts.size() < 2) {
            alts = expand_range(body);
            // "{x}" is a literal
            if (alts.empty()) continue;
        }

        std::string prefix = pattern.substr(0, open);
        std::string suffix = pattern.substr(close + 1);

        std::vector<std::string> expanded;
        for (const auto& alt : alts) {
            for (auto& tail : glob_expand_braces(alt + suffix)) {
                expanded.push_back(prefix + tail);
            }
        }
        return expanded;
    }
    return {pattern};
}

bool glob_match(const std::string& pattern, const std::string& path,
                const MatchOptions& opts) {
    auto norm_path = normalize_path(path);
    auto path_segs = split_segments(norm_path);

    for (const auto& alt : glob_expand_braces(pattern)) {
        auto norm_pat = normalize_path(alt);
        auto pat_segs = split_segments(norm_pat);

        if (opts.match_base && pat_segs.size() == 1) {
            std::vector<std::string> base{path_segs.back()};
            if (match_segments(pat_segs, 0, base, 0, opts)) return true;
            continue;
        }

        if (match_segments(pat_segs, 0, path_segs, 0, opts)) return true;
    }
    return false;
}

size_t glob_negation_count(const std::string& pattern) {
    size_t n = 0;
    while (n < pattern.size() && pattern[n] == '!') n++;
    return n;
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    size_t n = glob_negation_count(pattern);
    inner = pattern.substr(n);
    return n % 2 == 1;
}

std::vector<std::string> glob_match_list(const std::vector<std::string>& paths,
                                         const std::string& pattern,
                                         const MatchOptions& opts) {
    std::vector<std::string> result;
    for (const auto& p : paths) {
        if (glob_match(pattern, p, opts)) {
            result.push_back(p);
        }
    }
    return result;
}

} // namespace sshcopy
