#pragma once

#include <sshcopy/glob.hpp>
#include <sshcopy/pattern.hpp>
#include <string>
#include <vector>

namespace sshcopy {

// Options the selection engine always runs with: base-name matching and
// dotfiles on, case folding per platform.
MatchOptions selection_match_options();

// Resolve classified patterns against a flat file listing.
//
// Includes are unioned in first-pattern, first-seen order with duplicates
// dropped. Excludes are then applied one after another, each removing its
// matches from whatever survived the previous ones.
std::vector<std::string> select_files(const ClassifiedPatterns& patterns,
                                      const std::vector<std::string>& files,
                                      const MatchOptions& opts = selection_match_options());

} // namespace sshcopy
