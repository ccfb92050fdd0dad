#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdvault::markdown {

// One [[Target#Section|Alias]] occurrence
struct Wikilink {
  std::string target;   // trimmed
  std::string section;  // trimmed, empty when absent
  std::string alias;    // empty when absent
  size_t line;          // 1-based line of the opening brackets
};

// Link targets in order of appearance, duplicates kept. Alias and section
// suffixes are dropped; the target text is returned as written.
std::vector<std::string> extractLinkTargets(std::string_view text);

// Full wikilink occurrences with positions
std::vector<Wikilink> parseWikilinks(std::string_view text);

struct LinkRewrite {
  std::string text;
  size_t replacements = 0;
};

// Replace [[old]], [[old|...]] and [[old#...]] with the same form pointing
// at new_target. Other links are left untouched.
LinkRewrite rewriteLinkTarget(const std::string& text,
                              const std::string& old_target,
                              const std::string& new_target);

}  // namespace mdvault::markdown
