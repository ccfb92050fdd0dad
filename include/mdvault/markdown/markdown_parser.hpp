#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdvault::markdown {

// Line helpers. splitLines keeps a trailing empty line, so
// joinLines(splitLines(s)) == s for every s.
std::vector<std::string> splitLines(std::string_view text);
std::string joinLines(const std::vector<std::string>& lines);

// ASCII whitespace trimming
std::string trim(std::string_view text);
std::string_view ltrim(std::string_view text);

// Number of leading backticks if the left-trimmed line opens or closes a
// fence (three or more), otherwise 0.
int fenceTickCount(std::string_view line);

// Line-by-line fence state shared by every fence-aware scan. A fence
// closes only on a run at least as long as the one that opened it;
// shorter runs inside an open fence are plain text.
class FenceTracker {
 public:
  enum class LineKind {
    kText,     // outside any fence
    kOpening,  // opens a fence
    kClosing,  // closes the open fence
    kInside    // content of an open fence
  };

  LineKind feed(std::string_view line);

  bool inside() const noexcept { return !open_ticks_.empty(); }

 private:
  std::vector<int> open_ticks_;
};

// Closed fence: 1-based line numbers of the opening and closing delimiter
struct FenceRange {
  size_t start;
  size_t end;
};

struct FenceScan {
  std::vector<FenceRange> closed;
  std::vector<size_t> unclosed;  // 1-based opening lines left open at EOF

  // True when line lies strictly between the delimiters of a closed fence
  bool insideClosed(size_t line) const noexcept;
};

FenceScan scanFences(const std::vector<std::string>& lines);

struct Heading {
  int level;
  std::string text;
  size_t line;  // 1-based
};

// ATX headings outside of fenced code (open or closed)
std::vector<Heading> extractHeadings(std::string_view content);

// Section located by findSection. Indices are 0-based into the line vector:
// the heading sits at start - 1 and the section body is [start, end).
struct SectionBounds {
  size_t start;
  size_t end;
  int level;
};

// Selector is either a literal heading ("## Plan") matched against trimmed
// lines, or bare heading text ("Plan") matched at any level. The section
// ends at the next heading of the same or a shallower level. Fences are not
// taken into account.
std::optional<SectionBounds> findSection(const std::vector<std::string>& lines,
                                         std::string_view selector);

}  // namespace mdvault::markdown
