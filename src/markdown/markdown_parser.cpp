#include "mdvault/markdown/markdown_parser.hpp"


namespace mdvault::markdown {

namespace {

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

int leadingHashes(std::string_view line) {
  int count = 0;
  while (static_cast<size_t>(count) < line.size() && line[count] == '#') {
    ++count;
  }
  return count;
}

}  // namespace

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t begin = 0;
  while (true) {
    auto pos = text.find('\n', begin);
    if (pos == std::string_view::npos) {
      lines.emplace_back(text.substr(begin));
      break;
    }
    lines.emplace_back(text.substr(begin, pos - begin));
    begin = pos + 1;
  }
  return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
  std::string result;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result += '\n';
    }
    result += lines[i];
  }
  return result;
}

std::string_view ltrim(std::string_view text) {
  size_t begin = 0;
  while (begin < text.size() && isSpace(text[begin])) {
    ++begin;
  }
  return text.substr(begin);
}

std::string trim(std::string_view text) {
  auto left = ltrim(text);
  size_t end = left.size();
  while (end > 0 && isSpace(left[end - 1])) {
    --end;
  }
  return std::string(left.substr(0, end));
}

int fenceTickCount(std::string_view line) {
  auto stripped = ltrim(line);
  int ticks = 0;
  while (static_cast<size_t>(ticks) < stripped.size() && stripped[ticks] == '`') {
    ++ticks;
  }
  return ticks >= 3 ? ticks : 0;
}

FenceTracker::LineKind FenceTracker::feed(std::string_view line) {
  int ticks = fenceTickCount(line);
  if (open_ticks_.empty()) {
    if (ticks > 0) {
      open_ticks_.push_back(ticks);
      return LineKind::kOpening;
    }
    return LineKind::kText;
  }
  if (ticks >= open_ticks_.back()) {
    open_ticks_.pop_back();
    return LineKind::kClosing;
  }
  return LineKind::kInside;
}

bool FenceScan::insideClosed(size_t line) const noexcept {
  for (const auto& range : closed) {
    if (range.start < line && line < range.end) {
      return true;
    }
  }
  return false;
}

FenceScan scanFences(const std::vector<std::string>& lines) {
  FenceScan scan;
  FenceTracker tracker;
  std::vector<size_t> open_lines;

  for (size_t i = 0; i < lines.size(); ++i) {
    size_t line_num = i + 1;
    switch (tracker.feed(lines[i])) {
      case FenceTracker::LineKind::kOpening:
        open_lines.push_back(line_num);
        break;
      case FenceTracker::LineKind::kClosing:
        scan.closed.push_back({open_lines.back(), line_num});
        open_lines.pop_back();
        break;
      case FenceTracker::LineKind::kText:
      case FenceTracker::LineKind::kInside:
        break;
    }
  }

  scan.unclosed = std::move(open_lines);
  return scan;
}

std::vector<Heading> extractHeadings(std::string_view content) {
  std::vector<Heading> headings;
  FenceTracker tracker;
  auto lines = splitLines(content);

  for (size_t i = 0; i < lines.size(); ++i) {
    if (tracker.feed(lines[i]) != FenceTracker::LineKind::kText) {
      continue;
    }
    // "#" run, one whitespace character, then at least one more character
    const auto& line = lines[i];
    auto hashes = static_cast<size_t>(leadingHashes(line));
    if (hashes > 0 && hashes + 1 < line.size() && isSpace(line[hashes])) {
      headings.push_back({static_cast<int>(hashes), trim(std::string_view(line).substr(hashes + 1)),
                          i + 1});
    }
  }

  return headings;
}

std::optional<SectionBounds> findSection(const std::vector<std::string>& lines,
                                         std::string_view selector) {
  auto wanted = trim(selector);
  std::optional<size_t> heading_index;
  int level = 0;

  if (!wanted.empty() && wanted.front() == '#') {
    level = leadingHashes(wanted);
    for (size_t i = 0; i < lines.size(); ++i) {
      if (trim(lines[i]) == wanted) {
        heading_index = i;
        break;
      }
    }
  } else {
    for (size_t i = 0; i < lines.size(); ++i) {
      auto stripped = trim(lines[i]);
      int hashes = leadingHashes(stripped);
      auto text = ltrim(std::string_view(stripped).substr(static_cast<size_t>(hashes)));
      if (hashes > 0 && text == wanted) {
        heading_index = i;
        level = hashes;
        break;
      }
    }
  }

  if (!heading_index.has_value()) {
    return std::nullopt;
  }

  size_t start = *heading_index + 1;
  size_t end = lines.size();
  for (size_t i = start; i < lines.size(); ++i) {
    const auto& line = lines[i];
    int hashes = leadingHashes(line);
    if (hashes >= 1 && hashes <= level &&
        static_cast<size_t>(hashes) < line.size() && isSpace(line[hashes])) {
      end = i;
      break;
    }
  }

  return SectionBounds{start, end, level};
}

}  // namespace mdvault::markdown
