#include "mdvault/validation/validator.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include <unicode/utf8.h>

#include "mdvault/markdown/markdown_parser.hpp"

namespace mdvault::validation {

namespace {

constexpr UChar32 kCyrillicFirst = 0x0400;
constexpr UChar32 kCyrillicLast = 0x04FF;

// Task plugin markers allowed in note names
constexpr std::array<UChar32, 15> kTaskEmoji = {
    0x2795,   // heavy plus
    0x23F3,   // hourglass
    0x1F6EB,  // departure
    0x1F4C5,  // calendar
    0x2705,   // check mark
    0x274C,   // cross mark
    0x23EC,   // double down
    0x1F53D,  // down
    0x1F53C,  // up
    0x23EB,   // double up
    0x1F53A,  // red triangle
    0x1F501,  // repeat
    0x1F3C1,  // chequered flag
    0x1F194,  // id
    0x26D4    // no entry
};

// Calls fn for every code point; invalid sequences are passed as negative values
template <typename Fn>
void forEachCodePoint(std::string_view text, Fn&& fn) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
  int32_t length = static_cast<int32_t>(text.size());
  int32_t offset = 0;
  while (offset < length) {
    UChar32 c;
    U8_NEXT(bytes, offset, length, c);
    if (!fn(c)) {
      return;
    }
  }
}

// "| ... |"
bool isTableRow(std::string_view line) {
  return line.size() >= 2 && line.front() == '|' && line.back() == '|';
}

// "|---|:--:|", only dashes, colons, pipes and spaces between the outer pipes
bool isTableSeparator(std::string_view line) {
  if (line.size() < 3 || !isTableRow(line)) {
    return false;
  }
  return line.substr(1, line.size() - 2).find_first_not_of("-:| ") == std::string_view::npos;
}

}  // namespace

std::string_view warningRuleToString(WarningRule rule) {
  switch (rule) {
    case WarningRule::kUnclosedCodeBlock:
      return "unclosed-code-block";
    case WarningRule::kTableBlankLine:
      return "table-blank-line";
    case WarningRule::kBrokenLink:
      return "broken-link";
  }
  return "unknown";
}

bool Validator::containsCyrillic(std::string_view text) {
  bool found = false;
  forEachCodePoint(text, [&found](UChar32 c) {
    if (c >= kCyrillicFirst && c <= kCyrillicLast) {
      found = true;
      return false;
    }
    return true;
  });
  return found;
}

bool Validator::isAllowedNameCodePoint(int32_t code_point) {
  if (code_point < 0) {
    return false;
  }
  if (code_point < 0x80) {
    char c = static_cast<char>(code_point);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == ' ' || c == '_' || c == '-' || c == '@';
  }
  return std::find(kTaskEmoji.begin(), kTaskEmoji.end(), code_point) != kTaskEmoji.end();
}

Result<void> Validator::validateName(const std::string& name) const {
  if (containsCyrillic(name)) {
    return std::unexpected(makeError(ErrorCode::kInvalidName,
                                     "Note name contains Cyrillic: " + name));
  }

  bool allowed = !name.empty();
  forEachCodePoint(name, [&allowed](UChar32 c) {
    if (!isAllowedNameCodePoint(c)) {
      allowed = false;
      return false;
    }
    return true;
  });

  if (!allowed) {
    return std::unexpected(makeError(ErrorCode::kInvalidName,
                                     "Note name contains invalid characters: " + name));
  }
  return {};
}

Result<void> Validator::validateHeadings(const std::string& content) const {
  for (const auto& heading : markdown::extractHeadings(content)) {
    if (containsCyrillic(heading.text)) {
      return std::unexpected(makeError(ErrorCode::kInvalidHeading,
                                       "Heading contains Cyrillic at line " +
                                           std::to_string(heading.line) + ": " + heading.text));
    }
  }
  return {};
}

std::vector<ValidationWarning> Validator::validate(const std::string& content) const {
  std::vector<ValidationWarning> warnings;
  auto lines = markdown::splitLines(content);
  auto fences = markdown::scanFences(lines);

  for (size_t line : fences.unclosed) {
    warnings.push_back({line, "Unclosed fenced code block", WarningRule::kUnclosedCodeBlock});
  }

  for (size_t i = 1; i + 1 < lines.size(); ++i) {
    size_t line_num = i + 1;
    if (fences.insideClosed(line_num)) {
      continue;
    }
    if (!isTableRow(lines[i]) || !isTableSeparator(lines[i + 1])) {
      continue;
    }
    if (!markdown::trim(lines[i - 1]).empty()) {
      warnings.push_back({line_num, "Table should have blank line before it",
                          WarningRule::kTableBlankLine});
    }
  }

  return warnings;
}

}  // namespace mdvault::validation
