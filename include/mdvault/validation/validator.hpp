#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "mdvault/common.hpp"

namespace mdvault::validation {

enum class WarningRule {
  kUnclosedCodeBlock,
  kTableBlankLine,
  kBrokenLink
};

// "unclosed-code-block", "table-blank-line", "broken-link"
std::string_view warningRuleToString(WarningRule rule);

// Advisory finding returned next to a successful write
struct ValidationWarning {
  size_t line;  // 1-based; 0 when not tied to a line
  std::string message;
  WarningRule rule;
};

// Stateless content and naming rules
class Validator {
 public:
  // Fails with kInvalidName on Cyrillic or characters outside the allow-list
  Result<void> validateName(const std::string& name) const;

  // Fails with kInvalidHeading on the first heading containing Cyrillic
  Result<void> validateHeadings(const std::string& content) const;

  // Non-blocking style checks: unclosed fences, tables without a blank
  // line above them
  std::vector<ValidationWarning> validate(const std::string& content) const;

  static bool containsCyrillic(std::string_view text);
  static bool isAllowedNameCodePoint(int32_t code_point);
};

}  // namespace mdvault::validation
