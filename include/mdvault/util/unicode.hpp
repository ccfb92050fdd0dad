#pragma once

#include <string>
#include <string_view>

#include "mdvault/common.hpp"

namespace mdvault::util {

// UTF-8 text helpers backed by ICU
class Unicode {
 public:
  // Invalid UTF-8 sequences become U+FFFD
  static Result<std::u16string> utf8ToUtf16(std::string_view utf8_text);
  static Result<std::string> utf16ToUtf8(const std::u16string& utf16_text);

  // Full Unicode case folding ("Встреча" and "ВСТРЕЧА" fold to "встреча")
  static Result<std::string> foldCase(std::string_view utf8_text);

  // Case-insensitive substring test over folded text
  static Result<bool> containsIgnoreCase(std::string_view haystack, std::string_view needle);
};

}  // namespace mdvault::util
