#include "mdvault/util/unicode.hpp"

#include <unicode/stringoptions.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

namespace mdvault::util {

namespace {

constexpr UChar32 kReplacementChar = 0xFFFD;

Error icuError(const std::string& what, UErrorCode status) {
  return makeError(ErrorCode::kParseError, what + ": " + u_errorName(status));
}

}  // namespace

Result<std::u16string> Unicode::utf8ToUtf16(std::string_view utf8_text) {
  if (utf8_text.empty()) {
    return std::u16string();
  }

  UErrorCode status = U_ZERO_ERROR;
  int32_t utf16_length = 0;
  u_strFromUTF8WithSub(nullptr, 0, &utf16_length, utf8_text.data(),
                       static_cast<int32_t>(utf8_text.size()), kReplacementChar, nullptr, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to calculate UTF-16 length", status));
  }

  std::u16string result(static_cast<size_t>(utf16_length), u'\0');
  status = U_ZERO_ERROR;
  u_strFromUTF8WithSub(reinterpret_cast<UChar*>(result.data()), utf16_length, nullptr,
                       utf8_text.data(), static_cast<int32_t>(utf8_text.size()), kReplacementChar,
                       nullptr, &status);
  if (U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to convert UTF-8 to UTF-16", status));
  }
  return result;
}

Result<std::string> Unicode::utf16ToUtf8(const std::u16string& utf16_text) {
  if (utf16_text.empty()) {
    return std::string();
  }

  UErrorCode status = U_ZERO_ERROR;
  int32_t utf8_length = 0;
  u_strToUTF8(nullptr, 0, &utf8_length, reinterpret_cast<const UChar*>(utf16_text.data()),
              static_cast<int32_t>(utf16_text.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to calculate UTF-8 length", status));
  }

  std::string result(static_cast<size_t>(utf8_length), '\0');
  status = U_ZERO_ERROR;
  u_strToUTF8(result.data(), utf8_length, nullptr,
              reinterpret_cast<const UChar*>(utf16_text.data()),
              static_cast<int32_t>(utf16_text.size()), &status);
  if (U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to convert UTF-16 to UTF-8", status));
  }
  return result;
}

Result<std::string> Unicode::foldCase(std::string_view utf8_text) {
  auto utf16 = utf8ToUtf16(utf8_text);
  if (!utf16.has_value()) {
    return std::unexpected(utf16.error());
  }
  if (utf16->empty()) {
    return std::string();
  }

  const auto* source = reinterpret_cast<const UChar*>(utf16->data());
  auto source_length = static_cast<int32_t>(utf16->size());

  // Folding can grow the text (e.g. U+00DF to "ss")
  UErrorCode status = U_ZERO_ERROR;
  int32_t folded_length =
      u_strFoldCase(nullptr, 0, source, source_length, U_FOLD_CASE_DEFAULT, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to calculate folded length", status));
  }

  std::u16string folded(static_cast<size_t>(folded_length), u'\0');
  status = U_ZERO_ERROR;
  u_strFoldCase(reinterpret_cast<UChar*>(folded.data()), folded_length, source, source_length,
                U_FOLD_CASE_DEFAULT, &status);
  if (U_FAILURE(status)) {
    return std::unexpected(icuError("Failed to fold case", status));
  }
  return utf16ToUtf8(folded);
}

Result<bool> Unicode::containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  auto folded_haystack = foldCase(haystack);
  if (!folded_haystack.has_value()) {
    return std::unexpected(folded_haystack.error());
  }
  auto folded_needle = foldCase(needle);
  if (!folded_needle.has_value()) {
    return std::unexpected(folded_needle.error());
  }
  return folded_haystack->find(*folded_needle) != std::string::npos;
}

}  // namespace mdvault::util
