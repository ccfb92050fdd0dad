#include "mdvault/common.hpp"

#include <sstream>

namespace mdvault {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNoteNotFound:
      return "Note not found";
    case ErrorCode::kSectionNotFound:
      return "Section not found";
    case ErrorCode::kTextNotFound:
      return "Text not found";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kNoteAlreadyExists:
      return "Note already exists";
    case ErrorCode::kInvalidName:
      return "Invalid name";
    case ErrorCode::kInvalidHeading:
      return "Invalid heading";
    case ErrorCode::kBrokenLink:
      return "Broken link";
    case ErrorCode::kTagPolicyViolation:
      return "Tag policy violation";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kVaultNotConfigured:
      return "Vault not configured";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

bool isNotFound(ErrorCode code) {
  return code == ErrorCode::kNoteNotFound ||
         code == ErrorCode::kSectionNotFound ||
         code == ErrorCode::kTextNotFound ||
         code == ErrorCode::kFileNotFound;
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef MDVAULT_VERSION_BUILD
  return Version{0, 1, 0, MDVAULT_VERSION_BUILD};
#else
  return Version{0, 1, 0, ""};
#endif
}

}  // namespace mdvault
