#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mdvault/common.hpp"
#include "mdvault/core/front_matter.hpp"

namespace mdvault::core {

// One markdown file: front matter plus body, with the links and tags
// derived from them. Values are snapshots; edits go through the file.
class Note {
 public:
  Note(std::string name, std::filesystem::path path, FrontMatter front_matter,
       std::string body);

  // Parse raw file text. The name is the file stem. Never fails: a missing
  // or malformed front matter block yields an empty mapping.
  static Note parse(const std::filesystem::path& path, std::string_view raw);

  // Split normalized text into front matter and body
  static std::pair<FrontMatter, std::string> splitFrontMatter(std::string_view text);

  // "---\n<yaml>\n---\n<body>", or the body alone when front matter is empty
  static std::string serialize(const FrontMatter& front_matter, const std::string& body);

  // Getters
  const std::string& name() const noexcept { return name_; }
  const std::filesystem::path& path() const noexcept { return path_; }
  const FrontMatter& frontMatter() const noexcept { return front_matter_; }
  const std::string& body() const noexcept { return body_; }
  const std::vector<std::string>& outgoingLinks() const noexcept { return outgoing_links_; }
  const std::vector<std::string>& tags() const noexcept { return tags_; }

  // File format serialization
  std::string toFileFormat() const;

  // Tag match: equal to query, or nested below it ("vc" matches "vc/project")
  bool hasTag(std::string_view query) const noexcept;
  static bool tagMatches(std::string_view tag, std::string_view query) noexcept;

  // Content search on the body. Case-insensitive matching uses Unicode
  // case folding.
  Result<bool> containsText(std::string_view text, bool case_sensitive = false) const;

 private:
  std::string name_;
  std::filesystem::path path_;
  FrontMatter front_matter_;
  std::string body_;
  std::vector<std::string> outgoing_links_;
  std::vector<std::string> tags_;
};

}  // namespace mdvault::core
