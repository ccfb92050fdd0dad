#pragma once

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace mdvault::core {

// Ordered YAML mapping stored at the top of a note. Always a mapping:
// malformed or non-mapping YAML decodes to an empty one.
class FrontMatter {
 public:
  FrontMatter();

  // Deep copies; YAML::Node itself has reference semantics
  FrontMatter(const FrontMatter& other);
  FrontMatter& operator=(const FrontMatter& other);
  FrontMatter(FrontMatter&&) = default;
  FrontMatter& operator=(FrontMatter&&) = default;

  // Decode a YAML block. Never fails.
  static FrontMatter fromYaml(const std::string& yaml);

  // Encode as block-style YAML, keys in insertion order. Returns an empty
  // string for an empty mapping.
  std::string toYaml() const;

  bool empty() const;
  size_t size() const;
  std::vector<std::string> keys() const;

  bool has(const std::string& key) const;

  // Deep copy of the value; a null node if the key is absent
  YAML::Node get(const std::string& key) const;

  // Insert or replace; a new key is appended at the end
  void set(const std::string& key, const YAML::Node& value);

  // String scalar that stays a string when written and read back
  static YAML::Node stringValue(const std::string& text);

  // Returns false if the key was absent
  bool erase(const std::string& key);

  // "tags" normalized: a string becomes one tag, a list is stringified
  // element-wise, anything else yields no tags
  std::vector<std::string> tags() const;
  void setTags(const std::vector<std::string>& tags);

  const YAML::Node& node() const noexcept { return node_; }

  // True for scalars that YAML reads back as strings (quoted, or plain
  // text that does not resolve to a bool, null or number)
  static bool isStringScalar(const YAML::Node& node);

  // Scalar text resolves to bool, null or a number when unquoted
  static bool looksLikeNonString(const std::string& text);

 private:
  explicit FrontMatter(YAML::Node node);

  YAML::Node node_;
};

bool operator==(const FrontMatter& a, const FrontMatter& b);

}  // namespace mdvault::core
