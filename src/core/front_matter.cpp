#include "mdvault/core/front_matter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace mdvault::core {

namespace {

void emitNode(YAML::Emitter& emitter, const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Map:
      emitter << YAML::BeginMap;
      for (const auto& entry : node) {
        emitter << YAML::Key << entry.first.Scalar() << YAML::Value;
        emitNode(emitter, entry.second);
      }
      emitter << YAML::EndMap;
      break;
    case YAML::NodeType::Sequence:
      emitter << YAML::BeginSeq;
      for (const auto& item : node) {
        emitNode(emitter, item);
      }
      emitter << YAML::EndSeq;
      break;
    case YAML::NodeType::Scalar:
      // Quoted strings that would otherwise read back as another type
      if (node.Tag() == "!" && FrontMatter::looksLikeNonString(node.Scalar())) {
        emitter << YAML::DoubleQuoted << node.Scalar();
      } else {
        emitter << node.Scalar();
      }
      break;
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      emitter << YAML::Null;
      break;
  }
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

FrontMatter::FrontMatter() : node_(YAML::NodeType::Map) {}

FrontMatter::FrontMatter(YAML::Node node) : node_(std::move(node)) {}

FrontMatter::FrontMatter(const FrontMatter& other) : node_(YAML::Clone(other.node_)) {}

FrontMatter& FrontMatter::operator=(const FrontMatter& other) {
  if (this != &other) {
    node_ = YAML::Clone(other.node_);
  }
  return *this;
}

FrontMatter FrontMatter::fromYaml(const std::string& yaml) {
  try {
    YAML::Node node = YAML::Load(yaml);
    if (node.IsMap()) {
      return FrontMatter(node);
    }
  } catch (const YAML::Exception&) {
    // Malformed front matter is treated as absent
  }
  return FrontMatter();
}

std::string FrontMatter::toYaml() const {
  if (empty()) {
    return "";
  }

  YAML::Emitter emitter;
  emitter.SetOutputCharset(YAML::EmitNonAscii);
  emitter.SetIndent(2);
  emitNode(emitter, node_);
  return emitter.c_str();
}

bool FrontMatter::empty() const {
  return node_.size() == 0;
}

size_t FrontMatter::size() const {
  return node_.size();
}

std::vector<std::string> FrontMatter::keys() const {
  std::vector<std::string> result;
  for (const auto& entry : node_) {
    result.push_back(entry.first.Scalar());
  }
  return result;
}

bool FrontMatter::has(const std::string& key) const {
  const YAML::Node& map = node_;
  return static_cast<bool>(map[key]);
}

YAML::Node FrontMatter::get(const std::string& key) const {
  const YAML::Node& map = node_;
  auto value = map[key];
  if (!value) {
    return YAML::Node();
  }
  return YAML::Clone(value);
}

void FrontMatter::set(const std::string& key, const YAML::Node& value) {
  node_[key] = YAML::Clone(value);
}

YAML::Node FrontMatter::stringValue(const std::string& text) {
  YAML::Node value(text);
  value.SetTag("!");
  return value;
}

bool FrontMatter::erase(const std::string& key) {
  return node_.remove(key);
}

std::vector<std::string> FrontMatter::tags() const {
  const YAML::Node& map = node_;
  auto value = map["tags"];
  if (!value) {
    return {};
  }

  if (value.IsScalar()) {
    if (isStringScalar(value)) {
      return {value.Scalar()};
    }
    return {};
  }

  std::vector<std::string> result;
  if (value.IsSequence()) {
    for (const auto& item : value) {
      if (item.IsScalar()) {
        result.push_back(item.Scalar());
      } else if (item.IsNull()) {
        result.push_back("null");
      } else {
        YAML::Emitter emitter;
        emitter << YAML::Flow << item;
        result.push_back(emitter.c_str());
      }
    }
  }
  return result;
}

void FrontMatter::setTags(const std::vector<std::string>& tags) {
  YAML::Node list(YAML::NodeType::Sequence);
  for (const auto& tag : tags) {
    list.push_back(stringValue(tag));
  }
  node_["tags"] = list;
}

bool FrontMatter::isStringScalar(const YAML::Node& node) {
  if (!node.IsScalar()) {
    return false;
  }
  return node.Tag() == "!" || !looksLikeNonString(node.Scalar());
}

bool FrontMatter::looksLikeNonString(const std::string& text) {
  static const std::array<const char*, 11> kKeywords = {
      "true", "false", "yes", "no", "on", "off", "null", "~", ".inf", "-.inf", ".nan"};

  if (text.empty()) {
    return true;
  }
  auto lowered = lower(text);
  for (const char* keyword : kKeywords) {
    if (lowered == keyword) {
      return true;
    }
  }

  char* end = nullptr;
  std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0' && !std::isspace(static_cast<unsigned char>(text.front()));
}

bool operator==(const FrontMatter& a, const FrontMatter& b) {
  return a.toYaml() == b.toYaml();
}

}  // namespace mdvault::core
