#include "mdvault/core/note.hpp"

#include <algorithm>

#include "mdvault/markdown/wikilink.hpp"
#include "mdvault/util/filesystem.hpp"
#include "mdvault/util/unicode.hpp"

namespace mdvault::core {

namespace {

constexpr std::string_view kOpenMarker = "---\n";
constexpr std::string_view kCloseMarker = "\n---";

}  // namespace

Note::Note(std::string name, std::filesystem::path path, FrontMatter front_matter,
           std::string body)
    : name_(std::move(name)),
      path_(std::move(path)),
      front_matter_(std::move(front_matter)),
      body_(std::move(body)) {
  outgoing_links_ = markdown::extractLinkTargets(body_);
  tags_ = front_matter_.tags();
}

Note Note::parse(const std::filesystem::path& path, std::string_view raw) {
  auto text = util::FileSystem::normalizeText(std::string(raw));
  auto [front_matter, body] = splitFrontMatter(text);
  return Note(path.stem().string(), path, std::move(front_matter), std::move(body));
}

std::pair<FrontMatter, std::string> Note::splitFrontMatter(std::string_view text) {
  if (text.substr(0, kOpenMarker.size()) != kOpenMarker) {
    return {FrontMatter(), std::string(text)};
  }

  // First closing marker wins; the YAML block may be empty
  auto close = text.find(kCloseMarker, kOpenMarker.size());
  if (close == std::string_view::npos) {
    return {FrontMatter(), std::string(text)};
  }

  std::string yaml(text.substr(kOpenMarker.size(), close - kOpenMarker.size()));

  auto body_start = close + kCloseMarker.size();
  if (body_start < text.size() && text[body_start] == '\n') {
    ++body_start;
  }

  return {FrontMatter::fromYaml(yaml), std::string(text.substr(body_start))};
}

std::string Note::serialize(const FrontMatter& front_matter, const std::string& body) {
  if (front_matter.empty()) {
    return body;
  }

  auto yaml = front_matter.toYaml();
  while (!yaml.empty() && yaml.back() == '\n') {
    yaml.pop_back();
  }
  return "---\n" + yaml + "\n---\n" + body;
}

std::string Note::toFileFormat() const {
  return serialize(front_matter_, body_);
}

bool Note::tagMatches(std::string_view tag, std::string_view query) noexcept {
  if (tag == query) {
    return true;
  }
  return tag.size() > query.size() && tag.substr(0, query.size()) == query &&
         tag[query.size()] == '/';
}

bool Note::hasTag(std::string_view query) const noexcept {
  return std::any_of(tags_.begin(), tags_.end(),
                     [query](const std::string& tag) { return tagMatches(tag, query); });
}

Result<bool> Note::containsText(std::string_view text, bool case_sensitive) const {
  if (case_sensitive) {
    return body_.find(text) != std::string::npos;
  }
  return util::Unicode::containsIgnoreCase(body_, text);
}

}  // namespace mdvault::core
