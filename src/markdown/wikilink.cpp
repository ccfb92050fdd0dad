#include "mdvault/markdown/wikilink.hpp"

#include <algorithm>
#include <optional>

#include "mdvault/markdown/markdown_parser.hpp"

namespace mdvault::markdown {

namespace {

// Raw pieces of one [[...]] occurrence
struct LinkSpan {
  size_t begin;            // offset of the opening "[["
  size_t end;              // offset just past the closing "]]"
  std::string_view inner;  // text between the brackets
  std::string_view target; // inner up to the first '|' or '#'
};

// Next well-formed link at or after pos. A link never spans a line break
// and its inner text holds no ']'; the target part must be non-empty.
// Every "[[" opened before the first ']' or '\n' closes at that same
// position, so the stop is searched once per run.
std::optional<LinkSpan> nextLink(std::string_view text, size_t pos) {
  size_t stop = std::string_view::npos;
  bool stop_known = false;

  while (true) {
    auto open = text.find("[[", pos);
    if (open == std::string_view::npos) {
      return std::nullopt;
    }

    auto inner_begin = open + 2;
    if (!stop_known || stop < inner_begin) {
      stop = text.find_first_of("]\n", inner_begin);
      stop_known = true;
    }
    if (stop == std::string_view::npos) {
      return std::nullopt;
    }

    if (text[stop] != ']' || stop + 1 >= text.size() || text[stop + 1] != ']') {
      pos = stop + 1;
      continue;
    }

    auto inner = text.substr(inner_begin, stop - inner_begin);
    auto target = inner.substr(0, inner.find_first_of("|#"));
    if (!target.empty()) {
      return LinkSpan{open, stop + 2, inner, target};
    }
    pos = open + 1;
  }
}

}  // namespace

std::vector<std::string> extractLinkTargets(std::string_view text) {
  std::vector<std::string> targets;
  for (auto span = nextLink(text, 0); span; span = nextLink(text, span->end)) {
    targets.emplace_back(span->target);
  }
  return targets;
}

std::vector<Wikilink> parseWikilinks(std::string_view text) {
  std::vector<Wikilink> links;
  size_t line = 1;
  size_t counted = 0;

  for (auto span = nextLink(text, 0); span; span = nextLink(text, span->end)) {
    line += static_cast<size_t>(
        std::count(text.begin() + counted, text.begin() + span->begin, '\n'));
    counted = span->begin;

    Wikilink link;
    link.target = trim(span->target);
    link.line = line;

    auto rest = span->inner.substr(span->target.size());
    if (!rest.empty() && rest.front() == '#') {
      auto pipe = rest.find('|');
      link.section = trim(rest.substr(1, pipe == std::string_view::npos ? rest.npos : pipe - 1));
      rest = pipe == std::string_view::npos ? std::string_view() : rest.substr(pipe);
    }
    if (!rest.empty() && rest.front() == '|') {
      link.alias = std::string(rest.substr(1));
    }
    links.push_back(std::move(link));
  }
  return links;
}

LinkRewrite rewriteLinkTarget(const std::string& text,
                              const std::string& old_target,
                              const std::string& new_target) {
  std::string_view view(text);
  LinkRewrite rewrite;
  size_t last = 0;

  for (auto span = nextLink(view, 0); span; span = nextLink(view, span->end)) {
    if (span->target != old_target) {
      continue;
    }
    rewrite.text.append(view.substr(last, span->begin - last));
    rewrite.text += "[[" + new_target;
    rewrite.text.append(span->inner.substr(span->target.size()));
    rewrite.text += "]]";
    last = span->end;
    ++rewrite.replacements;
  }
  rewrite.text.append(view.substr(last));
  return rewrite;
}

}  // namespace mdvault::markdown
