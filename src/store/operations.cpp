#include "mdvault/store/operations.hpp"

#include <algorithm>
#include <cstddef>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

#include "mdvault/markdown/wikilink.hpp"
#include "mdvault/util/filesystem.hpp"
#include "mdvault/util/unicode.hpp"

namespace mdvault::store {

namespace {

constexpr const char* kTrashDir = ".trash";
constexpr const char* kDeletedSuffix = " (deleted)";

size_t countOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

std::vector<std::string> splitTagQuery(const std::string& query) {
  std::vector<std::string> tags;
  std::istringstream stream(query);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto tag = markdown::trim(part);
    if (!tag.empty()) {
      tags.push_back(std::move(tag));
    }
  }
  return tags;
}

void appendWarnings(Warnings& target, const Warnings& extra) {
  target.insert(target.end(), extra.begin(), extra.end());
}

}  // namespace

Result<SearchMode> parseSearchMode(const std::string& value) {
  if (value == "name") return SearchMode::kName;
  if (value == "name_partial") return SearchMode::kNamePartial;
  if (value == "content") return SearchMode::kContent;
  if (value == "tag") return SearchMode::kTag;
  return makeErrorResult<SearchMode>(
      ErrorCode::kInvalidArgument,
      "Invalid search mode: " + value + ". Valid: name, name_partial, content, tag");
}

Result<TagLogic> parseTagLogic(const std::string& value) {
  if (value == "and") return TagLogic::kAnd;
  if (value == "or") return TagLogic::kOr;
  return makeErrorResult<TagLogic>(ErrorCode::kInvalidArgument,
                                   "Invalid tag_logic: " + value + ". Valid: and, or");
}

Result<LinkDirection> parseLinkDirection(const std::string& value) {
  if (value == "out") return LinkDirection::kOut;
  if (value == "in") return LinkDirection::kIn;
  if (value == "both") return LinkDirection::kBoth;
  return makeErrorResult<LinkDirection>(ErrorCode::kInvalidArgument,
                                        "Invalid direction: " + value + ". Valid: in, out, both");
}

std::string_view insertPositionToString(InsertPosition position) {
  switch (position) {
    case InsertPosition::kBefore:
      return "before";
    case InsertPosition::kAfter:
      return "after";
  }
  return "after";
}

Operations::Operations(index::VaultIndex& index, validation::Validator validator,
                       validation::TagPolicy tag_policy)
    : index_(index), validator_(std::move(validator)), tag_policy_(std::move(tag_policy)) {}

// Shared write path

Result<void> Operations::writeAndRefresh(const std::filesystem::path& path,
                                         const std::string& content) {
  auto written = util::FileSystem::writeFileAtomic(path, content);
  if (!written.has_value()) {
    return written;
  }
  return index_.refresh();
}

Result<Warnings> Operations::checkContent(const std::string& content) {
  auto headings = validator_.validateHeadings(content);
  if (!headings.has_value()) {
    return std::unexpected(headings.error());
  }
  return validateWikilinks(content);
}

Result<WriteResult> Operations::writeBody(const core::Note& note, const std::string& body,
                                          Warnings link_warnings) {
  auto file_content = core::Note::serialize(note.frontMatter(), body);
  auto written = writeAndRefresh(note.path(), file_content);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  WriteResult result{note.name(), validator_.validate(file_content)};
  appendWarnings(result.warnings, link_warnings);
  return result;
}

// CRUD

Result<CreateResult> Operations::create(const std::string& name, const std::string& content,
                                        const core::FrontMatter& front_matter) {
  auto valid_name = validator_.validateName(name);
  if (!valid_name.has_value()) {
    return std::unexpected(valid_name.error());
  }

  auto link_warnings = checkContent(content);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }

  auto path = index_.root() / (name + ".md");
  auto known = index_.hasNote(name);
  if (!known.has_value()) {
    return std::unexpected(known.error());
  }
  if (*known || std::filesystem::exists(path)) {
    return std::unexpected(makeError(ErrorCode::kNoteAlreadyExists,
                                     "Note '" + name + "' already exists"));
  }

  auto file_content = core::Note::serialize(front_matter, content);
  auto written = writeAndRefresh(path, file_content);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  spdlog::info("Created note '{}'", name);

  CreateResult result{name, path, validator_.validate(file_content)};
  appendWarnings(result.warnings, *link_warnings);
  return result;
}

Result<std::string> Operations::read(const std::string& name) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }
  return util::FileSystem::readText(note->path());
}

Result<WriteResult> Operations::append(const std::string& name, const std::string& text) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto link_warnings = checkContent(note->body() + "\n\n" + text);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }

  // Append to the file as stored so the front matter block stays byte-identical
  auto current = util::FileSystem::readText(note->path());
  if (!current.has_value()) {
    return std::unexpected(current.error());
  }
  auto file_content = *current + "\n\n" + text;

  auto written = writeAndRefresh(note->path(), file_content);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  WriteResult result{name, validator_.validate(file_content)};
  appendWarnings(result.warnings, *link_warnings);
  return result;
}

Result<WriteResult> Operations::update(const std::string& name, const std::string& content) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto link_warnings = checkContent(content);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }

  return writeBody(*note, content, std::move(*link_warnings));
}

Result<core::FrontMatter> Operations::frontmatterGet(const std::string& name) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }
  return note->frontMatter();
}

Result<core::FrontMatter> Operations::frontmatterSet(const std::string& name,
                                                     const std::string& key,
                                                     const YAML::Node& value,
                                                     bool enforce_existing_tags) {
  if (key.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Front matter key must not be empty"));
  }
  if (key == "tags" && !value.IsSequence()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Front matter field 'tags' must be a list"));
  }

  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto front_matter = note->frontMatter();
  front_matter.set(key, value);

  if (key == "tags") {
    auto allowed = checkTags(name, front_matter.tags(), front_matter, enforce_existing_tags);
    if (!allowed.has_value()) {
      return std::unexpected(allowed.error());
    }
  }

  auto written = writeAndRefresh(note->path(), core::Note::serialize(front_matter, note->body()));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  return front_matter;
}

// Rename / delete

Result<void> Operations::rewriteReferences(const std::string& source,
                                           const std::string& old_target,
                                           const std::string& new_target) {
  auto note = index_.getNote(source);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto content = util::FileSystem::readText(note->path());
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto rewrite = markdown::rewriteLinkTarget(*content, old_target, new_target);
  if (rewrite.replacements == 0) {
    // Still reported as updated: the index is the source of truth
    spdlog::warn("Note '{}' is indexed as linking to '{}' but no link could be rewritten",
                 source, old_target);
    return {};
  }

  return util::FileSystem::writeFileAtomic(note->path(), rewrite.text);
}

Result<DeleteResult> Operations::remove(const std::string& name, bool dry_run) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto incoming = index_.getIncomingLinks(name);
  if (!incoming.has_value()) {
    return std::unexpected(incoming.error());
  }

  auto trash_dir = index_.root() / kTrashDir;
  DeleteResult result{name, trash_dir / (name + ".md"), *incoming};
  if (dry_run) {
    return result;
  }

  for (const auto& source : result.files_updated) {
    auto rewritten = rewriteReferences(source, name, name + kDeletedSuffix);
    if (!rewritten.has_value()) {
      return std::unexpected(rewritten.error());
    }
  }

  auto created = util::FileSystem::createDirectories(trash_dir);
  if (!created.has_value()) {
    return std::unexpected(created.error());
  }
  auto moved = util::FileSystem::moveFile(note->path(), result.trash_path);
  if (!moved.has_value()) {
    return std::unexpected(moved.error());
  }

  auto refreshed = index_.refresh();
  if (!refreshed.has_value()) {
    return std::unexpected(refreshed.error());
  }

  spdlog::info("Deleted note '{}' ({} referring notes updated)", name,
               result.files_updated.size());
  return result;
}

Result<RenameResult> Operations::rename(const std::string& old_name, const std::string& new_name,
                                        bool dry_run) {
  auto valid_name = validator_.validateName(new_name);
  if (!valid_name.has_value()) {
    return std::unexpected(valid_name.error());
  }

  auto note = index_.getNote(old_name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  // Renamed in place: the note keeps its folder
  auto new_path = note->path().parent_path() / (new_name + ".md");
  auto known = index_.hasNote(new_name);
  if (!known.has_value()) {
    return std::unexpected(known.error());
  }
  if (*known || std::filesystem::exists(new_path)) {
    return std::unexpected(makeError(ErrorCode::kNoteAlreadyExists,
                                     "Note '" + new_name + "' already exists"));
  }

  auto incoming = index_.getIncomingLinks(old_name);
  if (!incoming.has_value()) {
    return std::unexpected(incoming.error());
  }

  RenameResult result{old_name, new_name, *incoming};
  if (dry_run) {
    return result;
  }

  for (const auto& source : result.files_updated) {
    auto rewritten = rewriteReferences(source, old_name, new_name);
    if (!rewritten.has_value()) {
      return std::unexpected(rewritten.error());
    }
  }

  auto moved = util::FileSystem::moveFile(note->path(), new_path);
  if (!moved.has_value()) {
    return std::unexpected(moved.error());
  }

  auto refreshed = index_.refresh();
  if (!refreshed.has_value()) {
    return std::unexpected(refreshed.error());
  }

  spdlog::info("Renamed note '{}' to '{}' ({} referring notes updated)", old_name, new_name,
               result.files_updated.size());
  return result;
}

std::vector<BatchItem<DeleteResult>> Operations::batchRemove(const std::vector<std::string>& names,
                                                             bool dry_run) {
  std::vector<BatchItem<DeleteResult>> results;
  for (const auto& name : names) {
    results.push_back({name, remove(name, dry_run)});
  }
  return results;
}

std::vector<BatchItem<RenameResult>> Operations::batchRename(
    const std::vector<std::pair<std::string, std::string>>& renames, bool dry_run) {
  std::vector<BatchItem<RenameResult>> results;
  for (const auto& [old_name, new_name] : renames) {
    results.push_back({old_name, rename(old_name, new_name, dry_run)});
  }
  return results;
}

// Queries

Result<std::vector<std::string>> Operations::search(const std::string& query, SearchMode mode) {
  if (mode == SearchMode::kTag) {
    return searchTags(query, TagLogic::kOr);
  }

  auto notes = index_.listNotes();
  if (!notes.has_value()) {
    return std::unexpected(notes.error());
  }

  std::vector<std::string> matches;
  for (const auto& note : *notes) {
    Result<bool> hit = false;
    switch (mode) {
      case SearchMode::kName:
        hit = note.name() == query;
        break;
      case SearchMode::kNamePartial:
        hit = util::Unicode::containsIgnoreCase(note.name(), query);
        break;
      case SearchMode::kContent:
        hit = note.containsText(query);
        break;
      case SearchMode::kTag:
        break;
    }
    if (!hit.has_value()) {
      return std::unexpected(hit.error());
    }
    if (*hit) {
      matches.push_back(note.name());
    }
  }
  return matches;
}

Result<std::vector<std::string>> Operations::searchTags(const std::string& query,
                                                        TagLogic logic) {
  auto wanted = splitTagQuery(query);
  if (wanted.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Tag query is empty"));
  }

  auto notes = index_.listNotes();
  if (!notes.has_value()) {
    return std::unexpected(notes.error());
  }

  std::vector<std::string> matches;
  for (const auto& note : *notes) {
    auto matches_tag = [&note](const std::string& tag) { return note.hasTag(tag); };
    bool hit = logic == TagLogic::kAnd
                   ? std::all_of(wanted.begin(), wanted.end(), matches_tag)
                   : std::any_of(wanted.begin(), wanted.end(), matches_tag);
    if (hit) {
      matches.push_back(note.name());
    }
  }
  return matches;
}

Result<LinksResult> Operations::links(const std::string& name, LinkDirection direction) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  LinksResult result{name, std::nullopt, std::nullopt};
  if (direction == LinkDirection::kOut || direction == LinkDirection::kBoth) {
    result.outgoing = note->outgoingLinks();
  }
  if (direction == LinkDirection::kIn || direction == LinkDirection::kBoth) {
    auto incoming = index_.getIncomingLinks(name);
    if (!incoming.has_value()) {
      return std::unexpected(incoming.error());
    }
    result.incoming = std::move(*incoming);
  }
  return result;
}

Result<std::vector<BrokenLink>> Operations::findBrokenLinks() {
  auto notes = index_.listNotes();
  if (!notes.has_value()) {
    return std::unexpected(notes.error());
  }

  std::set<std::string> names;
  for (const auto& note : *notes) {
    names.insert(note.name());
  }

  std::vector<BrokenLink> broken;
  for (const auto& note : *notes) {
    for (const auto& target : note.outgoingLinks()) {
      if (names.count(target) == 0) {
        broken.push_back({note.name(), target});
      }
    }
  }
  return broken;
}

Result<NoteList> Operations::listNames(size_t limit, size_t offset) {
  auto notes = index_.listNotes();
  if (!notes.has_value()) {
    return std::unexpected(notes.error());
  }

  std::vector<std::string> names;
  names.reserve(notes->size());
  for (const auto& note : *notes) {
    names.push_back(note.name());
  }
  std::sort(names.begin(), names.end());

  NoteList page{{}, names.size(), limit, offset};
  if (offset < names.size()) {
    auto last = offset + std::min(limit, names.size() - offset);
    page.names.assign(names.begin() + static_cast<std::ptrdiff_t>(offset),
                      names.begin() + static_cast<std::ptrdiff_t>(last));
  }
  return page;
}

Result<NoteMetadata> Operations::metadata(const std::string& name) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto incoming = index_.getIncomingLinks(name);
  if (!incoming.has_value()) {
    return std::unexpected(incoming.error());
  }

  return NoteMetadata{name, note->frontMatter(), note->outgoingLinks(), std::move(*incoming)};
}

Result<Warnings> Operations::validateWikilinks(const std::string& content) {
  Warnings warnings;
  std::set<std::string> missing;

  for (const auto& link : markdown::parseWikilinks(content)) {
    // Each missing target costs one rescan, not one per occurrence
    if (missing.count(link.target) > 0) {
      warnings.push_back({link.line, "Link to non-existent note: " + link.target,
                          validation::WarningRule::kBrokenLink});
      continue;
    }

    auto target = index_.getNote(link.target);
    if (!target.has_value()) {
      if (target.error().code() != ErrorCode::kNoteNotFound) {
        return std::unexpected(target.error());
      }
      missing.insert(link.target);
      warnings.push_back({link.line, "Link to non-existent note: " + link.target,
                          validation::WarningRule::kBrokenLink});
      continue;
    }

    if (link.section.empty()) {
      continue;
    }

    auto headings = markdown::extractHeadings(target->body());
    bool found = std::any_of(headings.begin(), headings.end(),
                             [&link](const markdown::Heading& h) { return h.text == link.section; });
    if (!found) {
      return std::unexpected(makeError(ErrorCode::kBrokenLink,
                                       "Section '" + link.section + "' not found in note '" +
                                           link.target + "'"));
    }
  }

  return warnings;
}

// Sections

Result<markdown::SectionBounds> Operations::locateSection(const core::Note& note,
                                                          const std::vector<std::string>& lines,
                                                          const std::string& section) {
  auto bounds = markdown::findSection(lines, section);
  if (!bounds.has_value()) {
    return std::unexpected(makeError(ErrorCode::kSectionNotFound,
                                     "Section '" + section + "' not found in note '" +
                                         note.name() + "'"));
  }
  return *bounds;
}

Result<std::vector<markdown::Heading>> Operations::getHeadings(const std::string& name) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }
  return markdown::extractHeadings(note->body());
}

Result<std::string> Operations::readSection(const std::string& name, const std::string& section) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto lines = markdown::splitLines(note->body());
  auto bounds = locateSection(*note, lines, section);
  if (!bounds.has_value()) {
    return std::unexpected(bounds.error());
  }

  std::vector<std::string> body(lines.begin() + static_cast<std::ptrdiff_t>(bounds->start),
                                lines.begin() + static_cast<std::ptrdiff_t>(bounds->end));
  return markdown::trim(markdown::joinLines(body));
}

Result<WriteResult> Operations::appendSection(const std::string& name, const std::string& section,
                                              const std::string& text) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto lines = markdown::splitLines(note->body());
  auto bounds = locateSection(*note, lines, section);
  if (!bounds.has_value()) {
    return std::unexpected(bounds.error());
  }

  lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(bounds->end), text);
  auto body = markdown::joinLines(lines);

  auto link_warnings = checkContent(body);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }
  return writeBody(*note, body, std::move(*link_warnings));
}

Result<WriteResult> Operations::updateSection(const std::string& name, const std::string& section,
                                              const std::string& content) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto lines = markdown::splitLines(note->body());
  auto bounds = locateSection(*note, lines, section);
  if (!bounds.has_value()) {
    return std::unexpected(bounds.error());
  }

  std::vector<std::string> updated(lines.begin(),
                                   lines.begin() + static_cast<std::ptrdiff_t>(bounds->start));
  updated.push_back(content);
  updated.insert(updated.end(), lines.begin() + static_cast<std::ptrdiff_t>(bounds->end),
                 lines.end());
  auto body = markdown::joinLines(updated);

  auto link_warnings = checkContent(body);
  if (!link_warnings.has_value()) {
    return std::unexpected(link_warnings.error());
  }
  return writeBody(*note, body, std::move(*link_warnings));
}

Result<WriteResult> Operations::deleteSection(const std::string& name,
                                              const std::string& section) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto lines = markdown::splitLines(note->body());
  auto bounds = locateSection(*note, lines, section);
  if (!bounds.has_value()) {
    return std::unexpected(bounds.error());
  }

  std::vector<std::string> remaining(
      lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(bounds->start - 1));
  remaining.insert(remaining.end(), lines.begin() + static_cast<std::ptrdiff_t>(bounds->end),
                   lines.end());
  return writeBody(*note, markdown::joinLines(remaining), {});
}

// Body edits

Result<ReplaceResult> Operations::replace(const std::string& name, const std::string& old_text,
                                          const std::string& new_text, bool replace_all) {
  if (old_text.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Text to replace must not be empty"));
  }

  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto body = note->body();
  auto occurrences = countOccurrences(body, old_text);
  if (occurrences == 0) {
    return std::unexpected(makeError(ErrorCode::kTextNotFound,
                                     "Text '" + old_text + "' not found in note '" + name + "'"));
  }

  size_t replacements = 0;
  for (auto pos = body.find(old_text); pos != std::string::npos;
       pos = body.find(old_text, pos + new_text.size())) {
    body.replace(pos, old_text.size(), new_text);
    ++replacements;
    if (!replace_all) {
      break;
    }
  }

  auto written = writeAndRefresh(note->path(), core::Note::serialize(note->frontMatter(), body));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  return ReplaceResult{name, replacements};
}

Result<InsertResult> Operations::insert(const std::string& name, const std::string& text,
                                        const std::optional<std::string>& before,
                                        const std::optional<std::string>& after) {
  if (before.has_value() == after.has_value()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Exactly one of 'before' or 'after' must be given"));
  }

  auto position = before.has_value() ? InsertPosition::kBefore : InsertPosition::kAfter;
  const auto& pattern = before.has_value() ? *before : *after;

  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto lines = markdown::splitLines(note->body());
  auto wanted = markdown::trim(pattern);
  auto match = std::find_if(lines.begin(), lines.end(), [&wanted](const std::string& line) {
    return markdown::trim(line) == wanted;
  });
  if (match == lines.end()) {
    return std::unexpected(makeError(ErrorCode::kTextNotFound,
                                     "Pattern '" + pattern + "' not found in note '" + name + "'"));
  }

  if (position == InsertPosition::kAfter) {
    ++match;
  }
  lines.insert(match, text);

  auto written = writeAndRefresh(
      note->path(), core::Note::serialize(note->frontMatter(), markdown::joinLines(lines)));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  return InsertResult{name, position, pattern};
}

// Tags

Result<void> Operations::checkTags(const std::string& name, const std::vector<std::string>& tags,
                                   const core::FrontMatter& front_matter, bool enforce_existing) {
  if (enforce_existing) {
    auto existing = index_.allTags();
    if (!existing.has_value()) {
      return std::unexpected(existing.error());
    }
    auto known = validation::TagPolicy::checkExisting(tags, *existing);
    if (!known.has_value()) {
      return known;
    }
  }
  return tag_policy_.checkRules(name, tags, front_matter);
}

Result<TagResult> Operations::addTag(const std::string& name, const std::string& tag,
                                     bool enforce_existing) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto tags = note->tags();
  if (std::find(tags.begin(), tags.end(), tag) != tags.end()) {
    return TagResult{name, tags, false};
  }

  auto allowed = checkTags(name, {tag}, note->frontMatter(), enforce_existing);
  if (!allowed.has_value()) {
    return std::unexpected(allowed.error());
  }

  tags.push_back(tag);
  auto front_matter = note->frontMatter();
  front_matter.setTags(tags);

  auto written = writeAndRefresh(note->path(), core::Note::serialize(front_matter, note->body()));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  return TagResult{name, tags, true};
}

Result<TagResult> Operations::removeTag(const std::string& name, const std::string& tag) {
  auto note = index_.getNote(name);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  auto tags = note->tags();
  auto kept_end = std::remove(tags.begin(), tags.end(), tag);
  if (kept_end == tags.end()) {
    return TagResult{name, tags, false};
  }
  tags.erase(kept_end, tags.end());

  auto front_matter = note->frontMatter();
  front_matter.setTags(tags);

  auto written = writeAndRefresh(note->path(), core::Note::serialize(front_matter, note->body()));
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }
  return TagResult{name, tags, true};
}

}  // namespace mdvault::store
