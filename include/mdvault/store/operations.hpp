#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "mdvault/common.hpp"
#include "mdvault/core/front_matter.hpp"
#include "mdvault/index/vault_index.hpp"
#include "mdvault/markdown/markdown_parser.hpp"
#include "mdvault/validation/tag_policy.hpp"
#include "mdvault/validation/validator.hpp"

namespace mdvault::store {

enum class SearchMode { kName, kNamePartial, kContent, kTag };
enum class TagLogic { kAnd, kOr };
enum class LinkDirection { kOut, kIn, kBoth };
enum class InsertPosition { kBefore, kAfter };

Result<SearchMode> parseSearchMode(const std::string& value);
Result<TagLogic> parseTagLogic(const std::string& value);
Result<LinkDirection> parseLinkDirection(const std::string& value);
std::string_view insertPositionToString(InsertPosition position);

using Warnings = std::vector<validation::ValidationWarning>;

struct CreateResult {
  std::string name;
  std::filesystem::path path;
  Warnings warnings;
};

// Result of an edit to an existing note's content
struct WriteResult {
  std::string name;
  Warnings warnings;
};

struct DeleteResult {
  std::string name;
  std::filesystem::path trash_path;
  std::vector<std::string> files_updated;
};

struct RenameResult {
  std::string old_name;
  std::string new_name;
  std::vector<std::string> files_updated;
};

struct LinksResult {
  std::string name;
  std::optional<std::vector<std::string>> outgoing;
  std::optional<std::vector<std::string>> incoming;
};

struct BrokenLink {
  std::string source;
  std::string target;
};

struct ReplaceResult {
  std::string name;
  size_t replacements;
};

struct InsertResult {
  std::string name;
  InsertPosition position;
  std::string pattern;
};

struct TagResult {
  std::string name;
  std::vector<std::string> tags;
  bool changed;  // tag added, or removed
};

struct NoteList {
  std::vector<std::string> names;
  size_t total;
  size_t limit;
  size_t offset;
};

struct NoteMetadata {
  std::string name;
  core::FrontMatter front_matter;
  std::vector<std::string> outgoing;
  std::vector<std::string> incoming;
};

// One entry of a batch call; failures do not stop the batch
template <typename T>
struct BatchItem {
  std::string name;
  Result<T> result;
};

// User-facing note operations over one vault.
//
// Every blocking check runs before the first write. Every write is followed
// by a full index refresh. Rename and delete touch several files and are not
// atomic across them.
class Operations {
 public:
  explicit Operations(index::VaultIndex& index,
                      validation::Validator validator = {},
                      validation::TagPolicy tag_policy = {});

  // CRUD
  Result<CreateResult> create(const std::string& name, const std::string& content,
                              const core::FrontMatter& front_matter = {});
  Result<std::string> read(const std::string& name);
  Result<WriteResult> append(const std::string& name, const std::string& text);
  Result<WriteResult> update(const std::string& name, const std::string& content);
  Result<core::FrontMatter> frontmatterGet(const std::string& name);
  // Setting "tags" runs the same tag checks as addTag
  Result<core::FrontMatter> frontmatterSet(const std::string& name, const std::string& key,
                                           const YAML::Node& value,
                                           bool enforce_existing_tags = true);

  // Moves the note to .trash/ and marks links to it as "(deleted)"
  Result<DeleteResult> remove(const std::string& name, bool dry_run = false);
  Result<RenameResult> rename(const std::string& old_name, const std::string& new_name,
                              bool dry_run = false);
  std::vector<BatchItem<DeleteResult>> batchRemove(const std::vector<std::string>& names,
                                                   bool dry_run = false);
  std::vector<BatchItem<RenameResult>> batchRename(
      const std::vector<std::pair<std::string, std::string>>& renames, bool dry_run = false);

  // Queries
  Result<std::vector<std::string>> search(const std::string& query, SearchMode mode);
  Result<std::vector<std::string>> searchTags(const std::string& query, TagLogic logic);
  Result<LinksResult> links(const std::string& name, LinkDirection direction);
  Result<std::vector<BrokenLink>> findBrokenLinks();
  Result<NoteList> listNames(size_t limit = 100, size_t offset = 0);
  Result<NoteMetadata> metadata(const std::string& name);

  // Links to missing notes become warnings; a link to a missing section of
  // an existing note is a kBrokenLink error.
  Result<Warnings> validateWikilinks(const std::string& content);

  // Sections
  Result<std::vector<markdown::Heading>> getHeadings(const std::string& name);
  Result<std::string> readSection(const std::string& name, const std::string& section);
  Result<WriteResult> appendSection(const std::string& name, const std::string& section,
                                    const std::string& text);
  Result<WriteResult> updateSection(const std::string& name, const std::string& section,
                                    const std::string& content);
  Result<WriteResult> deleteSection(const std::string& name, const std::string& section);

  // Body edits
  Result<ReplaceResult> replace(const std::string& name, const std::string& old_text,
                                const std::string& new_text, bool replace_all = false);
  Result<InsertResult> insert(const std::string& name, const std::string& text,
                              const std::optional<std::string>& before,
                              const std::optional<std::string>& after);

  // Tags
  Result<TagResult> addTag(const std::string& name, const std::string& tag,
                           bool enforce_existing = true);
  Result<TagResult> removeTag(const std::string& name, const std::string& tag);
  Result<void> checkTags(const std::string& name, const std::vector<std::string>& tags,
                         const core::FrontMatter& front_matter, bool enforce_existing = true);

  const validation::Validator& validator() const noexcept { return validator_; }
  index::VaultIndex& vaultIndex() noexcept { return index_; }

 private:
  Result<void> writeAndRefresh(const std::filesystem::path& path, const std::string& content);
  Result<void> rewriteReferences(const std::string& source, const std::string& old_target,
                                 const std::string& new_target);
  Result<Warnings> checkContent(const std::string& content);
  Result<WriteResult> writeBody(const core::Note& note, const std::string& body,
                                Warnings link_warnings);
  Result<markdown::SectionBounds> locateSection(const core::Note& note,
                                                const std::vector<std::string>& lines,
                                                const std::string& section);

  index::VaultIndex& index_;
  validation::Validator validator_;
  validation::TagPolicy tag_policy_;
};

}  // namespace mdvault::store
