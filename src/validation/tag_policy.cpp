#include "mdvault/validation/tag_policy.hpp"

namespace mdvault::validation {

namespace {

bool hasDescription(const core::FrontMatter& front_matter) {
  auto description = front_matter.get("description");
  if (!description || description.IsNull()) {
    return false;
  }
  if (description.IsScalar()) {
    return !description.Scalar().empty();
  }
  return description.size() > 0;
}

}  // namespace

TagPolicy::TagPolicy() : rules_(defaultRules()) {}

TagPolicy::TagPolicy(std::vector<TagRule> rules) : rules_(std::move(rules)) {}

std::vector<TagRule> TagPolicy::defaultRules() {
  return {
      {"Person",
       [](const std::string& note_name, const core::FrontMatter&) {
         return !note_name.empty() && note_name.front() == '@';
       },
       "Tag 'Person' is for people notes only. Note name must start with '@' "
       "(e.g. '@John Doe')."},
      {"assistant",
       [](const std::string&, const core::FrontMatter& front_matter) {
         return hasDescription(front_matter);
       },
       "Tag 'assistant' marks instructions for an assistant. Requires 'description' "
       "field in frontmatter explaining when to read the note."},
  };
}

Result<void> TagPolicy::checkRules(const std::string& note_name,
                                   const std::vector<std::string>& tags,
                                   const core::FrontMatter& front_matter) const {
  for (const auto& tag : tags) {
    for (const auto& rule : rules_) {
      if (rule.tag == tag && !rule.check(note_name, front_matter)) {
        return std::unexpected(makeError(ErrorCode::kTagPolicyViolation, rule.message));
      }
    }
  }
  return {};
}

Result<void> TagPolicy::checkExisting(const std::vector<std::string>& tags,
                                      const std::set<std::string>& existing) {
  if (existing.empty()) {
    return {};
  }
  for (const auto& tag : tags) {
    if (existing.count(tag) == 0) {
      return std::unexpected(makeError(ErrorCode::kTagPolicyViolation,
                                       "Tag '" + tag + "' is not used anywhere in the vault. "
                                       "Reuse an existing tag or allow new tags explicitly."));
    }
  }
  return {};
}

}  // namespace mdvault::validation
