#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "mdvault/common.hpp"
#include "mdvault/core/front_matter.hpp"

namespace mdvault::validation {

// A tag that may only be applied to notes satisfying a predicate
struct TagRule {
  std::string tag;
  std::function<bool(const std::string& note_name, const core::FrontMatter& front_matter)> check;
  std::string message;
};

// Tag rules plus the "reuse existing tags" policy
class TagPolicy {
 public:
  TagPolicy();
  explicit TagPolicy(std::vector<TagRule> rules);

  // Built-in table: "Person" needs an '@' name, "assistant" needs a
  // description in the front matter
  static std::vector<TagRule> defaultRules();

  const std::vector<TagRule>& rules() const noexcept { return rules_; }

  // First failing rule among tags, as kTagPolicyViolation
  Result<void> checkRules(const std::string& note_name,
                          const std::vector<std::string>& tags,
                          const core::FrontMatter& front_matter) const;

  // Every tag must already be used somewhere in the vault. A vault with no
  // tags at all accepts anything.
  static Result<void> checkExisting(const std::vector<std::string>& tags,
                                    const std::set<std::string>& existing);

 private:
  std::vector<TagRule> rules_;
};

}  // namespace mdvault::validation
