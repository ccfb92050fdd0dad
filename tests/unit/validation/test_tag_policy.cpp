#include <gtest/gtest.h>

#include "mdvault/validation/tag_policy.hpp"
#include "test_helpers.hpp"

using namespace mdvault::validation;
using mdvault::ErrorCode;
using mdvault::core::FrontMatter;

class TagPolicyTest : public ::testing::Test {
 protected:
  TagPolicy policy_;
};

TEST_F(TagPolicyTest, PersonTagNeedsAtName) {
  EXPECT_OK(policy_.checkRules("@Jane Roe", {"Person"}, FrontMatter()));

  auto result = policy_.checkRules("Jane Roe", {"Person"}, FrontMatter());
  EXPECT_ERROR(result, ErrorCode::kTagPolicyViolation);
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("'@'"), std::string::npos);
}

TEST_F(TagPolicyTest, AssistantTagNeedsDescription) {
  EXPECT_ERROR(policy_.checkRules("Prompt", {"assistant"}, FrontMatter()),
               ErrorCode::kTagPolicyViolation);
  EXPECT_ERROR(policy_.checkRules("Prompt", {"assistant"}, FrontMatter::fromYaml("description: \"\"")),
               ErrorCode::kTagPolicyViolation);
  EXPECT_OK(policy_.checkRules("Prompt", {"assistant"},
                               FrontMatter::fromYaml("description: Read before planning")));
}

TEST_F(TagPolicyTest, UnknownTagsHaveNoRule) {
  EXPECT_OK(policy_.checkRules("anything", {"misc", "person"}, FrontMatter()));
}

TEST_F(TagPolicyTest, CustomRuleTable) {
  TagPolicy policy({{"draft",
                     [](const std::string&, const FrontMatter& fm) { return fm.has("owner"); },
                     "Drafts need an owner"}});

  EXPECT_EQ(policy.rules().size(), 1);
  EXPECT_ERROR(policy.checkRules("N", {"draft"}, FrontMatter()), ErrorCode::kTagPolicyViolation);
  EXPECT_OK(policy.checkRules("N", {"Person"}, FrontMatter()));
}

TEST_F(TagPolicyTest, ExistingTagsOnly) {
  std::set<std::string> existing = {"work", "home"};

  EXPECT_OK(TagPolicy::checkExisting({"work"}, existing));
  EXPECT_ERROR(TagPolicy::checkExisting({"work", "new"}, existing), ErrorCode::kTagPolicyViolation);
}

TEST_F(TagPolicyTest, EmptyVaultAcceptsAnyTag) {
  EXPECT_OK(TagPolicy::checkExisting({"first"}, {}));
}
