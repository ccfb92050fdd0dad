#include <gtest/gtest.h>

#include "mdvault/core/front_matter.hpp"
#include "test_helpers.hpp"

using namespace mdvault::core;

class FrontMatterTest : public ::testing::Test {};

TEST_F(FrontMatterTest, DefaultIsEmpty) {
  FrontMatter front_matter;
  EXPECT_TRUE(front_matter.empty());
  EXPECT_EQ(front_matter.toYaml(), "");
  EXPECT_TRUE(front_matter.tags().empty());
}

TEST_F(FrontMatterTest, NonMappingYamlIsEmpty) {
  EXPECT_TRUE(FrontMatter::fromYaml("- a\n- b").empty());
  EXPECT_TRUE(FrontMatter::fromYaml("just a string").empty());
  EXPECT_TRUE(FrontMatter::fromYaml("").empty());
}

TEST_F(FrontMatterTest, KeysKeepInsertionOrder) {
  auto front_matter = FrontMatter::fromYaml("zeta: 1\nalpha: 2");
  front_matter.set("middle", YAML::Node(3));

  EXPECT_EQ(front_matter.keys(), (std::vector<std::string>{"zeta", "alpha", "middle"}));
  EXPECT_EQ(front_matter.toYaml(), "zeta: 1\nalpha: 2\nmiddle: 3");
}

TEST_F(FrontMatterTest, ListsAreBlockStyle) {
  FrontMatter front_matter;
  front_matter.setTags({"one", "two"});

  EXPECT_EQ(front_matter.toYaml(), "tags:\n  - one\n  - two");
}

TEST_F(FrontMatterTest, StringTagsStayStrings) {
  FrontMatter front_matter;
  front_matter.setTags({"2024", "true"});

  auto reparsed = FrontMatter::fromYaml(front_matter.toYaml());
  EXPECT_EQ(reparsed.tags(), (std::vector<std::string>{"2024", "true"}));
  EXPECT_TRUE(FrontMatter::isStringScalar(reparsed.get("tags")[0]));
}

TEST_F(FrontMatterTest, UnicodeIsPreserved) {
  FrontMatter front_matter;
  front_matter.set("title", FrontMatter::stringValue("Café ✅"));

  EXPECT_NE(front_matter.toYaml().find("Café ✅"), std::string::npos);
}

TEST_F(FrontMatterTest, SingleStringTagBecomesList) {
  auto front_matter = FrontMatter::fromYaml("tags: solo");
  EXPECT_EQ(front_matter.tags(), (std::vector<std::string>{"solo"}));
}

TEST_F(FrontMatterTest, NonListTagsYieldNothing) {
  EXPECT_TRUE(FrontMatter::fromYaml("tags: 42").tags().empty());
  EXPECT_TRUE(FrontMatter::fromYaml("tags:\n  nested: map").tags().empty());
}

TEST_F(FrontMatterTest, CopiesAreIndependent) {
  auto original = FrontMatter::fromYaml("a: 1");
  auto copy = original;
  copy.set("b", YAML::Node(2));

  EXPECT_FALSE(original.has("b"));
  EXPECT_TRUE(copy.has("b"));
}

TEST_F(FrontMatterTest, EraseAndGet) {
  auto front_matter = FrontMatter::fromYaml("a: 1\nb: two");

  EXPECT_EQ(front_matter.get("b").as<std::string>(), "two");
  EXPECT_TRUE(front_matter.get("missing").IsNull());
  EXPECT_TRUE(front_matter.erase("a"));
  EXPECT_FALSE(front_matter.erase("a"));
  EXPECT_EQ(front_matter.keys(), (std::vector<std::string>{"b"}));
}

TEST_F(FrontMatterTest, LooksLikeNonString) {
  EXPECT_TRUE(FrontMatter::looksLikeNonString("true"));
  EXPECT_TRUE(FrontMatter::looksLikeNonString("Null"));
  EXPECT_TRUE(FrontMatter::looksLikeNonString("12"));
  EXPECT_TRUE(FrontMatter::looksLikeNonString("1.5"));
  EXPECT_FALSE(FrontMatter::looksLikeNonString("12 monkeys"));
  EXPECT_FALSE(FrontMatter::looksLikeNonString("project"));
}
