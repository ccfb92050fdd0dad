#include <gtest/gtest.h>

#include "mdvault/core/note.hpp"
#include "test_helpers.hpp"

using namespace mdvault::core;

class NoteTest : public ::testing::Test {};

TEST_F(NoteTest, ParseWithoutFrontMatter) {
  auto note = Note::parse("/vault/Plain.md", "Just text with [[Other]]");

  EXPECT_EQ(note.name(), "Plain");
  EXPECT_TRUE(note.frontMatter().empty());
  EXPECT_EQ(note.body(), "Just text with [[Other]]");
  ASSERT_EQ(note.outgoingLinks().size(), 1);
  EXPECT_EQ(note.outgoingLinks()[0], "Other");
}

TEST_F(NoteTest, ParseWithFrontMatter) {
  auto note = Note::parse("/vault/sub/Tagged.md", "---\ntags:\n  - a\n  - b\n---\nBody\n");

  EXPECT_EQ(note.name(), "Tagged");
  EXPECT_EQ(note.tags(), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(note.body(), "Body\n");
}

TEST_F(NoteTest, ParseNormalizesBomAndLineEndings) {
  auto note = Note::parse("/vault/Win.md", "\xEF\xBB\xBF---\r\ntitle: x\r\n---\r\nLine one\r\nLine two");

  EXPECT_TRUE(note.frontMatter().has("title"));
  EXPECT_EQ(note.body(), "Line one\nLine two");
}

TEST_F(NoteTest, UnterminatedFrontMatterIsBody) {
  std::string raw = "---\ntitle: x\nno closing marker";
  auto note = Note::parse("/vault/Open.md", raw);

  EXPECT_TRUE(note.frontMatter().empty());
  EXPECT_EQ(note.body(), raw);
}

TEST_F(NoteTest, MalformedYamlYieldsEmptyMapping) {
  auto note = Note::parse("/vault/Bad.md", "---\n: [unbalanced\n---\nBody");

  EXPECT_TRUE(note.frontMatter().empty());
  EXPECT_EQ(note.body(), "Body");
}

TEST_F(NoteTest, SerializeEmptyFrontMatterIsBodyOnly) {
  EXPECT_EQ(Note::serialize(FrontMatter(), "X"), "X");
}

TEST_F(NoteTest, SerializeRoundTrip) {
  auto front_matter = FrontMatter::fromYaml("a: 1");
  auto raw = Note::serialize(front_matter, "X");
  EXPECT_EQ(raw, "---\na: 1\n---\nX");

  auto note = Note::parse("/vault/N.md", raw);
  EXPECT_EQ(note.body(), "X");
  EXPECT_EQ(note.frontMatter(), front_matter);
  EXPECT_EQ(note.frontMatter().get("a").as<int>(), 1);
}

TEST_F(NoteTest, OutgoingLinksKeepDuplicatesAndOrder) {
  auto note = Note::parse("/vault/L.md", "[[B]] then [[A|alias]] and [[B#Part]]");

  EXPECT_EQ(note.outgoingLinks(), (std::vector<std::string>{"B", "A", "B"}));
}

TEST_F(NoteTest, HierarchicalTagMatch) {
  EXPECT_TRUE(Note::tagMatches("vc", "vc"));
  EXPECT_TRUE(Note::tagMatches("vc/project", "vc"));
  EXPECT_FALSE(Note::tagMatches("vccorp", "vc"));
  EXPECT_FALSE(Note::tagMatches("v", "vc"));

  auto note = Note::parse("/vault/T.md", "---\ntags: [vc/project]\n---\n");
  EXPECT_TRUE(note.hasTag("vc"));
  EXPECT_TRUE(note.hasTag("vc/project"));
  EXPECT_FALSE(note.hasTag("project"));
}

TEST_F(NoteTest, ContainsTextIgnoresCase) {
  auto note = Note::parse("/vault/C.md", "---\nkey: Hidden\n---\nSome Visible text");

  EXPECT_TRUE(note.containsText("visible").value_or(false));
  EXPECT_FALSE(note.containsText("visible", true).value_or(true));
  EXPECT_FALSE(note.containsText("hidden").value_or(true));

  auto cyrillic = Note::parse("/vault/Meeting.md", "Встреча с командой");
  EXPECT_TRUE(cyrillic.containsText("встреча").value_or(false));
  EXPECT_TRUE(cyrillic.containsText("С КОМАНДОЙ").value_or(false));
  EXPECT_FALSE(cyrillic.containsText("встреча", true).value_or(true));
}
