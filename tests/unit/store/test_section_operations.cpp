#include <gtest/gtest.h>

#include <optional>

#include "mdvault/store/operations.hpp"
#include "test_helpers.hpp"

using namespace mdvault::store;
using namespace mdvault::test;
using mdvault::ErrorCode;
using mdvault::validation::WarningRule;

class SectionOperationsTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    auto opened = mdvault::index::VaultIndex::open(temp_dir_);
    ASSERT_TRUE(opened.has_value());
    index_.emplace(std::move(*opened));
    ops_.emplace(*index_);
  }

  void TearDown() override {
    ops_.reset();
    index_.reset();
    TempDirTest::TearDown();
  }

  std::string body(const std::string& name) {
    auto note = index_->getNote(name);
    EXPECT_TRUE(note.has_value());
    return note.has_value() ? note->body() : "";
  }

  std::optional<mdvault::index::VaultIndex> index_;
  std::optional<Operations> ops_;
};

TEST_F(SectionOperationsTest, ReadAndUpdateRoundTrip) {
  writeFile("N.md", "## H\nX\n## H2\nY");

  auto section = ops_->readSection("N", "H");
  ASSERT_OK(section);
  EXPECT_EQ(*section, "X");

  ASSERT_OK(ops_->updateSection("N", "H", "Z"));
  EXPECT_EQ(body("N"), "## H\nZ\n## H2\nY");
}

TEST_F(SectionOperationsTest, ReadSectionIsTrimmed) {
  writeFile("N.md", "# Top\n\n  padded text\n\n# Next");

  auto section = ops_->readSection("N", "# Top");
  ASSERT_OK(section);
  EXPECT_EQ(*section, "padded text");
}

TEST_F(SectionOperationsTest, UpdateKeepsFrontMatter) {
  writeFile("N.md", "---\nowner: me\n---\n# A\nold\n# B\nkeep");

  ASSERT_OK(ops_->updateSection("N", "A", "new"));
  EXPECT_EQ(readFile("N.md"), "---\nowner: me\n---\n# A\nnew\n# B\nkeep");
}

TEST_F(SectionOperationsTest, AppendSectionBeforeNextHeading) {
  writeFile("N.md", "## Tasks\n- one\n## Done\n- old");

  ASSERT_OK(ops_->appendSection("N", "Tasks", "- two"));
  EXPECT_EQ(body("N"), "## Tasks\n- one\n- two\n## Done\n- old");
}

TEST_F(SectionOperationsTest, AppendSectionAtEndOfDocument) {
  writeFile("N.md", "## Tasks\n- one");

  ASSERT_OK(ops_->appendSection("N", "Tasks", "- two"));
  EXPECT_EQ(body("N"), "## Tasks\n- one\n- two");
}

TEST_F(SectionOperationsTest, DeleteSectionRemovesHeadingAndBody) {
  writeFile("N.md", "# Keep\na\n## Drop\nb\n### Nested\nc\n## After\nd");

  auto deleted = ops_->deleteSection("N", "Drop");
  ASSERT_OK(deleted);
  EXPECT_EQ(body("N"), "# Keep\na\n## After\nd");
}

TEST_F(SectionOperationsTest, MissingSection) {
  writeFile("N.md", "# Only");

  auto result = ops_->readSection("N", "Other");
  EXPECT_ERROR(result, ErrorCode::kSectionNotFound);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "Section 'Other' not found in note 'N'");

  EXPECT_ERROR(ops_->updateSection("N", "Other", "x"), ErrorCode::kSectionNotFound);
  EXPECT_ERROR(ops_->deleteSection("N", "Other"), ErrorCode::kSectionNotFound);
  EXPECT_ERROR(ops_->readSection("Missing", "Only"), ErrorCode::kNoteNotFound);
}

TEST_F(SectionOperationsTest, UpdateSectionChecksLinks) {
  writeFile("Target.md", "# Real");
  writeFile("N.md", "# A\nx");

  EXPECT_ERROR(ops_->updateSection("N", "A", "[[Target#Fake]]"), ErrorCode::kBrokenLink);
  EXPECT_EQ(body("N"), "# A\nx");

  auto updated = ops_->updateSection("N", "A", "[[Missing]]");
  ASSERT_OK(updated);
  ASSERT_EQ(updated->warnings.size(), 1);
  EXPECT_EQ(updated->warnings[0].rule, WarningRule::kBrokenLink);
}

TEST_F(SectionOperationsTest, HeadingsSkipFences) {
  writeFile("N.md", "# One\n````\n```\n# inner\n```\n````\n## Two");

  auto headings = ops_->getHeadings("N");
  ASSERT_OK(headings);
  ASSERT_EQ(headings->size(), 2);
  EXPECT_EQ((*headings)[0].text, "One");
  EXPECT_EQ((*headings)[1].text, "Two");
  EXPECT_EQ((*headings)[1].level, 2);

  auto content = ops_->read("N");
  ASSERT_OK(content);
  EXPECT_TRUE(ops_->validator().validate(*content).empty());
}

// Replace / insert

TEST_F(SectionOperationsTest, ReplaceFirstOrAll) {
  writeFile("N.md", "cat cat cat");

  auto first = ops_->replace("N", "cat", "dog");
  ASSERT_OK(first);
  EXPECT_EQ(first->replacements, 1);
  EXPECT_EQ(body("N"), "dog cat cat");

  auto all = ops_->replace("N", "cat", "dog", true);
  ASSERT_OK(all);
  EXPECT_EQ(all->replacements, 2);
  EXPECT_EQ(body("N"), "dog dog dog");
}

TEST_F(SectionOperationsTest, ReplaceWithTextContainingOld) {
  writeFile("N.md", "a-a");

  auto result = ops_->replace("N", "a", "aa", true);
  ASSERT_OK(result);
  EXPECT_EQ(result->replacements, 2);
  EXPECT_EQ(body("N"), "aa-aa");
}

TEST_F(SectionOperationsTest, ReplaceIgnoresFrontMatter) {
  writeFile("N.md", "---\nstatus: draft\n---\nbody text");

  auto result = ops_->replace("N", "draft", "final");
  EXPECT_ERROR(result, ErrorCode::kTextNotFound);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "Text 'draft' not found in note 'N'");
  EXPECT_EQ(readFile("N.md"), "---\nstatus: draft\n---\nbody text");

  EXPECT_ERROR(ops_->replace("N", "", "x"), ErrorCode::kInvalidArgument);
}

TEST_F(SectionOperationsTest, InsertBeforeAndAfter) {
  writeFile("N.md", "first\n  marker  \nlast");

  auto after = ops_->insert("N", "after-line", std::nullopt, std::string("marker"));
  ASSERT_OK(after);
  EXPECT_EQ(after->position, InsertPosition::kAfter);
  EXPECT_EQ(body("N"), "first\n  marker  \nafter-line\nlast");

  ASSERT_OK(ops_->insert("N", "before-line", std::string("marker"), std::nullopt));
  EXPECT_EQ(body("N"), "first\nbefore-line\n  marker  \nafter-line\nlast");
}

TEST_F(SectionOperationsTest, InsertArgumentChecks) {
  writeFile("N.md", "line");

  EXPECT_ERROR(ops_->insert("N", "x", std::nullopt, std::nullopt), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ops_->insert("N", "x", std::string("line"), std::string("line")),
               ErrorCode::kInvalidArgument);
  EXPECT_ERROR(ops_->insert("N", "x", std::string("absent"), std::nullopt),
               ErrorCode::kTextNotFound);
}

// Wikilink checks

TEST_F(SectionOperationsTest, ValidateWikilinksWarnsOncePerOccurrence) {
  writeFile("Real.md", "# Intro");

  auto warnings = ops_->validateWikilinks("[[Ghost]]\n[[Real#Intro]]\n[[Ghost|again]]");
  ASSERT_OK(warnings);
  ASSERT_EQ(warnings->size(), 2);
  EXPECT_EQ((*warnings)[0].line, 1);
  EXPECT_EQ((*warnings)[1].line, 3);
}

TEST_F(SectionOperationsTest, ValidateWikilinksStopsAtFirstBrokenSection) {
  writeFile("Real.md", "# Intro");

  auto result = ops_->validateWikilinks("[[Real#Nope]] [[Real#Also nope]]");
  EXPECT_ERROR(result, ErrorCode::kBrokenLink);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "Section 'Nope' not found in note 'Real'");
}
