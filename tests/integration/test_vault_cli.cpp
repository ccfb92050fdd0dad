#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>

#include "mdvault/cli/application.hpp"
#include "temp_directory.hpp"

namespace mdvault::cli {

class VaultCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::make_unique<mdvault::test::TempDirectory>();

        vault_dir_ = temp_dir_->createSubdir("vault");
        auto log_file = temp_dir_->path() / "logs" / "mdvault.log";
        config_file_ = temp_dir_->createFile(
            "config.toml", "[logging]\nfile = \"" + log_file.string() + "\"\n");
    }

    void TearDown() override {
        temp_dir_.reset();
    }

    struct CommandOutput {
        int exit_code;
        std::string out;
        std::string err;
    };

    // Run one CLI invocation against the test vault and capture its output
    CommandOutput runCommand(const std::vector<std::string>& args) {
        std::vector<std::string> full_args = {
            "mdvault", "--config", config_file_.string(), "--vault", vault_dir_.string()};
        full_args.insert(full_args.end(), args.begin(), args.end());

        std::vector<char*> argv;
        for (auto& arg : full_args) {
            argv.push_back(arg.data());
        }

        std::ostringstream cout_output, cerr_output;
        std::streambuf* orig_cout = std::cout.rdbuf();
        std::streambuf* orig_cerr = std::cerr.rdbuf();
        std::cout.rdbuf(cout_output.rdbuf());
        std::cerr.rdbuf(cerr_output.rdbuf());

        int exit_code = 0;
        {
            Application app;
            exit_code = app.run(static_cast<int>(argv.size()), argv.data());
        }

        std::cout.rdbuf(orig_cout);
        std::cerr.rdbuf(orig_cerr);

        return {exit_code, cout_output.str(), cerr_output.str()};
    }

    nlohmann::json runJson(const std::vector<std::string>& args) {
        std::vector<std::string> json_args = {"--json"};
        json_args.insert(json_args.end(), args.begin(), args.end());
        auto result = runCommand(json_args);
        EXPECT_EQ(result.exit_code, 0) << result.out << result.err;
        return nlohmann::json::parse(result.out, nullptr, false);
    }

    std::string readNote(const std::string& relative) {
        return temp_dir_->readFile("vault/" + relative);
    }

    std::unique_ptr<mdvault::test::TempDirectory> temp_dir_;
    std::filesystem::path vault_dir_;
    std::filesystem::path config_file_;
};

TEST_F(VaultCLITest, CreateAndShow) {
    auto created = runJson({"new", "Plan", "--content", "## Goals\nShip"});
    EXPECT_EQ(created["name"], "Plan");
    EXPECT_TRUE(created["warnings"].empty());
    EXPECT_EQ(readNote("Plan.md"), "## Goals\nShip");

    auto shown = runCommand({"show", "Plan"});
    EXPECT_EQ(shown.exit_code, 0);
    EXPECT_EQ(shown.out, "## Goals\nShip\n");
}

TEST_F(VaultCLITest, CreateWithFrontMatterAndTags) {
    auto created = runJson({"new", "Deal", "--content", "body",
                            "--frontmatter", R"({"stage": "seed", "amount": 5})",
                            "--tags", "vc/project"});
    EXPECT_EQ(created["name"], "Deal");

    auto meta = runJson({"meta", "get", "Deal"});
    EXPECT_EQ(meta["stage"], "seed");
    EXPECT_EQ(meta["amount"], 5);
    EXPECT_EQ(meta["tags"], nlohmann::json::array({"vc/project"}));

    auto found = runJson({"search", "vc", "--mode", "tag"});
    EXPECT_EQ(found["results"], nlohmann::json::array({"Deal"}));
}

TEST_F(VaultCLITest, ErrorsAsJson) {
    auto result = runCommand({"--json", "show", "Missing"});
    EXPECT_EQ(result.exit_code, 1);

    auto error = nlohmann::json::parse(result.out, nullptr, false);
    ASSERT_FALSE(error.is_discarded()) << result.out;
    EXPECT_EQ(error["error"], "Note 'Missing' not found");
    EXPECT_EQ(error["kind"], "Note not found");
}

TEST_F(VaultCLITest, ErrorsAsText) {
    auto result = runCommand({"search", "x", "--mode", "fuzzy"});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.err.find("Error: Invalid search mode: fuzzy"), std::string::npos);
}

TEST_F(VaultCLITest, RenameCascade) {
    temp_dir_->createFile("vault/A.md", "See [[B]]");
    temp_dir_->createFile("vault/B.md", "b");

    auto dry = runJson({"mv", "B", "B2", "--dry-run"});
    EXPECT_EQ(dry["results"][0]["files_updated"], nlohmann::json::array({"A"}));
    EXPECT_EQ(readNote("A.md"), "See [[B]]");

    auto moved = runJson({"mv", "B", "B2"});
    EXPECT_EQ(moved["results"][0]["new_name"], "B2");
    EXPECT_EQ(readNote("A.md"), "See [[B2]]");

    auto links = runJson({"links", "B2", "--direction", "in"});
    EXPECT_EQ(links["incoming"], nlohmann::json::array({"A"}));
    EXPECT_FALSE(links.contains("outgoing"));
}

TEST_F(VaultCLITest, MoveNeedsPairs) {
    auto result = runCommand({"mv", "A", "B", "C"});
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(VaultCLITest, DeleteCascade) {
    temp_dir_->createFile("vault/A.md", "[[B|Alias]]");
    temp_dir_->createFile("vault/B.md", "b");

    auto removed = runJson({"rm", "B"});
    EXPECT_EQ(removed["results"][0]["files_updated"], nlohmann::json::array({"A"}));
    EXPECT_EQ(readNote("A.md"), "[[B (deleted)|Alias]]");
    EXPECT_TRUE(temp_dir_->exists("vault/.trash/B.md"));

    auto broken = runJson({"broken"});
    EXPECT_EQ(broken["count"], 1);
    EXPECT_EQ(broken["broken_links"][0]["target"], "B (deleted)");
}

TEST_F(VaultCLITest, SectionCommands) {
    temp_dir_->createFile("vault/N.md", "## H\nX\n## H2\nY");

    auto read = runJson({"section", "read", "N", "H"});
    EXPECT_EQ(read["content"], "X");

    runJson({"section", "update", "N", "H", "Z"});
    EXPECT_EQ(readNote("N.md"), "## H\nZ\n## H2\nY");

    runJson({"section", "append", "N", "H2", "W"});
    EXPECT_EQ(readNote("N.md"), "## H\nZ\n## H2\nY\nW");

    runJson({"section", "delete", "N", "H"});
    EXPECT_EQ(readNote("N.md"), "## H2\nY\nW");

    auto headings = runJson({"headings", "N"});
    ASSERT_EQ(headings["headings"].size(), 1);
    EXPECT_EQ(headings["headings"][0]["text"], "H2");
    EXPECT_EQ(headings["headings"][0]["level"], 2);

    auto missing = runCommand({"section", "read", "N", "Nope"});
    EXPECT_EQ(missing.exit_code, 1);
}

TEST_F(VaultCLITest, ReplaceAndInsert) {
    temp_dir_->createFile("vault/N.md", "x\nmarker\nx");

    auto replaced = runJson({"replace", "N", "x", "y", "--all"});
    EXPECT_EQ(replaced["replacements"], 2);

    auto inserted = runJson({"insert", "N", "new line", "--after", "marker"});
    EXPECT_EQ(inserted["position"], "after");
    EXPECT_EQ(readNote("N.md"), "y\nmarker\nnew line\ny");

    auto conflicting = runCommand({"insert", "N", "x", "--before", "marker", "--after", "marker"});
    EXPECT_EQ(conflicting.exit_code, 1);
}

TEST_F(VaultCLITest, TagAndMetaCommands) {
    temp_dir_->createFile("vault/Doc.md", "body");

    auto added = runJson({"tag", "add", "Doc", "work"});
    EXPECT_EQ(added["added"], true);
    EXPECT_EQ(added["tags"], nlohmann::json::array({"work"}));

    auto rejected = runCommand({"tag", "add", "Doc", "unknown-tag"});
    EXPECT_EQ(rejected.exit_code, 1);
    runJson({"tag", "add", "Doc", "unknown-tag", "--allow-new"});

    auto removed = runJson({"tag", "rm", "Doc", "absent"});
    EXPECT_EQ(removed["removed"], false);

    auto set = runJson({"meta", "set", "Doc", "reviewers", R"(["ann", "bo"])"});
    EXPECT_EQ(set["frontmatter"]["reviewers"], nlohmann::json::array({"ann", "bo"}));

    auto value = runJson({"meta", "get", "Doc", "reviewers"});
    EXPECT_EQ(value["value"], nlohmann::json::array({"ann", "bo"}));

    auto bad_tags = runCommand({"meta", "set", "Doc", "tags", "single"});
    EXPECT_EQ(bad_tags.exit_code, 1);
}

TEST_F(VaultCLITest, MetaSetTagsChecksVaultTags) {
    temp_dir_->createFile("vault/Known.md", "---\ntags: [work]\n---\n");
    temp_dir_->createFile("vault/Doc.md", "body");

    auto rejected = runCommand({"--json", "meta", "set", "Doc", "tags", R"(["work", "invented"])"});
    EXPECT_EQ(rejected.exit_code, 1);
    auto error = nlohmann::json::parse(rejected.out, nullptr, false);
    EXPECT_EQ(error["kind"], "Tag policy violation");
    EXPECT_EQ(readNote("Doc.md"), "body");

    auto reused = runJson({"meta", "set", "Doc", "tags", R"(["work"])"});
    EXPECT_EQ(reused["frontmatter"]["tags"], nlohmann::json::array({"work"}));

    auto allowed = runJson({"meta", "set", "Doc", "tags", R"(["work", "invented"])",
                            "--allow-new-tags"});
    EXPECT_EQ(allowed["frontmatter"]["tags"], nlohmann::json::array({"work", "invented"}));
}

TEST_F(VaultCLITest, ListAndValidate) {
    temp_dir_->createFile("vault/b.md", "text\n| A |\n|---|");
    temp_dir_->createFile("vault/a.md", "[[Nowhere]]");

    auto list = runJson({"ls"});
    EXPECT_EQ(list["notes"], nlohmann::json::array({"a", "b"}));
    EXPECT_EQ(list["total"], 2);

    auto validated = runJson({"validate"});
    EXPECT_EQ(validated["warning_count"], 2);
    EXPECT_EQ(validated["notes"][1]["warnings"][0]["rule"], "table-blank-line");
    EXPECT_EQ(validated["notes"][1]["warnings"][0]["line"], 2);
}

TEST_F(VaultCLITest, ConfigWorksWithoutVault) {
    std::vector<std::string> args = {"mdvault", "--config", config_file_.string(),
                                     "config", "set", "tags.enforce_existing", "false"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    std::ostringstream sink;
    std::streambuf* orig_cout = std::cout.rdbuf(sink.rdbuf());
    int exit_code = 0;
    {
        Application app;
        exit_code = app.run(static_cast<int>(argv.size()), argv.data());
    }
    std::cout.rdbuf(orig_cout);

    EXPECT_EQ(exit_code, 0);
    auto value = runJson({"config", "get", "tags.enforce_existing"});
    EXPECT_EQ(value["value"], "false");
}

TEST_F(VaultCLITest, MissingVaultIsReported) {
    std::filesystem::remove_all(vault_dir_);

    auto result = runCommand({"--json", "ls"});
    EXPECT_EQ(result.exit_code, 1);
    auto error = nlohmann::json::parse(result.out, nullptr, false);
    EXPECT_EQ(error["kind"], "Vault not configured");
}

} // namespace mdvault::cli
