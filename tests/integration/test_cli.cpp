#include <gtest/gtest.h>

#include <algorithm>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "quire/cli/application.hpp"
#include "temp_directory.hpp"

namespace quire::cli {

struct CommandOutput {
  int exit_code = 0;
  std::string out;
  std::string err;
};

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_dir_ = temp_dir_.path() / "store";
    config_file_ = temp_dir_.createFile(
        "config.toml", "log_file = \"" + (temp_dir_.path() / "logs" / "quire.log").string() +
                           "\"\n");
  }

  // Run one command against the temp store, capturing stdout and stderr
  CommandOutput run(std::vector<std::string> args) {
    args.insert(args.begin(), {"quire", "--config", config_file_.string(),
                               "--root", store_dir_.string()});
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }

    std::ostringstream out;
    std::ostringstream err;
    auto* orig_cout = std::cout.rdbuf(out.rdbuf());
    auto* orig_cerr = std::cerr.rdbuf(err.rdbuf());

    CommandOutput result;
    try {
      Application app;
      result.exit_code = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (...) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);
    result.out = out.str();
    result.err = err.str();
    return result;
  }

  nlohmann::json runJson(std::vector<std::string> args) {
    args.insert(args.begin(), "--json");
    auto result = run(std::move(args));
    EXPECT_EQ(result.exit_code, 0) << result.out << result.err;
    return nlohmann::json::parse(result.out);
  }

  quire::test::TempDirectory temp_dir_;
  std::filesystem::path store_dir_;
  std::filesystem::path config_file_;
};

TEST_F(CliTest, InitCreatesStoreLayout) {
  auto result = run({"init"});
  EXPECT_EQ(result.exit_code, 0) << result.err;
  EXPECT_TRUE(std::filesystem::is_directory(store_dir_ / "notes"));
  EXPECT_TRUE(std::filesystem::is_directory(store_dir_ / "meta"));
}

TEST_F(CliTest, SaveViewAndList) {
  auto saved = runJson({"save", "-t", "Project Alpha", "-b", "Kickoff #planning"});
  std::string id = saved["id"];
  EXPECT_EQ(saved["body"], "Kickoff #planning");

  auto viewed = runJson({"view", id});
  EXPECT_EQ(viewed["title"], "Project Alpha");
  auto tags = viewed["tags"].get<std::vector<std::string>>();
  EXPECT_NE(std::find(tags.begin(), tags.end(), "project-alpha"), tags.end());
  EXPECT_NE(std::find(tags.begin(), tags.end(), "planning"), tags.end());

  auto listed = runJson({"ls"});
  ASSERT_TRUE(listed.is_array());
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0]["id"], id);
}

TEST_F(CliTest, SearchWithOperators) {
  std::string a = runJson({"save", "-t", "One", "-b", "#meeting"})["id"];
  runJson({"save", "-t", "Two", "-b", "#meeting"});
  ASSERT_EQ(run({"star", "--set", "on", a}).exit_code, 0);

  auto results = runJson({"search", "tag:meeting", "is:starred"});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0]["id"], a);
}

TEST_F(CliTest, HistoryAndRestore) {
  std::string id = runJson({"save", "-t", "Draft", "-b", "first"})["id"];
  runJson({"save", "--id", id, "-t", "Draft", "-b", "second"});

  auto versions = runJson({"history", id});
  ASSERT_EQ(versions.size(), 1u);
  std::string saved_at = versions[0]["savedAt"];

  ASSERT_EQ(run({"history", "restore", id, saved_at}).exit_code, 0);
  EXPECT_EQ(runJson({"view", id})["body"], "first");
  EXPECT_EQ(runJson({"history", id}).size(), 2u);
}

TEST_F(CliTest, MissingNoteExitsWithNotFound) {
  ASSERT_EQ(run({"init"}).exit_code, 0);
  auto result = run({"--json", "view", "01ARZ3NDEKTSV4RRFFQ69G5FAV"});
  EXPECT_EQ(result.exit_code, 2);

  auto error = nlohmann::json::parse(result.out);
  EXPECT_TRUE(error["error"].get<bool>());
  EXPECT_EQ(error["code"], "Not found");
}

TEST_F(CliTest, UnsafeAttachmentExitsWithInvalidPath) {
  std::string id = runJson({"save", "-t", "Target", "-b", "body"})["id"];

  EXPECT_EQ(run({"attach", "add", id, "../../etc/passwd"}).exit_code, 3);
  EXPECT_EQ(run({"attach", "add", id, "/etc/passwd"}).exit_code, 3);
  EXPECT_TRUE(runJson({"view", id})["images"].empty());
}

TEST_F(CliTest, NotebookMoveAndFilter) {
  auto notebook = runJson({"notebook", "create", "Work"});
  std::string notebook_id = notebook["id"];
  std::string filed = runJson({"save", "-t", "Filed", "-b", "x"})["id"];
  runJson({"save", "-t", "Loose", "-b", "y"});

  ASSERT_EQ(run({"notebook", "move", filed, notebook_id}).exit_code, 0);

  auto listed = runJson({"ls", "--notebook", notebook_id});
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0]["id"], filed);
}

TEST_F(CliTest, BackupRoundTripThroughCli) {
  runJson({"save", "-t", "Keep me", "-b", "body"});
  auto backup_dir = temp_dir_.path() / "backup";
  ASSERT_EQ(run({"sync", "export", backup_dir.string()}).exit_code, 0);

  auto other_store = temp_dir_.path() / "other";
  std::swap(store_dir_, other_store);
  ASSERT_EQ(run({"sync", "import", backup_dir.string()}).exit_code, 0);

  auto listed = runJson({"ls"});
  ASSERT_EQ(listed.size(), 1u);
  EXPECT_EQ(listed[0]["title"], "Keep me");
}

TEST_F(CliTest, UnknownCommandFails) {
  auto result = run({"frobnicate"});
  EXPECT_NE(result.exit_code, 0);
}

}  // namespace quire::cli
