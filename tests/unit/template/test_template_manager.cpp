#include <gtest/gtest.h>

#include "quire/store/filesystem_store.hpp"
#include "quire/template/template_manager.hpp"
#include "quire/util/time.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace quire::template_system;
using namespace quire::test;
using quire::ErrorCode;

class TemplateManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<quire::store::FilesystemStore>(temp_dir_.path());
    ASSERT_OK(store_->init());
    manager_ = std::make_unique<TemplateManager>(*store_);
  }

  TempDirectory temp_dir_;
  std::unique_ptr<quire::store::FilesystemStore> store_;
  std::unique_ptr<TemplateManager> manager_;
};

TEST_F(TemplateManagerTest, BuiltinsAreListedFirst) {
  auto templates = manager_->list();
  ASSERT_EQ(templates.size(), TemplateManager::builtins().size());
  EXPECT_EQ(templates[0].id, "daily-journal");
  EXPECT_EQ(templates[1].id, "meeting-notes");
  EXPECT_EQ(templates[2].id, "project-planning");
  for (const auto& tmpl : templates) {
    EXPECT_FALSE(tmpl.is_custom);
  }
}

TEST_F(TemplateManagerTest, SubstituteReplacesEveryOccurrence) {
  EXPECT_EQ(TemplateManager::substitute("{{x}} and {{x}}", "x", "y"), "y and y");
  EXPECT_EQ(TemplateManager::substitute("{{x}}", "x", "{{x}}"), "{{x}}");
  EXPECT_EQ(TemplateManager::substitute("none", "x", "y"), "none");
}

TEST_F(TemplateManagerTest, RenderUsesDefaultPatternAndDate) {
  auto now = std::chrono::system_clock::now();
  auto date = quire::util::Time::localDate(now);
  auto tmpl = manager_->get("meeting-notes");
  ASSERT_OK(tmpl);

  auto [title, body] = TemplateManager::render(*tmpl, std::nullopt, now);
  EXPECT_EQ(title, "Meeting " + date);
  EXPECT_NE(body.find("# Meeting: Meeting " + date), std::string::npos);
  EXPECT_NE(body.find("**Date:** " + date), std::string::npos);
  EXPECT_EQ(body.find("{{"), std::string::npos);
}

TEST_F(TemplateManagerTest, RenderPrefersExplicitTitle) {
  auto tmpl = manager_->get("project-planning");
  ASSERT_OK(tmpl);

  auto [title, body] = TemplateManager::render(*tmpl, std::string("  Apollo  "),
                                               std::chrono::system_clock::now());
  EXPECT_EQ(title, "Apollo");
  EXPECT_EQ(body.rfind("# Project: Apollo\n", 0), 0u);

  quire::core::NoteTemplate bare;
  bare.body = "{{title}}";
  auto rendered = TemplateManager::render(bare, std::nullopt, std::chrono::system_clock::now());
  EXPECT_EQ(rendered.first, "Untitled");
  EXPECT_EQ(rendered.second, "Untitled");
}

TEST_F(TemplateManagerTest, CustomTemplateLifecycle) {
  auto saved = manager_->saveCustom("  Standup ", "Yesterday:\nToday:\n");
  ASSERT_OK(saved);
  EXPECT_TRUE(saved->is_custom);
  EXPECT_EQ(saved->name, "Standup");
  EXPECT_EQ(saved->id.rfind("custom-", 0), 0u);
  ASSERT_TRUE(saved->default_title_pattern.has_value());
  EXPECT_EQ(*saved->default_title_pattern, "Standup");

  auto templates = manager_->list();
  ASSERT_EQ(templates.size(), TemplateManager::builtins().size() + 1);
  EXPECT_EQ(templates.back().id, saved->id);

  ASSERT_OK(manager_->deleteCustom(saved->id));
  EXPECT_ERROR(manager_->get(saved->id), ErrorCode::kNotFound);
  EXPECT_ERROR(manager_->deleteCustom(saved->id), ErrorCode::kNotFound);
}

TEST_F(TemplateManagerTest, CustomTemplateNeedsName) {
  EXPECT_ERROR(manager_->saveCustom("   ", "body"), ErrorCode::kValidationFailure);
}

TEST_F(TemplateManagerTest, BuiltinsCannotBeDeleted) {
  EXPECT_ERROR(manager_->deleteCustom("daily-journal"), ErrorCode::kValidationFailure);
  EXPECT_OK(manager_->get("daily-journal"));
}

TEST_F(TemplateManagerTest, CreateNoteGoesThroughStore) {
  auto note = manager_->createNote("meeting-notes", std::string("Design review"));
  ASSERT_OK(note);
  EXPECT_EQ(note->title(), "Design review");
  EXPECT_TRUE(note->metadata().hasTag("design-review"));

  auto stored = store_->read(note->id());
  ASSERT_OK(stored);
  EXPECT_EQ(stored->content(), note->content());

  auto tasks = store_->search("has:tasks");
  ASSERT_OK(tasks);
  EXPECT_EQ(tasks->size(), 1u);

  EXPECT_ERROR(manager_->createNote("missing"), ErrorCode::kNotFound);
}

TEST_F(TemplateManagerTest, CustomTemplatesSurviveReopen) {
  auto saved = manager_->saveCustom("Weekly", "{{date}}");
  ASSERT_OK(saved);
  manager_.reset();
  store_.reset();

  quire::store::FilesystemStore reopened(temp_dir_.path());
  ASSERT_OK(reopened.init());
  TemplateManager manager(reopened);
  auto tmpl = manager.get(saved->id);
  ASSERT_OK(tmpl);
  EXPECT_EQ(tmpl->body, "{{date}}");
}
