#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "quire/store/filesystem_store.hpp"
#include "quire/store/notebook_manager.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace quire::store {

class NotebookManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_ = std::make_unique<FilesystemStore>(temp_dir_.path());
    ASSERT_OK(store_->init());
    notebook_manager_ = std::make_unique<NotebookManager>(*store_);
  }

  void TearDown() override {
    notebook_manager_.reset();
    store_.reset();
  }

  core::NoteId createNote(const std::string& title) {
    auto note = store_->save(std::nullopt, title, "body");
    EXPECT_TRUE(note.has_value());
    return note->id();
  }

  quire::test::TempDirectory temp_dir_;
  std::unique_ptr<FilesystemStore> store_;
  std::unique_ptr<NotebookManager> notebook_manager_;
};

TEST_F(NotebookManagerTest, CreateNotebook) {
  auto result = notebook_manager_->create("  Work  ");
  ASSERT_TRUE(result.has_value()) << "Failed to create notebook: " << result.error().message();
  EXPECT_EQ(result->name, "Work");
  EXPECT_FALSE(result->archived);
  EXPECT_FALSE(result->id.empty());

  auto notebooks = notebook_manager_->list();
  ASSERT_EQ(notebooks.size(), 1u);
  EXPECT_EQ(notebooks.front().id, result->id);
}

TEST_F(NotebookManagerTest, EmptyNameIsRejected) {
  EXPECT_ERROR(notebook_manager_->create("   "), ErrorCode::kValidationFailure);
  EXPECT_TRUE(notebook_manager_->list().empty());
}

TEST_F(NotebookManagerTest, DuplicateNamesAreAllowed) {
  ASSERT_OK(notebook_manager_->create("Inbox"));
  ASSERT_OK(notebook_manager_->create("Inbox"));
  EXPECT_EQ(notebook_manager_->list().size(), 2u);
}

TEST_F(NotebookManagerTest, RenameNotebook) {
  auto created = notebook_manager_->create("Old");
  ASSERT_OK(created);

  auto renamed = notebook_manager_->rename(created->id, "New");
  ASSERT_OK(renamed);
  EXPECT_EQ(renamed->name, "New");
  EXPECT_EQ(notebook_manager_->list().front().name, "New");

  EXPECT_ERROR(notebook_manager_->rename(created->id, ""), ErrorCode::kValidationFailure);
  EXPECT_ERROR(notebook_manager_->rename("missing", "x"), ErrorCode::kNotFound);
  EXPECT_ERROR(notebook_manager_->rename("../evil", "x"), ErrorCode::kInvalidPath);
}

TEST_F(NotebookManagerTest, ArchivedNotebooksListLast) {
  auto first = notebook_manager_->create("First");
  ASSERT_OK(first);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto second = notebook_manager_->create("Second");
  ASSERT_OK(second);

  auto archived = notebook_manager_->archive(first->id);
  ASSERT_OK(archived);
  EXPECT_TRUE(archived->archived);

  auto notebooks = notebook_manager_->list();
  ASSERT_EQ(notebooks.size(), 2u);
  EXPECT_EQ(notebooks[0].id, second->id);
  EXPECT_EQ(notebooks[1].id, first->id);

  ASSERT_OK(notebook_manager_->unarchive(first->id));
  notebooks = notebook_manager_->list();
  EXPECT_EQ(notebooks[0].id, first->id);
}

TEST_F(NotebookManagerTest, MoveNoteBetweenNotebooks) {
  auto notebook = notebook_manager_->create("Projects");
  ASSERT_OK(notebook);
  auto note_id = createNote("Plan");

  auto moved = notebook_manager_->moveNote(note_id, notebook->id);
  ASSERT_OK(moved);
  ASSERT_TRUE(moved->metadata().notebook().has_value());
  EXPECT_EQ(*moved->metadata().notebook(), notebook->id);

  auto unfiled = notebook_manager_->moveNote(note_id, std::nullopt);
  ASSERT_OK(unfiled);
  EXPECT_FALSE(unfiled->metadata().notebook().has_value());
}

TEST_F(NotebookManagerTest, MoveIntoArchivedNotebookIsAllowed) {
  auto notebook = notebook_manager_->create("Old stuff");
  ASSERT_OK(notebook);
  ASSERT_OK(notebook_manager_->archive(notebook->id));
  auto note_id = createNote("Leftover");

  auto moved = notebook_manager_->moveNote(note_id, notebook->id);
  ASSERT_OK(moved);
  EXPECT_EQ(*moved->metadata().notebook(), notebook->id);
}

TEST_F(NotebookManagerTest, MoveRejectsUnknownTargets) {
  auto notebook = notebook_manager_->create("Real");
  ASSERT_OK(notebook);
  auto note_id = createNote("Note");

  EXPECT_ERROR(notebook_manager_->moveNote(note_id, std::string("missing")), ErrorCode::kNotFound);
  EXPECT_ERROR(notebook_manager_->moveNote(core::NoteId::generate(), notebook->id),
               ErrorCode::kNotFound);
}

TEST_F(NotebookManagerTest, NotebooksSurviveReopen) {
  auto notebook = notebook_manager_->create("Persistent");
  ASSERT_OK(notebook);
  notebook_manager_.reset();
  store_.reset();

  FilesystemStore reopened(temp_dir_.path());
  ASSERT_OK(reopened.init());
  NotebookManager manager(reopened);
  auto notebooks = manager.list();
  ASSERT_EQ(notebooks.size(), 1u);
  EXPECT_EQ(notebooks.front().name, "Persistent");
}

}  // namespace quire::store
