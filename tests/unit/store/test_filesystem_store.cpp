#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <thread>
#include <vector>

#include "quire/store/filesystem_store.hpp"
#include "quire/util/time.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace quire::store;
using namespace quire::test;
using quire::ErrorCode;
using quire::core::NoteId;

class FilesystemStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_cwd_ = std::filesystem::current_path();
    std::filesystem::current_path(work_.path());
    store_ = std::make_unique<FilesystemStore>(root_.path());
    ASSERT_OK(store_->init());
  }

  void TearDown() override {
    store_.reset();
    std::filesystem::current_path(previous_cwd_);
  }

  NoteId create(const std::string& title, const std::string& body) {
    auto note = store_->save(std::nullopt, title, body);
    EXPECT_TRUE(note.has_value());
    return note->id();
  }

  // Separates updatedAt stamps of consecutive saves
  static void tick() { std::this_thread::sleep_for(std::chrono::milliseconds(2)); }

  static std::set<NoteId> idsOf(const std::vector<quire::core::Metadata>& notes) {
    std::set<NoteId> ids;
    for (const auto& note : notes) {
      ids.insert(note.id());
    }
    return ids;
  }

  TempDirectory root_;
  TempDirectory work_;
  std::filesystem::path previous_cwd_;
  std::unique_ptr<FilesystemStore> store_;
};

TEST_F(FilesystemStoreTest, InitCreatesLayout) {
  for (const auto& dir : FilesystemStore::dataDirectories()) {
    EXPECT_TRUE(std::filesystem::is_directory(root_.path() / dir)) << dir;
  }
  EXPECT_TRUE(store_->warnings().empty());
}

TEST_F(FilesystemStoreTest, SaveThenReadRoundTrips) {
  std::string body = "Line one\n\n  indented\ttab\nünïcode\n";
  auto id = create("Round trip", body);

  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_EQ(note->title(), "Round trip");
  EXPECT_EQ(note->content(), body);
  EXPECT_EQ(readAll(root_.path() / "notes" / (id.toString() + ".txt")), body);
}

TEST_F(FilesystemStoreTest, EmptyNewNoteIsRejected) {
  EXPECT_ERROR(store_->save(std::nullopt, "  ", "\n"), ErrorCode::kValidationFailure);
  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  EXPECT_TRUE(notes->empty());
}

TEST_F(FilesystemStoreTest, ReadUnknownNoteIsNotFound) {
  EXPECT_ERROR(store_->read(NoteId::generate()), ErrorCode::kNotFound);
  EXPECT_ERROR(store_->updateTitle(NoteId::generate(), "x"), ErrorCode::kNotFound);
  EXPECT_ERROR(store_->toggleStar(NoteId::generate()), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, UnchangedSaveRecordsNoVersion) {
  auto id = create("Title", "Body");
  ASSERT_OK(store_->save(id, "Title", "Body"));

  auto versions = store_->listVersions(id);
  ASSERT_OK(versions);
  EXPECT_TRUE(versions->empty());

  ASSERT_OK(store_->save(id, "Title", "Body v2"));
  versions = store_->listVersions(id);
  ASSERT_OK(versions);
  ASSERT_EQ(versions->size(), 1u);
  EXPECT_EQ(versions->front().title, "Title");
  EXPECT_EQ(versions->front().preview, "Body");
}

TEST_F(FilesystemStoreTest, HistoryKeepsThirtyMostRecentStates) {
  auto id = create("v0", "body 0");
  for (int i = 1; i <= 32; ++i) {
    ASSERT_OK(store_->save(id, "v" + std::to_string(i), "body " + std::to_string(i)));
  }

  auto versions = store_->listVersions(id);
  ASSERT_OK(versions);
  ASSERT_EQ(versions->size(), VersionArchive::kMaxVersions);

  // Newest first: the state before the last save down to v2
  for (size_t i = 0; i < versions->size(); ++i) {
    EXPECT_EQ((*versions)[i].title, "v" + std::to_string(31 - i));
  }
  EXPECT_TRUE(std::is_sorted(versions->begin(), versions->end(),
                             [](const VersionEntry& a, const VersionEntry& b) {
                               return a.saved_at > b.saved_at;
                             }));
}

TEST_F(FilesystemStoreTest, RestoreKeepsCurrentStateInHistory) {
  auto id = create("Draft", "first");
  ASSERT_OK(store_->save(id, "Draft", "second"));

  auto versions = store_->listVersions(id);
  ASSERT_OK(versions);
  ASSERT_EQ(versions->size(), 1u);
  auto saved_at = quire::util::Time::toRfc3339(versions->front().saved_at);

  auto snapshot = store_->getVersion(id, saved_at);
  ASSERT_OK(snapshot);
  EXPECT_EQ(snapshot->body, "first");

  auto restored = store_->restoreVersion(id, saved_at);
  ASSERT_OK(restored);
  EXPECT_EQ(restored->content(), "first");

  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_EQ(note->content(), "first");

  versions = store_->listVersions(id);
  ASSERT_OK(versions);
  ASSERT_EQ(versions->size(), 2u);
  EXPECT_EQ(versions->front().preview, "second");
}

TEST_F(FilesystemStoreTest, UnknownVersionIsNotFound) {
  auto id = create("Draft", "first");
  EXPECT_ERROR(store_->getVersion(id, "2020-01-01T00:00:00.000Z"), ErrorCode::kNotFound);
  EXPECT_ERROR(store_->restoreVersion(id, "2020-01-01T00:00:00.000Z"), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, TitleSlugAndBodyTokensBecomeTags) {
  auto id = create("Project Alpha", "Kickoff #planning and #Q3");
  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().hasTag("project-alpha"));
  EXPECT_TRUE(note->metadata().hasTag("planning"));
  EXPECT_TRUE(note->metadata().hasTag("q3"));
}

TEST_F(FilesystemStoreTest, RemovedTagReturnsWhileBodyStillCarriesIt) {
  auto id = create("Notes", "Agenda #meeting");

  auto removed = store_->removeTag({id}, "meeting");
  ASSERT_OK(removed);
  ASSERT_EQ(removed->size(), 1u);
  EXPECT_FALSE(removed->front().hasTag("meeting"));

  // Title-only edits leave the tag removed
  ASSERT_OK(store_->updateTitle(id, "Notes"));
  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_FALSE(note->metadata().hasTag("meeting"));

  // A body save derives it again
  ASSERT_OK(store_->save(id, "Notes", "Agenda #meeting\nmore"));
  note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().hasTag("meeting"));

  // Dropping the token from the body does not drop the tag
  ASSERT_OK(store_->save(id, "Notes", "Agenda"));
  note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().hasTag("meeting"));
}

TEST_F(FilesystemStoreTest, TagEditsValidateInput) {
  auto id = create("Notes", "body");
  EXPECT_ERROR(store_->addTag({id}, "!!!"), ErrorCode::kValidationFailure);
  EXPECT_ERROR(store_->addTag({NoteId::generate()}, "ok"), ErrorCode::kNotFound);

  auto added = store_->addTag({id}, "#Work-Items");
  ASSERT_OK(added);
  EXPECT_TRUE(added->front().hasTag("work-items"));

  auto tags = store_->listTags();
  ASSERT_OK(tags);
  auto found = std::find_if(tags->begin(), tags->end(),
                            [](const TagCount& t) { return t.tag == "work-items"; });
  ASSERT_NE(found, tags->end());
  EXPECT_EQ(found->count, 1u);
}

TEST_F(FilesystemStoreTest, BacklinksFollowTitleReferences) {
  auto target = create("Roadmap", "plans");
  auto a = create("Standup", "See [[Roadmap]] for context");
  auto b = create("Retro", "Compare with [[roadmap]]");
  create("Unrelated", "[[Nothing here]]");

  auto backlinks = store_->getBacklinks(target);
  ASSERT_OK(backlinks);
  EXPECT_EQ(idsOf(*backlinks), (std::set<NoteId>{a, b}));

  EXPECT_ERROR(store_->getBacklinks(NoteId::generate()), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, LinkToLaterNoteResolvesWhenTargetAppears) {
  auto source = create("Index", "Next: [[Later]]");
  auto later = create("Later", "arrives after");

  auto backlinks = store_->getBacklinks(later);
  ASSERT_OK(backlinks);
  EXPECT_EQ(idsOf(*backlinks), (std::set<NoteId>{source}));
}

TEST_F(FilesystemStoreTest, TagAndStarFiltersAreConjunctive) {
  auto starred_meeting = create("One", "#meeting");
  auto plain_meeting = create("Two", "#meeting");
  auto starred_other = create("Three", "#other");
  auto plain_other = create("Four", "nothing");
  auto starred_both = create("Five", "#meeting #other");

  ASSERT_OK(store_->setStarred({starred_meeting, starred_other, starred_both}, true));

  auto results = store_->search("tag:meeting is:starred");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{starred_meeting, starred_both}));

  results = store_->search("tag:meeting tag:other");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{starred_both}));

  (void)plain_meeting;
  (void)plain_other;
}

TEST_F(FilesystemStoreTest, ChecklistScenario) {
  std::string body = "Meeting notes #meeting\n- [ ] send invite\n- [x] book room";
  auto id = create("Sync", body);

  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().hasTag("meeting"));

  auto results = store_->search("has:tasks");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{id}));

  results = store_->search("is:completed");
  ASSERT_OK(results);
  EXPECT_TRUE(results->empty());

  results = store_->search("is:uncompleted");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{id}));

  ASSERT_OK(store_->save(id, "Sync", "Meeting notes #meeting\n- [x] send invite\n- [x] book room"));

  results = store_->search("is:completed");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{id}));
}

TEST_F(FilesystemStoreTest, FreeTextSearchMatchesTitleOrBody) {
  auto a = create("Quarterly Review", "numbers");
  auto b = create("Misc", "the quarterly plan");
  create("Other", "nothing");

  auto results = store_->search("QUARTERLY");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{a, b}));

  results = store_->search("\"quarterly plan\"");
  ASSERT_OK(results);
  EXPECT_EQ(idsOf(*results), (std::set<NoteId>{b}));
}

TEST_F(FilesystemStoreTest, ListIsNewestFirst) {
  auto first = create("First", "a");
  tick();
  auto second = create("Second", "b");
  tick();
  ASSERT_OK(store_->save(first, "First", "a changed"));

  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  ASSERT_EQ(notes->size(), 2u);
  EXPECT_EQ(notes->front().id(), first);
  EXPECT_EQ(notes->back().id(), second);
}

TEST_F(FilesystemStoreTest, StarToggleAndBulkSet) {
  auto id = create("Star me", "body");
  auto toggled = store_->toggleStar(id);
  ASSERT_OK(toggled);
  EXPECT_TRUE(toggled->metadata().important());

  toggled = store_->toggleStar(id);
  ASSERT_OK(toggled);
  EXPECT_FALSE(toggled->metadata().important());

  EXPECT_ERROR(store_->setStarred({id, NoteId::generate()}, true), ErrorCode::kNotFound);
  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_FALSE(note->metadata().important());
}

TEST_F(FilesystemStoreTest, RemoveDeletesEverything) {
  auto id = create("Doomed", "v1");
  ASSERT_OK(store_->save(id, "Doomed", "v2"));
  work_.createFile("pic.png", "png");
  ASSERT_OK(store_->attach(id, {"pic.png"}));

  ASSERT_OK(store_->remove(id));
  EXPECT_ERROR(store_->read(id), ErrorCode::kNotFound);
  EXPECT_FALSE(std::filesystem::exists(root_.path() / "notes" / (id.toString() + ".txt")));
  EXPECT_FALSE(std::filesystem::exists(root_.path() / "versions" / id.toString()));
  EXPECT_FALSE(std::filesystem::exists(root_.path() / "images" / id.toString()));

  EXPECT_ERROR(store_->remove(id), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, RemoveManyIsAllOrNothing) {
  auto a = create("A", "a");
  auto b = create("B", "b");

  EXPECT_ERROR(store_->removeMany({a, NoteId::generate()}), ErrorCode::kNotFound);
  EXPECT_OK(store_->read(a));

  ASSERT_OK(store_->removeMany({a, b}));
  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  EXPECT_TRUE(notes->empty());
}

TEST_F(FilesystemStoreTest, DuplicateCopiesContentAndAttachments) {
  auto id = create("Source", "Body #tagged");
  work_.createFile("pic.png", "png");
  ASSERT_OK(store_->attach(id, {"pic.png"}));

  auto copy = store_->duplicate(id);
  ASSERT_OK(copy);
  EXPECT_NE(copy->id(), id);
  EXPECT_EQ(copy->title(), "Source (copy)");
  EXPECT_EQ(copy->content(), "Body #tagged");
  EXPECT_TRUE(copy->metadata().hasTag("tagged"));
  ASSERT_EQ(copy->metadata().images().size(), 1u);

  const auto& image = copy->metadata().images().front();
  EXPECT_EQ(image.path.rfind("images/" + copy->id().toString() + "/", 0), 0u);
  auto resolved = store_->resolveAttachment(image.path);
  ASSERT_OK(resolved);
  EXPECT_EQ(readAll(*resolved), "png");
}

TEST_F(FilesystemStoreTest, MergeCombinesIntoFirstNote) {
  auto a = create("Alpha", "first body");
  tick();
  auto b = create("Beta", "second body");

  EXPECT_ERROR(store_->merge({a}), ErrorCode::kValidationFailure);
  EXPECT_ERROR(store_->merge({a, a}), ErrorCode::kValidationFailure);

  auto merged = store_->merge({a, b});
  ASSERT_OK(merged);
  EXPECT_EQ(merged->id(), a);
  EXPECT_EQ(merged->title(), "Alpha");
  EXPECT_EQ(merged->content(), "## Alpha\n\nfirst body\n\n## Beta\n\nsecond body");
  EXPECT_ERROR(store_->read(b), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, DailyNoteIsCreatedOnce) {
  auto first = store_->getOrCreateDaily();
  ASSERT_OK(first);
  EXPECT_TRUE(first->metadata().isDaily());
  EXPECT_TRUE(first->metadata().hasTag("daily"));
  EXPECT_EQ(first->title(), quire::util::Time::localDate(std::chrono::system_clock::now()));

  auto second = store_->getOrCreateDaily();
  ASSERT_OK(second);
  EXPECT_EQ(second->id(), first->id());

  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  EXPECT_EQ(notes->size(), 1u);
}

TEST_F(FilesystemStoreTest, AttachmentLifecycle) {
  auto id = create("With files", "body");
  work_.createFile("docs/report.pdf", "pdf-bytes");

  auto attached = store_->attach(id, {"docs/report.pdf"});
  ASSERT_OK(attached);
  ASSERT_EQ(attached->metadata().images().size(), 1u);
  auto path = attached->metadata().images().front().path;

  auto renamed = store_->renameAttachment(id, path, "final.pdf");
  ASSERT_OK(renamed);
  ASSERT_EQ(renamed->metadata().images().size(), 1u);
  EXPECT_EQ(renamed->metadata().images().front().name, "final.pdf");
  path = renamed->metadata().images().front().path;

  auto pasted = store_->attachFromData(id, "clip", "clipboard.txt");
  ASSERT_OK(pasted);
  EXPECT_EQ(pasted->metadata().images().size(), 2u);

  auto removed = store_->removeAttachment(id, path);
  ASSERT_OK(removed);
  EXPECT_EQ(removed->metadata().images().size(), 1u);
  EXPECT_ERROR(store_->renameAttachment(id, path, "again.pdf"), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, RemovingUnlistedAttachmentIsNotFound) {
  auto id = create("With files", "body");
  auto pasted = store_->attachFromData(id, "clip", "clip.txt");
  ASSERT_OK(pasted);
  auto path = pasted->metadata().images().front().path;

  auto stray = "images/" + id.toString() + "/stray.txt";
  root_.createFile(stray, "not tracked");
  EXPECT_ERROR(store_->removeAttachment(id, stray), ErrorCode::kNotFound);
  EXPECT_TRUE(std::filesystem::exists(root_.path() / stray));

  ASSERT_OK(store_->removeAttachment(id, path));
  EXPECT_ERROR(store_->removeAttachment(id, path), ErrorCode::kNotFound);
}

TEST_F(FilesystemStoreTest, AttachRejectsUnsafePaths) {
  auto id = create("Target", "body");
  work_.createFile("ok.txt", "ok");

  EXPECT_ERROR(store_->attach(id, {"../../etc/passwd"}), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->attach(id, {"/etc/passwd"}), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->attach(id, {std::string("ok\0.txt", 7)}), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->attach(id, {}), ErrorCode::kInvalidArgument);

  // A bad source anywhere in the list attaches nothing
  EXPECT_ERROR(store_->attach(id, {"ok.txt", "/etc/passwd"}), ErrorCode::kInvalidPath);
  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().images().empty());
}

TEST_F(FilesystemStoreTest, RenameRejectsUnsafeNames) {
  auto id = create("Target", "body");
  work_.createFile("ok.txt", "ok");
  auto attached = store_->attach(id, {"ok.txt"});
  ASSERT_OK(attached);
  auto path = attached->metadata().images().front().path;

  EXPECT_ERROR(store_->renameAttachment(id, path, "../../etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->renameAttachment(id, path, "/etc/passwd"), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->renameAttachment(id, path, std::string("a\0b", 3)), ErrorCode::kInvalidPath);
  EXPECT_ERROR(store_->resolveAttachment("../outside.txt"), ErrorCode::kInvalidPath);
}

TEST_F(FilesystemStoreTest, CorruptIndexIsMovedAside) {
  create("Keep", "body");
  store_.reset();

  root_.createFile("meta/index.json", "{ not json");

  FilesystemStore reopened(root_.path());
  ASSERT_OK(reopened.init());
  EXPECT_EQ(reopened.warnings().size(), 1u);

  auto notes = reopened.listNotes();
  ASSERT_OK(notes);
  EXPECT_TRUE(notes->empty());

  bool found_aside = false;
  for (const auto& entry : std::filesystem::directory_iterator(root_.path() / "meta")) {
    if (entry.path().filename().string().rfind("index.json.corrupt-", 0) == 0) {
      found_aside = true;
    }
  }
  EXPECT_TRUE(found_aside);
}

TEST_F(FilesystemStoreTest, ReopenedStoreSeesSavedNotes) {
  auto id = create("Persisted", "body #kept");
  store_.reset();

  FilesystemStore reopened(root_.path());
  ASSERT_OK(reopened.init());
  auto note = reopened.read(id);
  ASSERT_OK(note);
  EXPECT_EQ(note->content(), "body #kept");
  EXPECT_TRUE(note->metadata().hasTag("kept"));
}

TEST_F(FilesystemStoreTest, ConcurrentSavesOfDistinctNotesAllPersist) {
  constexpr int kThreads = 8;
  constexpr int kNotesPerThread = 5;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int n = 0; n < kNotesPerThread; ++n) {
        auto label = "t" + std::to_string(t) + "n" + std::to_string(n);
        auto note = store_->save(std::nullopt, "Note " + label, "body " + label);
        if (!note.has_value() || !store_->save(note->id(), "Note " + label, "edited " + label)) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);

  store_ = std::make_unique<FilesystemStore>(root_.path());
  ASSERT_OK(store_->init());
  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  ASSERT_EQ(notes->size(), static_cast<size_t>(kThreads * kNotesPerThread));
  for (const auto& meta : *notes) {
    auto note = store_->read(meta.id());
    ASSERT_OK(note);
    EXPECT_EQ(note->content(), "edited " + meta.title().substr(5));
  }
}

TEST_F(FilesystemStoreTest, ConcurrentTagAndStarEditsOnOneNoteKeepBoth) {
  auto id = create("Shared", "body");
  constexpr int kEdits = 25;
  std::atomic<int> failures{0};

  std::thread tagger([&] {
    for (int i = 0; i < kEdits; ++i) {
      if (!store_->addTag({id}, "tag-" + std::to_string(i))) {
        ++failures;
      }
    }
  });
  // An odd number of toggles leaves the note starred
  std::thread starrer([&] {
    for (int i = 0; i < kEdits; ++i) {
      if (!store_->toggleStar(id)) {
        ++failures;
      }
    }
  });
  tagger.join();
  starrer.join();
  EXPECT_EQ(failures.load(), 0);

  store_ = std::make_unique<FilesystemStore>(root_.path());
  ASSERT_OK(store_->init());
  auto note = store_->read(id);
  ASSERT_OK(note);
  EXPECT_TRUE(note->metadata().important());
  const auto& tags = note->metadata().tags();
  for (int i = 0; i < kEdits; ++i) {
    auto tag = "tag-" + std::to_string(i);
    EXPECT_NE(std::find(tags.begin(), tags.end(), tag), tags.end()) << tag;
  }
}

TEST_F(FilesystemStoreTest, ConcurrentDailyCallsCreateOneNote) {
  constexpr int kThreads = 8;
  std::vector<std::optional<NoteId>> ids(kThreads);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto daily = store_->getOrCreateDaily();
      if (daily.has_value()) {
        ids[t] = daily->id();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& id : ids) {
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, *ids.front());
  }

  store_ = std::make_unique<FilesystemStore>(root_.path());
  ASSERT_OK(store_->init());
  auto notes = store_->listNotes();
  ASSERT_OK(notes);
  auto dailies = std::count_if(notes->begin(), notes->end(),
                               [](const auto& meta) { return meta.isDaily(); });
  EXPECT_EQ(dailies, 1);
}

TEST_F(FilesystemStoreTest, DeletedNotesReleaseTheirLockSlots) {
  auto a = create("A", "a");
  auto b = create("B", "b");
  auto c = create("C", "c");
  auto d = create("D", "d");
  ASSERT_OK(store_->toggleStar(a));
  EXPECT_EQ(store_->noteLockCount(), 4u);

  ASSERT_OK(store_->removeMany({a, b}));
  EXPECT_EQ(store_->noteLockCount(), 2u);

  ASSERT_OK(store_->merge({c, d}));
  EXPECT_EQ(store_->noteLockCount(), 1u);

  ASSERT_OK(store_->getOrCreateDaily());
  ASSERT_OK(store_->getOrCreateDaily());
  EXPECT_EQ(store_->noteLockCount(), 2u);
}
