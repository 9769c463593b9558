#include "quire/store/filesystem_store.hpp"

#include <algorithm>
#include <map>
#include <set>

#include <spdlog/spdlog.h>

#include "quire/core/link_resolver.hpp"
#include "quire/index/query_parser.hpp"
#include "quire/index/search_engine.hpp"
#include "quire/util/filesystem.hpp"
#include "quire/util/path_sanitizer.hpp"
#include "quire/util/time.hpp"

namespace quire::store {

namespace {

std::string trim(std::string_view text) {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(start, end - start + 1));
}

Error noteNotFound(const core::NoteId& id) {
  return makeError(ErrorCode::kNotFound, "Note not found: " + id.toString());
}

std::vector<std::string> unionTags(std::vector<std::string> tags,
                                   const std::vector<std::string>& more) {
  tags.insert(tags.end(), more.begin(), more.end());
  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
  return tags;
}

// Order of first appearance, duplicates dropped
std::vector<core::NoteId> distinctIds(const std::vector<core::NoteId>& ids) {
  std::vector<core::NoteId> result;
  std::set<core::NoteId> seen;
  for (const auto& id : ids) {
    if (seen.insert(id).second) {
      result.push_back(id);
    }
  }
  return result;
}

void sortByUpdated(std::vector<core::Metadata>& notes) {
  std::sort(notes.begin(), notes.end(), [](const core::Metadata& a, const core::Metadata& b) {
    if (a.updated() != b.updated()) {
      return a.updated() > b.updated();
    }
    return a.id() < b.id();
  });
}

Result<std::string> normalizedTag(const std::string& raw) {
  auto tag = core::LinkResolver::normalizeTag(raw);
  if (!core::LinkResolver::isValidTag(tag)) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Invalid tag '" + raw + "': use letters, digits, '-' or '_'"));
  }
  return tag;
}

}  // namespace

FilesystemStore::FilesystemStore(std::filesystem::path root, StoreOptions options)
    : root_(std::move(root)),
      options_(options),
      index_(root_ / "meta" / "index.json"),
      content_(root_ / "notes"),
      versions_(root_ / "versions", options_.preview_length),
      attachments_(root_, options_.max_attachment_bytes) {}

const std::vector<std::string>& FilesystemStore::dataDirectories() {
  static const std::vector<std::string> kDirectories = {"notes", "versions", "meta", "images"};
  return kDirectories;
}

std::shared_lock<std::shared_mutex> FilesystemStore::lockShared() const {
  return std::shared_lock(store_mutex_);
}

std::unique_lock<std::shared_mutex> FilesystemStore::lockExclusive() {
  return std::unique_lock(store_mutex_);
}

Result<void> FilesystemStore::init() {
  std::unique_lock lock(store_mutex_);
  auto layout = ensureLayout();
  if (!layout.has_value()) {
    return layout;
  }
  return loadIndex();
}

Result<void> FilesystemStore::reload() {
  return loadIndex();
}

Result<void> FilesystemStore::ensureLayout() {
  for (const auto& dir : dataDirectories()) {
    auto created = util::FileSystem::createDirectories(root_ / dir);
    if (!created.has_value()) {
      return created;
    }
  }
  return {};
}

Result<void> FilesystemStore::loadIndex() {
  auto loaded = index_.load();
  if (loaded.has_value() || loaded.error().code() != ErrorCode::kIndexCorrupt) {
    return loaded;
  }

  // Move the unreadable index aside and continue with an empty one
  auto stamp = util::Time::toRfc3339(util::Time::now());
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  auto aside = index_.path();
  aside += ".corrupt-" + stamp;

  auto moved = util::FileSystem::moveFile(index_.path(), aside);
  if (!moved.has_value()) {
    return std::unexpected(makeError(ErrorCode::kIndexCorrupt,
                                     loaded.error().message() + "; moving it aside failed: " +
                                     moved.error().message()));
  }

  std::string warning = "Index was unreadable (" + loaded.error().message() + "); moved to " +
                        aside.filename().string() + " and started empty";
  spdlog::warn("{}", warning);
  warnings_.push_back(std::move(warning));
  return index_.load();
}

std::shared_ptr<std::mutex> FilesystemStore::noteMutex(const core::NoteId& id) {
  std::lock_guard guard(note_table_mutex_);
  auto& slot = note_mutexes_[id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

FilesystemStore::NoteLocks FilesystemStore::lockNotes(std::vector<core::NoteId> ids) {
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  NoteLocks locks;
  locks.reserve(ids.size());
  for (const auto& id : ids) {
    auto mutex = noteMutex(id);
    locks.push_back(NoteLock{mutex, std::unique_lock<std::mutex>(*mutex)});
  }
  return locks;
}

void FilesystemStore::releaseNoteMutex(const core::NoteId& id) {
  std::lock_guard guard(note_table_mutex_);
  note_mutexes_.erase(id);
}

size_t FilesystemStore::noteLockCount() const {
  std::lock_guard guard(note_table_mutex_);
  return note_mutexes_.size();
}

Result<std::string> FilesystemStore::readBody(const core::NoteId& id) const {
  auto body = content_.read(id);
  if (!body.has_value() && body.error().code() == ErrorCode::kNotFound) {
    spdlog::warn("Content file of note {} is missing, treating body as empty", id.toString());
    return std::string{};
  }
  return body;
}

Result<core::Note> FilesystemStore::assemble(const core::Metadata& metadata) const {
  auto body = readBody(metadata.id());
  if (!body.has_value()) {
    return std::unexpected(body.error());
  }
  return core::Note(metadata, std::move(*body));
}

void FilesystemStore::purgeFiles(const core::NoteId& id) {
  auto content = content_.remove(id);
  if (!content.has_value()) {
    spdlog::warn("Content of deleted note {} left behind: {}", id.toString(),
                 content.error().message());
  }
  auto images = attachments_.removeAll(id);
  if (!images.has_value()) {
    spdlog::warn("Attachments of deleted note {} left behind: {}", id.toString(),
                 images.error().message());
  }
  auto history = versions_.removeAll(id);
  if (!history.has_value()) {
    spdlog::warn("History of deleted note {} left behind: {}", id.toString(),
                 history.error().message());
  }
  releaseNoteMutex(id);
}

Result<std::vector<core::Metadata>> FilesystemStore::listNotes() const {
  std::shared_lock lock(store_mutex_);
  auto notes = index_.listNotes();
  sortByUpdated(notes);
  return notes;
}

Result<core::Note> FilesystemStore::read(const core::NoteId& id) const {
  std::shared_lock lock(store_mutex_);
  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  return assemble(*metadata);
}

Result<core::Note> FilesystemStore::save(const std::optional<core::NoteId>& id,
                                         const std::string& title, const std::string& body) {
  std::shared_lock lock(store_mutex_);
  return saveUnlocked(id, title, body);
}

Result<core::Note> FilesystemStore::saveUnlocked(const std::optional<core::NoteId>& requested,
                                                 const std::string& title,
                                                 const std::optional<std::string>& new_body) {
  core::NoteId id = requested.has_value() ? *requested : core::NoteId::generate();
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto existing = index_.get(id);
  bool creating = !existing.has_value();
  if (creating && existing.error().code() != ErrorCode::kNotFound) {
    return std::unexpected(existing.error());
  }

  std::string previous_body;
  if (!creating) {
    auto stored = readBody(id);
    if (!stored.has_value()) {
      return std::unexpected(stored.error());
    }
    previous_body = std::move(*stored);
  } else if (!new_body.has_value()) {
    return std::unexpected(noteNotFound(id));
  }

  const std::string& body = new_body.has_value() ? *new_body : previous_body;

  if (creating && trim(title).empty() && trim(body).empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "A new note needs a title or a body"));
  }

  if (!creating) {
    if (existing->title() == title && previous_body == body) {
      return core::Note(*existing, body);
    }
    // The pre-save state becomes history, stamped with its own updatedAt
    auto recorded = versions_.recordSnapshot(id, existing->title(), previous_body,
                                             existing->updated());
    if (!recorded.has_value()) {
      return std::unexpected(recorded.error());
    }
  }

  bool body_changed = creating || body != previous_body;
  if (body_changed) {
    auto written = content_.write(id, body);
    if (!written.has_value()) {
      return std::unexpected(written.error());
    }
  }

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    auto* record = data.findNote(id);
    if (record == nullptr) {
      data.notes.emplace_back(id, title);
      record = &data.notes.back();
    } else if (record->title() != title) {
      record->setTitle(title);
    }
    record->setTags(unionTags(record->tags(),
                              core::LinkResolver::derivedTags(title, body, record->isDaily())));
    record->setLinkTitles(core::LinkResolver::extractLinkTitles(body));
    record->touch();

    core::LinkResolver::relinkAll(data.notes);
    return *data.findNote(id);
  });

  if (!updated.has_value()) {
    if (creating) {
      auto removed = content_.remove(id);
      if (!removed.has_value()) {
        spdlog::error("Rollback of note {} failed: {}", id.toString(), removed.error().message());
      }
    } else if (body_changed) {
      auto restored = content_.write(id, previous_body);
      if (!restored.has_value()) {
        spdlog::error("Rollback of note {} failed: {}", id.toString(), restored.error().message());
      }
    }
    return std::unexpected(updated.error());
  }

  spdlog::debug("{} note {}", creating ? "Created" : "Saved", id.toString());
  return core::Note(*updated, body);
}

Result<core::Note> FilesystemStore::updateTitle(const core::NoteId& id, const std::string& title) {
  std::shared_lock lock(store_mutex_);
  return saveUnlocked(id, title, std::nullopt);
}

Result<core::Note> FilesystemStore::toggleStar(const core::NoteId& id) {
  std::shared_lock lock(store_mutex_);
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    auto* record = data.findNote(id);
    if (record == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    record->setImportant(!record->important());
    return *record;
  });
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }
  return assemble(*updated);
}

Result<std::vector<core::Metadata>> FilesystemStore::setStarred(
    const std::vector<core::NoteId>& ids, bool starred) {
  auto targets = distinctIds(ids);
  std::shared_lock lock(store_mutex_);
  auto note_locks = lockNotes(targets);

  return index_.update([&](IndexData& data) -> Result<std::vector<core::Metadata>> {
    std::vector<core::Metadata> changed;
    for (const auto& id : targets) {
      auto* record = data.findNote(id);
      if (record == nullptr) {
        return std::unexpected(noteNotFound(id));
      }
      if (record->important() != starred) {
        record->setImportant(starred);
      }
      changed.push_back(*record);
    }
    return changed;
  });
}

Result<std::vector<TagCount>> FilesystemStore::listTags() const {
  std::shared_lock lock(store_mutex_);
  std::map<std::string, size_t> counts;
  for (const auto& note : index_.listNotes()) {
    for (const auto& tag : note.tags()) {
      ++counts[tag];
    }
  }

  std::vector<TagCount> tags;
  tags.reserve(counts.size());
  for (const auto& [tag, count] : counts) {
    tags.push_back(TagCount{tag, count});
  }
  return tags;
}

Result<std::vector<core::Metadata>> FilesystemStore::addTag(const std::vector<core::NoteId>& ids,
                                                            const std::string& tag) {
  auto normalized = normalizedTag(tag);
  if (!normalized.has_value()) {
    return std::unexpected(normalized.error());
  }
  auto targets = distinctIds(ids);
  std::shared_lock lock(store_mutex_);
  auto note_locks = lockNotes(targets);

  return index_.update([&](IndexData& data) -> Result<std::vector<core::Metadata>> {
    std::vector<core::Metadata> changed;
    for (const auto& id : targets) {
      auto* record = data.findNote(id);
      if (record == nullptr) {
        return std::unexpected(noteNotFound(id));
      }
      record->addTag(*normalized);
      changed.push_back(*record);
    }
    return changed;
  });
}

Result<std::vector<core::Metadata>> FilesystemStore::removeTag(
    const std::vector<core::NoteId>& ids, const std::string& tag) {
  auto normalized = normalizedTag(tag);
  if (!normalized.has_value()) {
    return std::unexpected(normalized.error());
  }
  auto targets = distinctIds(ids);
  std::shared_lock lock(store_mutex_);
  auto note_locks = lockNotes(targets);

  return index_.update([&](IndexData& data) -> Result<std::vector<core::Metadata>> {
    std::vector<core::Metadata> changed;
    for (const auto& id : targets) {
      auto* record = data.findNote(id);
      if (record == nullptr) {
        return std::unexpected(noteNotFound(id));
      }
      record->removeTag(*normalized);
      changed.push_back(*record);
    }
    return changed;
  });
}

Result<void> FilesystemStore::remove(const core::NoteId& id) {
  return removeMany({id});
}

Result<void> FilesystemStore::removeMany(const std::vector<core::NoteId>& ids) {
  auto targets = distinctIds(ids);
  if (targets.empty()) {
    return {};
  }
  std::shared_lock lock(store_mutex_);
  auto note_locks = lockNotes(targets);

  auto removed = index_.update([&](IndexData& data) -> Result<void> {
    for (const auto& id : targets) {
      if (data.findNote(id) == nullptr) {
        return std::unexpected(noteNotFound(id));
      }
    }
    std::set<core::NoteId> doomed(targets.begin(), targets.end());
    std::erase_if(data.notes, [&](const core::Metadata& note) { return doomed.contains(note.id()); });
    core::LinkResolver::relinkAll(data.notes);
    return {};
  });
  if (!removed.has_value()) {
    return removed;
  }

  for (const auto& id : targets) {
    purgeFiles(id);
    spdlog::debug("Deleted note {}", id.toString());
  }
  return {};
}

Result<core::Note> FilesystemStore::duplicate(const core::NoteId& id) {
  std::shared_lock lock(store_mutex_);
  auto copy_id = core::NoteId::generate();
  auto note_locks = lockNotes({id, copy_id});

  auto source = index_.get(id);
  if (!source.has_value()) {
    return std::unexpected(source.error());
  }
  auto body = readBody(id);
  if (!body.has_value()) {
    return std::unexpected(body.error());
  }

  auto images = attachments_.copyAll(id, copy_id, source->images());
  if (!images.has_value()) {
    return std::unexpected(images.error());
  }
  auto written = content_.write(copy_id, *body);
  if (!written.has_value()) {
    purgeFiles(copy_id);
    return std::unexpected(written.error());
  }

  auto created = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    const auto* original = data.findNote(id);
    if (original == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    core::Metadata copy(copy_id, original->title() + " (copy)");
    copy.setTags(original->tags());
    copy.setNotebook(original->notebook());
    copy.setImages(*images);
    copy.setLinkTitles(original->linkTitles());
    data.notes.push_back(std::move(copy));
    core::LinkResolver::relinkAll(data.notes);
    return *data.findNote(copy_id);
  });
  if (!created.has_value()) {
    purgeFiles(copy_id);
    return std::unexpected(created.error());
  }

  spdlog::debug("Duplicated note {} as {}", id.toString(), copy_id.toString());
  return core::Note(*created, std::move(*body));
}

Result<core::Note> FilesystemStore::merge(const std::vector<core::NoteId>& ids) {
  auto targets = distinctIds(ids);
  if (targets.size() < 2) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Merging needs at least two distinct notes"));
  }

  std::shared_lock lock(store_mutex_);
  auto note_locks = lockNotes(targets);

  std::vector<std::pair<core::Metadata, std::string>> parts;
  for (const auto& id : targets) {
    auto metadata = index_.get(id);
    if (!metadata.has_value()) {
      return std::unexpected(metadata.error());
    }
    auto body = readBody(id);
    if (!body.has_value()) {
      return std::unexpected(body.error());
    }
    parts.emplace_back(std::move(*metadata), std::move(*body));
  }

  const core::NoteId& keep = targets.front();
  const core::Metadata keep_before = parts.front().first;
  const std::string keep_body_before = parts.front().second;

  auto ordered = parts;
  std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
    if (a.first.updated() != b.first.updated()) {
      return a.first.updated() < b.first.updated();
    }
    return a.first.id() < b.first.id();
  });

  std::string title = ordered.front().first.title();
  std::string merged;
  for (const auto& [metadata, body] : ordered) {
    merged += "## " + metadata.title() + "\n\n" + body + "\n\n";
  }
  merged = trim(merged);

  auto recorded = versions_.recordSnapshot(keep, keep_before.title(), keep_body_before,
                                           keep_before.updated());
  if (!recorded.has_value()) {
    return std::unexpected(recorded.error());
  }

  std::vector<core::ImageRef> copied;
  auto rollback_copies = [&]() {
    for (const auto& ref : copied) {
      auto removed = attachments_.removeFile(keep, ref.path);
      if (!removed.has_value()) {
        spdlog::error("Rollback of {} failed: {}", ref.path, removed.error().message());
      }
    }
  };

  for (size_t i = 1; i < parts.size(); ++i) {
    auto images = attachments_.copyAll(parts[i].first.id(), keep, parts[i].first.images());
    if (!images.has_value()) {
      rollback_copies();
      return std::unexpected(images.error());
    }
    copied.insert(copied.end(), images->begin(), images->end());
  }

  auto written = content_.write(keep, merged);
  if (!written.has_value()) {
    rollback_copies();
    return std::unexpected(written.error());
  }

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    std::vector<std::string> tags;
    for (const auto& id : targets) {
      const auto* record = data.findNote(id);
      if (record == nullptr) {
        return std::unexpected(noteNotFound(id));
      }
      tags = unionTags(std::move(tags), record->tags());
    }

    auto* record = data.findNote(keep);
    if (record->title() != title) {
      record->setTitle(title);
    }
    record->setTags(unionTags(std::move(tags),
                              core::LinkResolver::derivedTags(title, merged, record->isDaily())));
    auto images = record->images();
    images.insert(images.end(), copied.begin(), copied.end());
    record->setImages(std::move(images));
    record->setLinkTitles(core::LinkResolver::extractLinkTitles(merged));
    record->touch();

    std::set<core::NoteId> absorbed(targets.begin() + 1, targets.end());
    std::erase_if(data.notes, [&](const core::Metadata& note) { return absorbed.contains(note.id()); });
    core::LinkResolver::relinkAll(data.notes);
    return *data.findNote(keep);
  });

  if (!updated.has_value()) {
    rollback_copies();
    auto restored = content_.write(keep, keep_body_before);
    if (!restored.has_value()) {
      spdlog::error("Rollback of note {} failed: {}", keep.toString(), restored.error().message());
    }
    return std::unexpected(updated.error());
  }

  for (size_t i = 1; i < targets.size(); ++i) {
    purgeFiles(targets[i]);
  }

  spdlog::debug("Merged {} notes into {}", targets.size(), keep.toString());
  return core::Note(*updated, std::move(merged));
}

Result<core::Note> FilesystemStore::getOrCreateDaily() {
  std::shared_lock lock(store_mutex_);
  const std::string date = util::Time::localDate(util::Time::now());
  const std::string body = "# daily\n";

  auto find_daily = [&](const std::vector<core::Metadata>& notes) -> const core::Metadata* {
    auto it = std::find_if(notes.begin(), notes.end(), [&](const core::Metadata& note) {
      return note.isDaily() && note.title() == date;
    });
    return it == notes.end() ? nullptr : &*it;
  };

  auto notes = index_.listNotes();
  if (const auto* existing = find_daily(notes)) {
    return assemble(*existing);
  }

  auto fresh_id = core::NoteId::generate();
  auto note_mutex = noteMutex(fresh_id);
  std::lock_guard note_lock(*note_mutex);

  auto written = content_.write(fresh_id, body);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  // The lookup is repeated inside the update so two callers cannot both create
  auto result = index_.update([&](IndexData& data) -> Result<std::pair<core::Metadata, bool>> {
    if (const auto* existing = find_daily(data.notes)) {
      return std::make_pair(*existing, false);
    }
    core::Metadata record(fresh_id, date);
    record.setDaily(true);
    record.setTags(core::LinkResolver::derivedTags(date, body, true));
    data.notes.push_back(std::move(record));
    core::LinkResolver::relinkAll(data.notes);
    return std::make_pair(*data.findNote(fresh_id), true);
  });

  if (!result.has_value() || !result->second) {
    auto removed = content_.remove(fresh_id);
    if (!removed.has_value()) {
      spdlog::error("Cleanup of note {} failed: {}", fresh_id.toString(), removed.error().message());
    }
    releaseNoteMutex(fresh_id);
  }
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  if (!result->second) {
    return assemble(result->first);
  }

  spdlog::debug("Created daily note {} for {}", fresh_id.toString(), date);
  return core::Note(result->first, body);
}

Result<std::vector<core::Metadata>> FilesystemStore::getBacklinks(const core::NoteId& id) const {
  std::shared_lock lock(store_mutex_);
  auto notes = index_.listNotes();
  bool known = std::any_of(notes.begin(), notes.end(),
                           [&](const core::Metadata& note) { return note.id() == id; });
  if (!known) {
    return std::unexpected(noteNotFound(id));
  }

  std::vector<core::Metadata> backlinks;
  for (auto& note : notes) {
    if (note.hasLinkTo(id)) {
      backlinks.push_back(std::move(note));
    }
  }
  sortByUpdated(backlinks);
  return backlinks;
}

Result<std::vector<core::Metadata>> FilesystemStore::search(const std::string& query) const {
  std::shared_lock lock(store_mutex_);
  auto parsed = index::QueryParser::parse(query);
  return index::SearchEngine::evaluate(
      parsed, index_.listNotes(),
      [this](const core::NoteId& id) { return content_.read(id); },
      util::Time::now());
}

Result<std::vector<VersionEntry>> FilesystemStore::listVersions(const core::NoteId& id) const {
  std::shared_lock lock(store_mutex_);
  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  return versions_.list(id);
}

Result<VersionSnapshot> FilesystemStore::getVersion(const core::NoteId& id,
                                                    const std::string& saved_at) const {
  std::shared_lock lock(store_mutex_);
  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  return versions_.get(id, saved_at);
}

Result<core::Note> FilesystemStore::restoreVersion(const core::NoteId& id,
                                                   const std::string& saved_at) {
  std::shared_lock lock(store_mutex_);
  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  auto snapshot = versions_.get(id, saved_at);
  if (!snapshot.has_value()) {
    return std::unexpected(snapshot.error());
  }
  // A normal save, so the state being replaced is kept as a new version
  return saveUnlocked(id, snapshot->title, snapshot->body);
}

Result<core::Note> FilesystemStore::attach(const core::NoteId& id,
                                           const std::vector<std::filesystem::path>& sources) {
  if (sources.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No files to attach"));
  }
  for (const auto& source : sources) {
    auto valid = attachments_.validateSource(source);
    if (!valid.has_value()) {
      return std::unexpected(valid.error());
    }
  }

  std::shared_lock lock(store_mutex_);
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }

  std::vector<core::ImageRef> imported;
  auto rollback = [&]() {
    for (const auto& ref : imported) {
      auto removed = attachments_.removeFile(id, ref.path);
      if (!removed.has_value()) {
        spdlog::error("Rollback of {} failed: {}", ref.path, removed.error().message());
      }
    }
  };

  for (const auto& source : sources) {
    auto ref = attachments_.importFile(id, source);
    if (!ref.has_value()) {
      rollback();
      return std::unexpected(ref.error());
    }
    imported.push_back(std::move(*ref));
  }

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    auto* record = data.findNote(id);
    if (record == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    for (const auto& ref : imported) {
      record->addImage(ref);
    }
    return *record;
  });
  if (!updated.has_value()) {
    rollback();
    return std::unexpected(updated.error());
  }
  return assemble(*updated);
}

Result<core::Note> FilesystemStore::attachFromData(const core::NoteId& id, const std::string& data,
                                                   const std::string& suggested_name) {
  std::shared_lock lock(store_mutex_);
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }

  auto ref = attachments_.importData(id, data, suggested_name);
  if (!ref.has_value()) {
    return std::unexpected(ref.error());
  }

  auto updated = index_.update([&](IndexData& index_data) -> Result<core::Metadata> {
    auto* record = index_data.findNote(id);
    if (record == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    record->addImage(*ref);
    return *record;
  });
  if (!updated.has_value()) {
    auto removed = attachments_.removeFile(id, ref->path);
    if (!removed.has_value()) {
      spdlog::error("Rollback of {} failed: {}", ref->path, removed.error().message());
    }
    return std::unexpected(updated.error());
  }
  return assemble(*updated);
}

Result<core::Note> FilesystemStore::removeAttachment(const core::NoteId& id,
                                                     const std::string& relative_path) {
  auto relative = util::PathSanitizer::validateRelativePath(relative_path);
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }

  std::shared_lock lock(store_mutex_);
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  bool listed = std::any_of(metadata->images().begin(), metadata->images().end(),
                            [&](const core::ImageRef& ref) { return ref.path == relative_path; });
  if (!listed) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Note " + id.toString() + " has no attachment " +
                                     relative_path));
  }

  auto removed = attachments_.removeFile(id, relative_path);
  if (!removed.has_value()) {
    return std::unexpected(removed.error());
  }

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    auto* record = data.findNote(id);
    if (record == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    record->removeImage(relative_path);
    return *record;
  });
  if (!updated.has_value()) {
    return std::unexpected(updated.error());
  }
  return assemble(*updated);
}

Result<core::Note> FilesystemStore::renameAttachment(const core::NoteId& id,
                                                     const std::string& relative_path,
                                                     const std::string& new_name) {
  auto relative = util::PathSanitizer::validateRelativePath(relative_path);
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }
  auto sanitized = util::PathSanitizer::sanitizeFilename(new_name);
  if (!sanitized.has_value()) {
    return std::unexpected(sanitized.error());
  }

  std::shared_lock lock(store_mutex_);
  auto note_mutex = noteMutex(id);
  std::lock_guard note_lock(*note_mutex);

  auto metadata = index_.get(id);
  if (!metadata.has_value()) {
    return std::unexpected(metadata.error());
  }
  auto current = std::find_if(metadata->images().begin(), metadata->images().end(),
                              [&](const core::ImageRef& ref) { return ref.path == relative_path; });
  if (current == metadata->images().end()) {
    return std::unexpected(makeError(ErrorCode::kNotFound,
                                     "Note " + id.toString() + " has no attachment " +
                                     relative_path));
  }
  const core::ImageRef original = *current;

  // Disk first; metadata only changes once the file has moved
  auto renamed = attachments_.renameFile(id, original, new_name);
  if (!renamed.has_value()) {
    return std::unexpected(renamed.error());
  }

  auto updated = index_.update([&](IndexData& data) -> Result<core::Metadata> {
    auto* record = data.findNote(id);
    if (record == nullptr) {
      return std::unexpected(noteNotFound(id));
    }
    auto* ref = record->findImage(relative_path);
    if (ref == nullptr) {
      return std::unexpected(makeError(ErrorCode::kNotFound,
                                       "Attachment disappeared: " + relative_path));
    }
    *ref = *renamed;
    record->touch();
    return *record;
  });

  if (!updated.has_value()) {
    if (renamed->path != original.path) {
      auto undone = attachments_.undoRename(*renamed, original);
      if (!undone.has_value()) {
        spdlog::error("Rollback of attachment rename {} failed: {}", original.path,
                      undone.error().message());
      }
    }
    return std::unexpected(updated.error());
  }
  return assemble(*updated);
}

Result<std::filesystem::path> FilesystemStore::resolveAttachment(
    const std::string& relative_path) const {
  return attachments_.resolve(relative_path);
}

}  // namespace quire::store
