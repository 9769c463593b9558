#include "quire/template/template_manager.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "quire/store/filesystem_store.hpp"
#include "quire/util/time.hpp"

namespace quire::template_system {

namespace {

constexpr const char* kCustomPrefix = "custom-";

std::string trim(const std::string& text) {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

core::NoteTemplate makeBuiltin(std::string id, std::string name, std::string body,
                               std::string pattern) {
  core::NoteTemplate tmpl;
  tmpl.id = std::move(id);
  tmpl.name = std::move(name);
  tmpl.body = std::move(body);
  tmpl.default_title_pattern = std::move(pattern);
  tmpl.is_custom = false;
  return tmpl;
}

}  // namespace

TemplateManager::TemplateManager(store::FilesystemStore& store) : store_(store) {}

const std::vector<core::NoteTemplate>& TemplateManager::builtins() {
  static const std::vector<core::NoteTemplate> kBuiltins = {
      makeBuiltin("daily-journal", "Daily journal",
                  "# Daily Journal - {{date}}\n\n"
                  "## What happened today\n- \n\n"
                  "## Thoughts & reflections\n- \n\n"
                  "## Tomorrow\n- \n",
                  "Journal {{date}}"),
      makeBuiltin("meeting-notes", "Meeting notes",
                  "# Meeting: {{title}}\n\n"
                  "**Date:** {{date}}\n"
                  "**Attendees:** \n"
                  "**Agenda:**\n- \n\n"
                  "**Notes:**\n- \n\n"
                  "**Action items:**\n- [ ] \n- [ ] \n",
                  "Meeting {{date}}"),
      makeBuiltin("project-planning", "Project planning",
                  "# Project: {{title}}\n\n"
                  "## Overview\n- **Goal:** \n- **Timeline:** \n\n"
                  "## Tasks\n- [ ] \n- [ ] \n\n"
                  "## Notes\n- \n",
                  "Project"),
  };
  return kBuiltins;
}

std::vector<core::NoteTemplate> TemplateManager::list() const {
  std::vector<core::NoteTemplate> templates = builtins();
  auto lock = store_.lockShared();
  auto custom = store_.index().snapshot().templates;
  templates.insert(templates.end(), custom.begin(), custom.end());
  return templates;
}

Result<core::NoteTemplate> TemplateManager::get(const std::string& template_id) const {
  for (const auto& tmpl : list()) {
    if (tmpl.id == template_id) {
      return tmpl;
    }
  }
  return std::unexpected(makeError(ErrorCode::kNotFound, "Template not found: " + template_id));
}

Result<core::NoteTemplate> TemplateManager::saveCustom(const std::string& name,
                                                       const std::string& body) {
  auto trimmed = trim(name);
  if (trimmed.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Template name cannot be empty"));
  }

  core::NoteTemplate tmpl;
  tmpl.id = kCustomPrefix + core::NoteId::generate().toString();
  tmpl.name = trimmed;
  tmpl.body = body;
  tmpl.default_title_pattern = trimmed;
  tmpl.is_custom = true;

  auto lock = store_.lockShared();
  auto saved = store_.index().update([&](store::IndexData& data) -> Result<core::NoteTemplate> {
    data.templates.push_back(tmpl);
    return tmpl;
  });
  if (saved.has_value()) {
    spdlog::debug("Saved template {} ({})", saved->name, saved->id);
  }
  return saved;
}

Result<void> TemplateManager::deleteCustom(const std::string& template_id) {
  const auto& fixed = builtins();
  bool builtin = std::any_of(fixed.begin(), fixed.end(), [&](const core::NoteTemplate& tmpl) {
    return tmpl.id == template_id;
  });
  if (builtin) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Built-in template cannot be deleted: " + template_id));
  }

  auto lock = store_.lockShared();
  return store_.index().update([&](store::IndexData& data) -> Result<void> {
    auto removed = std::erase_if(data.templates, [&](const core::NoteTemplate& tmpl) {
      return tmpl.id == template_id;
    });
    if (removed == 0) {
      return std::unexpected(makeError(ErrorCode::kNotFound,
                                       "Template not found: " + template_id));
    }
    return {};
  });
}

std::string TemplateManager::substitute(std::string text, const std::string& name,
                                        const std::string& value) {
  const std::string placeholder = "{{" + name + "}}";
  size_t pos = 0;
  while ((pos = text.find(placeholder, pos)) != std::string::npos) {
    text.replace(pos, placeholder.size(), value);
    pos += value.size();
  }
  return text;
}

std::pair<std::string, std::string> TemplateManager::render(
    const core::NoteTemplate& tmpl, const std::optional<std::string>& title,
    std::chrono::system_clock::time_point now) {
  std::string title_input;
  if (title.has_value() && !trim(*title).empty()) {
    title_input = trim(*title);
  } else if (tmpl.default_title_pattern.has_value() && !tmpl.default_title_pattern->empty()) {
    title_input = *tmpl.default_title_pattern;
  } else {
    title_input = "Untitled";
  }

  const auto date = util::Time::localDate(now);
  auto rendered_title = substitute(title_input, "date", date);
  auto body = substitute(substitute(tmpl.body, "date", date), "title", rendered_title);
  return {rendered_title, body};
}

Result<core::Note> TemplateManager::createNote(const std::string& template_id,
                                               const std::optional<std::string>& title) {
  auto tmpl = get(template_id);
  if (!tmpl.has_value()) {
    return std::unexpected(tmpl.error());
  }
  auto [note_title, body] = render(*tmpl, title, util::Time::now());
  return store_.save(std::nullopt, note_title, body);
}

}  // namespace quire::template_system
