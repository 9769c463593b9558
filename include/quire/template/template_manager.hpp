#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "quire/common.hpp"
#include "quire/core/note.hpp"
#include "quire/core/notebook.hpp"

namespace quire::store {
class FilesystemStore;
}

namespace quire::template_system {

/**
 * @brief Built-in and custom note templates
 *
 * Built-ins are compiled in and never written to disk. Custom templates
 * live in the metadata index with ids of the form custom-<ulid>.
 */
class TemplateManager {
public:
  explicit TemplateManager(store::FilesystemStore& store);

  // Built-ins first, then custom templates in creation order
  std::vector<core::NoteTemplate> list() const;

  Result<core::NoteTemplate> get(const std::string& template_id) const;

  // Store a custom template; its default title pattern is its name
  Result<core::NoteTemplate> saveCustom(const std::string& name, const std::string& body);

  // kValidationFailure for built-ins, kNotFound for unknown ids
  Result<void> deleteCustom(const std::string& template_id);

  /**
   * @brief Instantiate a template through the normal save path
   * @param template_id Built-in or custom id
   * @param title Title override; otherwise the default title pattern or "Untitled"
   */
  Result<core::Note> createNote(const std::string& template_id,
                                const std::optional<std::string>& title = std::nullopt);

  static const std::vector<core::NoteTemplate>& builtins();

  // Replace every {{name}} occurrence
  static std::string substitute(std::string text, const std::string& name,
                                const std::string& value);

  // Title and body a template produces on the given day
  static std::pair<std::string, std::string> render(const core::NoteTemplate& tmpl,
                                                    const std::optional<std::string>& title,
                                                    std::chrono::system_clock::time_point now);

private:
  store::FilesystemStore& store_;
};

}  // namespace quire::template_system
