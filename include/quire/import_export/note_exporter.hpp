#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "quire/common.hpp"
#include "quire/core/note.hpp"

namespace quire::import_export {

/**
 * @brief Export format types
 */
enum class ExportFormat {
  kMarkdown,   // YAML front matter, heading, body
  kText        // Title line, blank line, body
};

// "md"/"markdown" or "text"/"txt"
Result<ExportFormat> parseExportFormat(std::string_view name);

/**
 * @brief Renders a single note for use outside the store
 */
class NoteExporter {
public:
  /**
   * @brief Render a note as a document
   * @param note Note to render
   * @param format Target format
   * @return The document text
   */
  static Result<std::string> render(const core::Note& note, ExportFormat format);

  // Render and write atomically to path
  static Result<void> exportToFile(const core::Note& note, ExportFormat format,
                                   const std::filesystem::path& path);

  // <slug or id>.md / .txt
  static std::string defaultFileName(const core::Note& note, ExportFormat format);

private:
  static Result<std::string> frontMatter(const core::Metadata& metadata);
};

}  // namespace quire::import_export
