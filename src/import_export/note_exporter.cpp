#include "quire/import_export/note_exporter.hpp"

#include <algorithm>
#include <cctype>

#include <yaml-cpp/yaml.h>

#include "quire/core/link_resolver.hpp"
#include "quire/util/filesystem.hpp"
#include "quire/util/time.hpp"

namespace quire::import_export {

Result<ExportFormat> parseExportFormat(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "md" || lower == "markdown") {
    return ExportFormat::kMarkdown;
  }
  if (lower == "text" || lower == "txt") {
    return ExportFormat::kText;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                   "Unknown export format: " + std::string(name)));
}

Result<std::string> NoteExporter::frontMatter(const core::Metadata& metadata) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "title" << YAML::Value << metadata.title();
  out << YAML::Key << "tags" << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (const auto& tag : metadata.tags()) {
    out << tag;
  }
  out << YAML::EndSeq;
  out << YAML::Key << "created" << YAML::Value << util::Time::toRfc3339(metadata.created());
  out << YAML::Key << "updated" << YAML::Value << util::Time::toRfc3339(metadata.updated());
  out << YAML::EndMap;

  if (!out.good()) {
    return std::unexpected(makeError(ErrorCode::kValidationFailure,
                                     "Cannot write front matter: " + out.GetLastError()));
  }
  return "---\n" + std::string(out.c_str()) + "\n---\n";
}

Result<std::string> NoteExporter::render(const core::Note& note, ExportFormat format) {
  switch (format) {
    case ExportFormat::kMarkdown: {
      auto header = frontMatter(note.metadata());
      if (!header.has_value()) {
        return header;
      }
      return *header + "\n# " + note.title() + "\n\n" + note.content() + "\n";
    }
    case ExportFormat::kText:
      return note.title() + "\n\n" + note.content() + "\n";
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Unsupported export format"));
}

Result<void> NoteExporter::exportToFile(const core::Note& note, ExportFormat format,
                                        const std::filesystem::path& path) {
  auto document = render(note, format);
  if (!document.has_value()) {
    return std::unexpected(document.error());
  }
  return util::FileSystem::writeFileAtomic(path, *document);
}

std::string NoteExporter::defaultFileName(const core::Note& note, ExportFormat format) {
  auto stem = core::LinkResolver::slugify(note.title());
  if (stem.empty()) {
    stem = note.id().toString();
  }
  return stem + (format == ExportFormat::kMarkdown ? ".md" : ".txt");
}

}  // namespace quire::import_export
