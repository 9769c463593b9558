#include "quire/cli/commands/export_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "quire/cli/output.hpp"
#include "quire/import_export/note_exporter.hpp"

namespace quire::cli {

ExportCommand::ExportCommand(Application& app) : app_(app) {}

Result<int> ExportCommand::execute(const GlobalOptions& options) {
  auto format = import_export::parseExportFormat(format_);
  if (!format.has_value()) {
    return std::unexpected(format.error());
  }

  auto id = parseNoteId(note_id_);
  if (!id.has_value()) {
    return std::unexpected(id.error());
  }

  auto note = app_.store().read(*id);
  if (!note.has_value()) {
    return std::unexpected(note.error());
  }

  if (output_.empty()) {
    auto document = import_export::NoteExporter::render(*note, *format);
    if (!document.has_value()) {
      return std::unexpected(document.error());
    }
    if (options.json) {
      printJson({{"id", note->id().toString()},
                 {"fileName", import_export::NoteExporter::defaultFileName(*note, *format)},
                 {"content", *document}});
    } else {
      std::cout << *document;
    }
    return 0;
  }

  std::filesystem::path target = output_;
  std::error_code ec;
  if (std::filesystem::is_directory(target, ec)) {
    target /= import_export::NoteExporter::defaultFileName(*note, *format);
  }

  auto written = import_export::NoteExporter::exportToFile(*note, *format, target);
  if (!written.has_value()) {
    return std::unexpected(written.error());
  }

  if (options.json) {
    printJson({{"id", note->id().toString()}, {"path", target.string()}});
  } else if (!options.quiet) {
    std::cout << "Exported to " << target.string() << std::endl;
  }
  return 0;
}

void ExportCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID")->required();
  cmd->add_option("--format", format_, "md or text")->capture_default_str();
  cmd->add_option("-o,--output", output_, "File or directory to write; stdout when omitted");
}

}  // namespace quire::cli
