#include "quire/cli/application.hpp"

#include <unistd.h>

#include <cstdio>
#include <iostream>

#include <spdlog/spdlog.h>

#include "quire/util/error_handler.hpp"

// Command includes
#include "quire/cli/commands/attach_command.hpp"
#include "quire/cli/commands/backlinks_command.hpp"
#include "quire/cli/commands/config_command.hpp"
#include "quire/cli/commands/daily_command.hpp"
#include "quire/cli/commands/dup_command.hpp"
#include "quire/cli/commands/export_command.hpp"
#include "quire/cli/commands/history_command.hpp"
#include "quire/cli/commands/init_command.hpp"
#include "quire/cli/commands/list_command.hpp"
#include "quire/cli/commands/merge_command.hpp"
#include "quire/cli/commands/notebook_command.hpp"
#include "quire/cli/commands/remove_command.hpp"
#include "quire/cli/commands/save_command.hpp"
#include "quire/cli/commands/search_command.hpp"
#include "quire/cli/commands/star_command.hpp"
#include "quire/cli/commands/sync_command.hpp"
#include "quire/cli/commands/tags_command.hpp"
#include "quire/cli/commands/title_command.hpp"
#include "quire/cli/commands/tpl_command.hpp"
#include "quire/cli/commands/view_command.hpp"

namespace quire::cli {

Application::Application()
    : app_("quire", "Local-first note store") {
  app_.set_version_flag("--version", quire::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output on stderr");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--root", global_options_.root, "Override the store root");
}

void Application::setupCommands() {
  // Notes
  registerCommand(std::make_unique<InitCommand>(*this));
  registerCommand(std::make_unique<ListCommand>(*this));
  registerCommand(std::make_unique<ViewCommand>(*this));
  registerCommand(std::make_unique<SaveCommand>(*this));
  registerCommand(std::make_unique<StarCommand>(*this));
  registerCommand(std::make_unique<TitleCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
  registerCommand(std::make_unique<DupCommand>(*this));
  registerCommand(std::make_unique<MergeCommand>(*this));
  registerCommand(std::make_unique<DailyCommand>(*this));
  registerCommand(std::make_unique<ExportCommand>(*this));

  // Tags, links and search
  registerCommand(std::make_unique<TagsCommand>(*this));
  registerCommand(std::make_unique<BacklinksCommand>(*this));
  registerCommand(std::make_unique<SearchCommand>(*this));

  // History and attachments
  registerCommand(std::make_unique<HistoryCommand>(*this));
  registerCommand(std::make_unique<AttachCommand>(*this));

  // Templates and notebooks
  registerCommand(std::make_unique<TplCommand>(*this));
  registerCommand(std::make_unique<NotebookCommand>(*this));

  // Backup and configuration
  registerCommand(std::make_unique<SyncCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  quire save --title "Project Alpha" --body "Kickoff notes, see [[Roadmap]]"
  quire search tag:meeting is:starred
  quire search "quarterly plan" has:tasks date:week
  quire history 01J0ABCDEF...
  quire attach add 01J0ABCDEF... ./diagram.png
  quire sync export ~/backups/quire

For more information on a specific command, run:
  quire <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initialize();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(reportError(init_result.error()));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(reportError(result.error()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

int Application::reportError(const Error& error) const {
  const auto& handler = util::ErrorHandler::instance();
  handler.log(error, util::ErrorSeverity::kInfo);

  if (global_options_.json) {
    std::cout << handler.formatUserError(error, true, false) << std::endl;
  } else {
    bool color = ::isatty(::fileno(stderr)) != 0;
    std::cerr << handler.formatUserError(error, false, color) << std::endl;
  }
  return util::ErrorHandler::exitCodeFor(error.code());
}

Result<void> Application::initialize() {
  if (services_initialized_) {
    return {};
  }

  config_ = std::make_unique<config::Config>();
  if (!global_options_.config_file.empty()) {
    config_path_ = global_options_.config_file;
    auto loaded = config_->load(config_path_);
    if (!loaded.has_value()) {
      return std::unexpected(loaded.error());
    }
  } else {
    config_path_ = config::Config::defaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(config_path_, ec)) {
      auto loaded = config_->load(config_path_);
      if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
      }
    }
  }

  auto valid = config_->validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  util::LogOptions log_options;
  log_options.level = config_->log_level;
  log_options.file = config_->log_file;
  log_options.verbose = global_options_.verbose > 0;
  util::setupLogging(log_options);

  std::filesystem::path root = global_options_.root.empty()
      ? config_->effectiveRoot()
      : std::filesystem::path(global_options_.root);

  store::StoreOptions store_options;
  store_options.preview_length = config_->preview_length;
  store_options.max_attachment_bytes = config_->max_attachment_bytes;

  store_ = std::make_unique<store::FilesystemStore>(root, store_options);
  auto init_result = store_->init();
  if (!init_result.has_value()) {
    return std::unexpected(init_result.error());
  }
  spdlog::debug("Opened store at {}", root.string());

  if (!global_options_.quiet) {
    for (const auto& warning : store_->warnings()) {
      std::cerr << "Warning: " << warning << std::endl;
    }
  }

  notebooks_ = std::make_unique<store::NotebookManager>(*store_);
  templates_ = std::make_unique<template_system::TemplateManager>(*store_);
  backup_ = std::make_unique<sync::BackupManager>(*store_);

  services_initialized_ = true;
  return {};
}

void Application::requireInitialized() const {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
}

// Getters for services (to be used by commands)
const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  requireInitialized();
  return *config_;
}

const std::filesystem::path& Application::configPath() const {
  requireInitialized();
  return config_path_;
}

store::FilesystemStore& Application::store() {
  requireInitialized();
  return *store_;
}

store::NotebookManager& Application::notebookManager() {
  requireInitialized();
  return *notebooks_;
}

template_system::TemplateManager& Application::templateManager() {
  requireInitialized();
  return *templates_;
}

sync::BackupManager& Application::backupManager() {
  requireInitialized();
  return *backup_;
}

}  // namespace quire::cli
