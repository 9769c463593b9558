#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "quire/common.hpp"
#include "quire/config/config.hpp"
#include "quire/store/filesystem_store.hpp"
#include "quire/store/notebook_manager.hpp"
#include "quire/sync/backup_manager.hpp"
#include "quire/template/template_manager.hpp"

namespace quire::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Debug output on stderr
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string root;            // --root: Override the store root
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 *
 * Owns the configuration, the store and the managers built on it. Services
 * are created on first command execution so that --help works without a
 * store.
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Process exit code
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration, set up logging and open the store
   */
  Result<void> initialize();

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  const std::filesystem::path& configPath() const;
  store::FilesystemStore& store();
  store::NotebookManager& notebookManager();
  template_system::TemplateManager& templateManager();
  sync::BackupManager& backupManager();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Print an error and return the matching exit code
  int reportError(const Error& error) const;

  void requireInitialized() const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  // Services
  std::unique_ptr<config::Config> config_;
  std::filesystem::path config_path_;
  std::unique_ptr<store::FilesystemStore> store_;
  std::unique_ptr<store::NotebookManager> notebooks_;
  std::unique_ptr<template_system::TemplateManager> templates_;
  std::unique_ptr<sync::BackupManager> backup_;
  bool services_initialized_ = false;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace quire::cli
