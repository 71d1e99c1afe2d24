#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <yardstick/core/types.h>

namespace yardstick::cli {

// Forward declarations
class YardstickCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "run", "validate")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, YardstickCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

std::unique_ptr<ICommand> createValidateCommand();
std::unique_ptr<ICommand> createRunCommand();

} // namespace yardstick::cli
