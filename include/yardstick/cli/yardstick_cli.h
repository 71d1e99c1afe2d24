#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <yardstick/cli/command.h>
#include <yardstick/config/config_helpers.h>
#include <yardstick/http/http_client.h>

namespace yardstick::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitInterrupted = 130;

/**
 * Main CLI application class
 */
class YardstickCLI {
public:
    YardstickCLI();
    ~YardstickCLI();

    /**
     * Run the CLI with given arguments and return the process exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and logging setup.
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    bool getVerbose() const { return verbose_; }

    /**
     * Config file in effect (--config, $YARDSTICK_CONFIG or the XDG default).
     */
    std::filesystem::path getConfigPath() const;

    /**
     * Resolve runner settings for the given command-line overrides. The global
     * --log-level flag is folded in.
     */
    Result<config::RunnerSettings> resolveSettings(config::RunnerOverrides overrides) const;

    /**
     * Transport used by `run`. Defaults to libcurl; tests may inject a fake.
     */
    http::IHttpClient& getHttpClient();
    void setHttpClient(std::shared_ptr<http::IHttpClient> client) {
        httpClient_ = std::move(client);
    }

    /**
     * Cancellation token for the active run; triggered by SIGINT.
     */
    std::stop_token getStopToken() const { return stopSource_.get_token(); }
    void requestStop() { stopSource_.request_stop(); }

private:
    void registerBuiltinCommands();
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::shared_ptr<http::IHttpClient> httpClient_;
    std::stop_source stopSource_;

    // Global options
    bool verbose_ = false;
    std::string logLevel_;
    std::string configPath_;
};

} // namespace yardstick::cli
