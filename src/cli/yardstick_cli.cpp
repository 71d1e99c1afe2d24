#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <yardstick/cli/yardstick_cli.h>
#include <yardstick/version.hpp>

namespace yardstick::cli {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handleInterrupt(int) {
    g_interrupted = 1;
}

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    auto normalized = config::normalize_log_level(s);
    if (!normalized)
        return std::nullopt;
    const auto& v = normalized.value();
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn")
        return spdlog::level::warn;
    if (v == "error")
        return spdlog::level::err;
    if (v == "critical")
        return spdlog::level::critical;
    return spdlog::level::off;
}

} // namespace

YardstickCLI::YardstickCLI() {
    app_ = std::make_unique<CLI::App>(
        "Yardstick - deterministic benchmark runner for HTTP systems");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", YARDSTICK_VERSION_STRING);

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose (debug) logging");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace, debug, info, warn, error, critical, off");
    app_->add_option("--config", configPath_, "Configuration file (TOML)");
}

YardstickCLI::~YardstickCLI() = default;

void YardstickCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void YardstickCLI::registerBuiltinCommands() {
    registerCommand(createValidateCommand());
    registerCommand(createRunCommand());
}

std::filesystem::path YardstickCLI::getConfigPath() const {
    return config::get_config_path(configPath_);
}

Result<config::RunnerSettings>
YardstickCLI::resolveSettings(config::RunnerOverrides overrides) const {
    if (!logLevel_.empty())
        overrides.logLevel = logLevel_;
    return config::resolve_runner_settings(getConfigPath(), overrides);
}

http::IHttpClient& YardstickCLI::getHttpClient() {
    if (!httpClient_)
        httpClient_ = http::makeCurlHttpClient();
    return *httpClient_;
}

// Precedence: --log-level > env YARDSTICK_LOG_LEVEL > --verbose > config [log] level > warn
void YardstickCLI::applyLogLevel() {
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    if (!logLevel_.empty()) {
        if (auto lvl = parseLevel(logLevel_)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown --log-level '{}'", logLevel_);
    }
    if (const char* envLvl = std::getenv("YARDSTICK_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    auto fromFile = config::parse_config_value(getConfigPath(), "log", "level");
    if (auto lvl = parseLevel(fromFile); !fromFile.empty() && lvl) {
        spdlog::set_level(*lvl);
        return;
    }
    spdlog::set_level(spdlog::level::warn);
}

int YardstickCLI::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();

    if (!pendingCommand_) {
        return kExitOk;
    }

    // SIGINT only raises a flag; the watcher turns it into a stop request.
    g_interrupted = 0;
    auto previous = std::signal(SIGINT, handleInterrupt);
    std::jthread watcher([this](std::stop_token token) {
        while (!token.stop_requested()) {
            if (g_interrupted) {
                spdlog::warn("Interrupted; finishing in-flight cases");
                requestStop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto result = pendingCommand_->execute();

    watcher.request_stop();
    watcher.join();
    std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);

    if (!result) {
        if (result.error().code == ErrorCode::OperationCancelled) {
            std::cerr << "[INTERRUPTED] " << result.error().message << "\n";
            return kExitInterrupted;
        }
        std::cerr << "[FAIL] " << result.error().message << "\n";
        return kExitFailure;
    }
    return kExitOk;
}

} // namespace yardstick::cli
