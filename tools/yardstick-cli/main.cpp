#include <spdlog/spdlog.h>
#include <yardstick/cli/yardstick_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; YardstickCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        yardstick::cli::YardstickCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
