#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <yardstick/cli/command.h>
#include <yardstick/cli/yardstick_cli.h>
#include <yardstick/dataset/dataset.h>
#include <yardstick/metrics/metric_registry.h>
#include <yardstick/spec/spec_loader.h>

namespace yardstick::cli {

class ValidateCommand : public ICommand {
public:
    std::string getName() const override { return "validate"; }

    std::string getDescription() const override {
        return "Check a benchmark spec (and its dataset) without contacting any system";
    }

    void registerCommand(CLI::App& app, YardstickCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("validate", getDescription());
        cmd->add_option("spec", specPath_, "Benchmark spec file (YAML or JSON)")->required();
        cmd->add_flag("--skip-dataset", skipDataset_, "Do not load and check the dataset");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        spec::BenchmarkSpec spec;
        try {
            spec = spec::SpecLoader(metrics::MetricRegistry::builtin()).load(specPath_);
        } catch (const spec::SpecValidationError& e) {
            for (const auto& violation : e.violations())
                std::cerr << "  - " << violation << "\n";
            return Error{ErrorCode::InvalidData,
                         std::to_string(e.violations().size()) + " violation(s) in " +
                             specPath_.string()};
        }

        std::size_t caseCount = 0;
        if (!skipDataset_) {
            try {
                caseCount = dataset::DatasetLoader::load(spec.resolvedDatasetPath()).size();
            } catch (const dataset::DatasetError& e) {
                return Error{ErrorCode::InvalidData, std::string("Dataset error: ") + e.what()};
            }
        }

        std::cout << "[OK] " << spec.id << " v" << spec.version << ": " << spec.metrics.size()
                  << " metric(s), " << spec.aggregates.size() << " aggregate(s)";
        if (!skipDataset_)
            std::cout << ", " << caseCount << " case(s)";
        std::cout << "\n";
        spdlog::debug("Validated {}", specPath_.string());
        return {};
    }

private:
    YardstickCLI* cli_{nullptr};
    std::filesystem::path specPath_;
    bool skipDataset_{false};
};

std::unique_ptr<ICommand> createValidateCommand() {
    return std::make_unique<ValidateCommand>();
}

} // namespace yardstick::cli
