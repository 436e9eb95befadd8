#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config/microlab_config.hpp"
#include "exception/exception.hpp"
#include "hardware/clock.hpp"
#include "hardware/device_registry.hpp"
#include "hardware/hardware_context.hpp"
#include "logging/logging.hpp"
#include "task/task_factory.hpp"
#include "task/task_runner.hpp"

#include "atom/type/json.hpp"
#include "atom/utils/argsview.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

auto joinKinds() -> std::string {
    std::string kinds;
    for (const auto& kind : microlab::task::getTaskKinds()) {
        kinds += kinds.empty() ? kind : ", " + kind;
    }
    return kinds;
}

}  // namespace

int main(int argc, char *argv[]) {
    // Step 1: Parse command line arguments
    atom::utils::ArgumentParser program("MicroLab"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "microlab.yaml"s, "Path to the config file",
                        {"c"});
    program.addArgument("task", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Step to run (" + joinKinds() + ")",
                        {"t"});
    program.addArgument("params", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "{}"s, "Step parameters as a JSON object",
                        {"p"});

    program.addDescription("MicroLab reactor step runner:");
    program.addEpilog("Without --task the hardware is built and checked.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    auto logger = microlab::logging::getLogger("microlab");

    // Step 2: Load configuration and set up logging
    fs::path configPath = program.get<std::string>("config").value_or(
        "microlab.yaml"s);
    microlab::config::MicrolabConfig config;
    std::vector<microlab::hardware::DeviceDescriptor> descriptors;
    try {
        config = microlab::config::loadMicrolabConfig(configPath);
        microlab::logging::init(config.logging);
        logger->info("Loaded configuration from {}", configPath.string());
        descriptors = microlab::config::loadHardwareDescriptors(config);
    } catch (const microlab::ConfigError &e) {
        logger->critical("Configuration error: {}", e.what());
        microlab::logging::shutdown();
        return 1;
    }

    // Step 3: Build the hardware
    microlab::hardware::HardwareContext context(
        microlab::hardware::DeviceRegistry::withBuiltIns(),
        std::make_shared<microlab::hardware::SteadyClock>());
    if (!context.load(descriptors, config.hardwareSpeedup)) {
        logger->critical("Hardware state {}: {}",
                         microlab::hardware::hardwareStateToString(
                             context.getState()),
                         context.getLastError().value_or("unknown error"));
        microlab::logging::shutdown();
        return 1;
    }
    logger->info("Hardware state {}", microlab::hardware::hardwareStateToString(
                                          context.getState()));

    auto kind = program.get<std::string>("task").value_or(""s);
    if (kind.empty()) {
        microlab::logging::shutdown();
        return 0;
    }

    // Step 4: Run one step
    int status = 0;
    try {
        auto params = nlohmann::json::parse(
            program.get<std::string>("params").value_or("{}"s));
        auto hardware = context.get();
        auto task = microlab::task::makeTask(kind, hardware, params);
        auto waits = microlab::task::runTask(*task, *hardware);
        logger->info("Step '{}' completed after {} waits ({:.1f} s)", kind,
                     waits, hardware->uptime());
    } catch (const nlohmann::json::parse_error &e) {
        logger->critical("--params is not valid JSON: {}", e.what());
        status = 2;
    } catch (const microlab::InvalidTaskParameterError &e) {
        logger->critical("Invalid step: {}", e.what());
        status = 2;
    } catch (const std::exception &e) {
        logger->critical("Step '{}' failed: {}", kind, e.what());
        status = 1;
    }

    microlab::logging::shutdown();
    return status;
}
