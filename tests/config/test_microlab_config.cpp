/*
 * test_microlab_config.cpp - Tests for configuration loading
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <fstream>

#include "config/microlab_config.hpp"
#include "config/yaml_json.hpp"
#include "exception/exception.hpp"
#include "hardware/clock.hpp"
#include "hardware/device_graph.hpp"
#include "hardware/device_registry.hpp"
#include "hardware/hardware_context.hpp"

using namespace microlab;
using namespace microlab::config;
using namespace testing;

class ConfigFileTest : public Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("microlab_config_test_" +
                std::string(UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    auto writeFile(const std::string& name, const std::string& contents)
        -> fs::path {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    fs::path dir_;
};

// ========== YAML Conversion Tests ==========

TEST(YamlJsonTest, Scalars_DetectTypes) {
    auto j = yamlNodeToJson(YAML::Load(R"(
int: 42
negative: -7
float: 0.5
flag: true
off: no
nothing: ~
text: gpio-primary
quoted: "25"
)"));
    EXPECT_EQ(j["int"], 42);
    EXPECT_EQ(j["negative"], -7);
    EXPECT_DOUBLE_EQ(j["float"].get<double>(), 0.5);
    EXPECT_EQ(j["flag"], true);
    EXPECT_EQ(j["off"], false);
    EXPECT_TRUE(j["nothing"].is_null());
    EXPECT_EQ(j["text"], "gpio-primary");
    EXPECT_TRUE(j["quoted"].is_string());
    EXPECT_EQ(j["quoted"], "25");
}

TEST(YamlJsonTest, Nested_MapsAndSequences) {
    auto j = yamlNodeToJson(YAML::Load(R"(
pumps:
  X: {mmPerMl: 3.5}
chips: [gpiochip0, gpiochip1]
)"));
    EXPECT_DOUBLE_EQ(j["pumps"]["X"]["mmPerMl"].get<double>(), 3.5);
    ASSERT_TRUE(j["chips"].is_array());
    EXPECT_EQ(j["chips"][1], "gpiochip1");
}

TEST(YamlJsonTest, DepthLimitThrows) {
    EXPECT_THROW((void)yamlNodeToJson(YAML::Load("a: {b: {c: 1}}"), 0, 1),
                 ConfigError);
}

// ========== Process Configuration Tests ==========

TEST(MicrolabConfigTest, Parse_ResolvesPathsAgainstBaseDir) {
    auto config = parseMicrolabConfig(YAML::Load(R"(
hardwareSpeedup: 10
controllerHardware: hardware/controllerhardware/simulation.yaml
labHardware: /etc/microlab/lab.yaml
logging:
  console: false
  fileLevel: debug
  maxFiles: 5
)"),
                                      "/opt/microlab");
    ASSERT_TRUE(config.hardwareSpeedup.has_value());
    EXPECT_DOUBLE_EQ(*config.hardwareSpeedup, 10.0);
    EXPECT_EQ(config.controllerHardware,
              fs::path("/opt/microlab/hardware/controllerhardware/"
                       "simulation.yaml"));
    EXPECT_EQ(config.labHardware, fs::path("/etc/microlab/lab.yaml"));
    EXPECT_FALSE(config.logging.enableConsole);
    EXPECT_EQ(config.logging.fileLevel, spdlog::level::debug);
    EXPECT_EQ(config.logging.maxFiles, 5u);
}

TEST(MicrolabConfigTest, Parse_SpeedupIsOptional) {
    auto config = parseMicrolabConfig(YAML::Load(R"(
controllerHardware: c.yaml
labHardware: l.yaml
)"));
    EXPECT_FALSE(config.hardwareSpeedup.has_value());
    EXPECT_EQ(config.controllerHardware, fs::path("c.yaml"));
}

TEST(MicrolabConfigTest, Parse_RejectsInvalidValues) {
    EXPECT_THROW((void)parseMicrolabConfig(YAML::Load(R"(
hardwareSpeedup: 0
controllerHardware: c.yaml
labHardware: l.yaml
)")),
                 ConfigError);
    EXPECT_THROW((void)parseMicrolabConfig(YAML::Load("labHardware: l.yaml")),
                 ConfigError);
    EXPECT_THROW((void)parseMicrolabConfig(YAML::Load(R"(
controllerHardware: c.yaml
labHardware: l.yaml
logging:
  consoleLevel: loud
)")),
                 ConfigError);
    EXPECT_THROW((void)parseMicrolabConfig(YAML::Load("- a\n- b")),
                 ConfigError);
}

// ========== Device Descriptor Tests ==========

TEST(DeviceDescriptorParseTest, Parse_SplitsReservedKeysFromParams) {
    auto devices = parseDeviceDescriptors(YAML::Load(R"(
devices:
  - id: reactor-temperature-controller
    type: tempController
    implementation: basic
    dependencies: [gpio-primary]
    thermometerID: thermometer
    heaterPin: 26
    pidConfig: {P: 1, I: 0.5, D: 5}
)"),
                                          "lab.yaml");
    ASSERT_EQ(devices.size(), 1u);
    const auto& desc = devices.front();
    EXPECT_EQ(desc.id, "reactor-temperature-controller");
    EXPECT_EQ(desc.type, hardware::DeviceType::TEMP_CONTROLLER);
    EXPECT_EQ(desc.implementation, "basic");
    EXPECT_THAT(desc.dependencies, ElementsAre("gpio-primary"));
    EXPECT_FALSE(desc.params.contains("id"));
    EXPECT_FALSE(desc.params.contains("dependencies"));
    EXPECT_EQ(desc.params["thermometerID"], "thermometer");
    EXPECT_EQ(desc.params["heaterPin"], 26);
    EXPECT_DOUBLE_EQ(desc.params["pidConfig"]["I"].get<double>(), 0.5);
}

TEST(DeviceDescriptorParseTest, Parse_RejectsMalformedEntries) {
    EXPECT_THROW((void)parseDeviceDescriptors(YAML::Load("other: 1"), "f"),
                 ConfigError);
    EXPECT_THROW((void)parseDeviceDescriptors(YAML::Load(R"(
devices:
  - id: a
    type: stirrer
)"),
                                              "f"),
                 ConfigError);
    EXPECT_THROW((void)parseDeviceDescriptors(YAML::Load(R"(
devices:
  - id: a
    type: blender
    implementation: simulation
)"),
                                              "f"),
                 ConfigError);
    EXPECT_THROW((void)parseDeviceDescriptors(YAML::Load(R"(
devices:
  - {id: a, type: stirrer, implementation: simulation}
  - {id: a, type: stirrer, implementation: simulation}
)"),
                                              "f"),
                 ConfigError);
    EXPECT_THROW((void)parseDeviceDescriptors(YAML::Load(R"(
devices:
  - {id: a, type: stirrer, implementation: simulation, dependencies: b}
)"),
                                              "f"),
                 ConfigError);
}

TEST(DeviceDescriptorParseTest, Parse_EmptyDeviceList) {
    EXPECT_TRUE(
        parseDeviceDescriptors(YAML::Load("devices:"), "f").empty());
}

// ========== File Loading Tests ==========

TEST_F(ConfigFileTest, LoadHardwareDescriptors_ControllerFirst) {
    writeFile("controller.yaml", R"(
devices:
  - {id: grbl-primary, type: grbl, implementation: simulation}
)");
    writeFile("lab.yaml", R"(
devices:
  - {id: stirrer, type: stirrer, implementation: simulation}
)");
    auto mainPath = writeFile("microlab.yaml", R"(
controllerHardware: controller.yaml
labHardware: lab.yaml
)");

    auto config = loadMicrolabConfig(mainPath);
    auto devices = loadHardwareDescriptors(config);
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "grbl-primary");
    EXPECT_EQ(devices[1].id, "stirrer");
}

TEST_F(ConfigFileTest, LoadHardwareDescriptors_DuplicateAcrossFilesThrows) {
    writeFile("controller.yaml", R"(
devices:
  - {id: shared, type: grbl, implementation: simulation}
)");
    writeFile("lab.yaml", R"(
devices:
  - {id: shared, type: stirrer, implementation: simulation}
)");
    MicrolabConfig config;
    config.controllerHardware = dir_ / "controller.yaml";
    config.labHardware = dir_ / "lab.yaml";
    EXPECT_THROW((void)loadHardwareDescriptors(config), ConfigError);
}

TEST_F(ConfigFileTest, LoadYamlFile_MissingOrBrokenThrows) {
    EXPECT_THROW((void)loadYamlFile(dir_ / "absent.yaml"), ConfigError);
    auto broken = writeFile("broken.yaml", "devices: [unclosed\n");
    EXPECT_THROW((void)loadYamlFile(broken), ConfigError);
}

// ========== Shipped Configuration Tests ==========

TEST(ShippedConfigTest, SimulationConfig_BuildsHardware) {
    auto config = loadMicrolabConfig(fs::path(MICROLAB_CONFIG_DIR) /
                                     "microlab.yaml");
    auto descriptors = loadHardwareDescriptors(config);

    hardware::HardwareContext context(
        hardware::DeviceRegistry::withBuiltIns(),
        std::make_shared<hardware::SteadyClock>());
    ASSERT_TRUE(context.load(descriptors, config.hardwareSpeedup))
        << context.getLastError().value_or("");
    auto hw = context.get();
    EXPECT_DOUBLE_EQ(hw->getSpeedup(), 10.0);
    ASSERT_TRUE(hw->getPidConfig().has_value());
    EXPECT_DOUBLE_EQ(hw->getPidConfig()->I, 0.5);
    EXPECT_DOUBLE_EQ(hw->getPumpSpeedLimits("Z").maxSpeed, 10.0);
}

TEST(ShippedConfigTest, PhysicalConfigs_PlanWithoutHardware) {
    auto dir = fs::path(MICROLAB_CONFIG_DIR) / "hardware";
    MicrolabConfig config;
    config.controllerHardware =
        dir / "controllerhardware" / "AML-S905X-CC-V1.0A.yaml";
    config.labHardware = dir / "labhardware" / "ftv_microlab_v0.6.0.yaml";
    auto descriptors = loadHardwareDescriptors(config);

    auto registry = hardware::DeviceRegistry::withBuiltIns();
    auto order = hardware::DeviceGraphBuilder(registry).plan(descriptors);
    std::vector<std::string> ids;
    for (const auto* desc : order) {
        ids.push_back(desc->id);
    }
    auto position = [&](const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) - ids.begin();
    };
    EXPECT_LT(position("gpiochip0"), position("gpio-primary"));
    EXPECT_LT(position("gpio-primary"),
              position("reactor-temperature-controller"));
    EXPECT_LT(position("reactor-thermometer"),
              position("reactor-temperature-controller"));
    EXPECT_LT(position("grbl-primary"), position("reactor-reagent-dispenser"));
}
