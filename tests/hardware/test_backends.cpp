/*
 * test_backends.cpp - Tests for simulated and grbl/GPIO device backends
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "exception/exception.hpp"
#include "hardware/device_graph.hpp"
#include "hardware/device_registry.hpp"
#include "hardware/physical/gcode_pumps.hpp"
#include "hardware/physical/gpio_chips.hpp"
#include "hardware/physical/thermometers.hpp"
#include "hardware/simulation/sim_devices.hpp"
#include "hardware/simulation/sim_reagent_dispenser.hpp"
#include "hardware/simulation/sim_temp_controller.hpp"

using namespace microlab;
using namespace microlab::hardware;
using namespace testing;

namespace {

auto device(const std::string& id, DeviceType type, const std::string& impl,
            json params = json::object()) -> DeviceDescriptor {
    DeviceDescriptor desc;
    desc.id = id;
    desc.type = type;
    desc.implementation = impl;
    desc.params = std::move(params);
    return desc;
}

auto buildWithBuiltIns(const std::vector<DeviceDescriptor>& descriptors)
    -> DeviceGraph {
    static const auto registry = DeviceRegistry::withBuiltIns();
    return DeviceGraphBuilder(registry).build(descriptors);
}

}  // namespace

// ========== Simulated Temperature Controller Tests ==========

TEST(SimulatedTempControllerTest, GetTemp_IdleAtAmbientStaysPut) {
    SimulatedTempController sim("t", -20, 150, 24.0, std::nullopt);
    EXPECT_DOUBLE_EQ(sim.getTemp(), 24.0);
    EXPECT_DOUBLE_EQ(sim.getTemp(), 24.0);
}

TEST(SimulatedTempControllerTest, GetTemp_HeatingAddsOneDegreePerRead) {
    SimulatedTempController sim("t", -20, 150, 24.0, std::nullopt);
    sim.turnHeaterOn();
    EXPECT_DOUBLE_EQ(sim.getTemp(), 25.0);
    EXPECT_DOUBLE_EQ(sim.getTemp(), 26.0);
    sim.turnHeaterOff();
    sim.turnCoolerOn();
    EXPECT_DOUBLE_EQ(sim.getTemp(), 25.0);
}

TEST(SimulatedTempControllerTest, GetTemp_IdleDriftsTowardAmbient) {
    SimulatedTempController hot("hot", -20, 150, 30.0, std::nullopt);
    SimulatedTempController cold("cold", -20, 150, 18.0, std::nullopt);
    EXPECT_NEAR(hot.getTemp(), 29.9, 1e-9);
    EXPECT_NEAR(cold.getTemp(), 18.1, 1e-9);
}

TEST(SimulatedTempControllerTest, Construct_InvertedLimitsThrow) {
    EXPECT_THROW(SimulatedTempController("t", 100, 50, 24.0, std::nullopt),
                 ConfigError);
}

TEST(SimulatedTempControllerTest, FromDescriptor_ReadsLimitsAndPid) {
    auto sim = SimulatedTempController::fromDescriptor(
        device("t", DeviceType::TEMP_CONTROLLER, "simulation",
               {{"minTemp", -20},
                {"maxTemp", 150},
                {"pidConfig",
                 {{"P", 1}, {"I", 0.5}, {"D", 5},
                  {"differentialOnMeasurement", true}}}}));
    EXPECT_DOUBLE_EQ(sim->getMinTemperature(), -20.0);
    EXPECT_DOUBLE_EQ(sim->getMaxTemperature(), 150.0);
    ASSERT_TRUE(sim->getPidConfig().has_value());
    EXPECT_DOUBLE_EQ(sim->getPidConfig()->D, 5.0);
    EXPECT_TRUE(sim->getPidConfig()->differentialOnMeasurement);
    EXPECT_FALSE(sim->getPidConfig()->proportionalOnMeasurement);
    EXPECT_DOUBLE_EQ(sim->getTemp(), 24.0);
}

TEST(SimulatedTempControllerTest, FromDescriptor_MissingLimitThrows) {
    EXPECT_THROW((void)SimulatedTempController::fromDescriptor(device(
                     "t", DeviceType::TEMP_CONTROLLER, "simulation",
                     {{"minTemp", -20}})),
                 ConfigError);
}

TEST(SimulatedTempControllerTest, FromDescriptor_IncompletePidThrows) {
    EXPECT_THROW((void)SimulatedTempController::fromDescriptor(device(
                     "t", DeviceType::TEMP_CONTROLLER, "simulation",
                     {{"minTemp", -20},
                      {"maxTemp", 150},
                      {"pidConfig", {{"P", 1}}}})),
                 ConfigError);
}

// ========== Simulated Reagent Dispenser Tests ==========

TEST(SimulatedReagentDispenserTest, FromDescriptor_Defaults) {
    auto sim = SimulatedReagentDispenser::fromDescriptor(
        device("d", DeviceType::REAGENT_DISPENSER, "simulation"));
    EXPECT_THAT(sim->getPumpIds(), ElementsAre("X", "Y", "Z"));
    auto limits = sim->getPumpSpeedLimits("Y");
    EXPECT_DOUBLE_EQ(limits.minSpeed, 0.1);
    EXPECT_DOUBLE_EQ(limits.maxSpeed, 10.0);
}

TEST(SimulatedReagentDispenserTest, Dispense_ReportsDurationAndTracksVolume) {
    SimulatedReagentDispenser sim("d", {"A"}, {0.5, 2.0});
    EXPECT_DOUBLE_EQ(sim.dispense("A", 4.0), 2.0);
    EXPECT_DOUBLE_EQ(sim.dispense("A", 1.0, 7.0), 7.0);
    EXPECT_DOUBLE_EQ(sim.getDispensedVolume("A"), 5.0);
}

TEST(SimulatedReagentDispenserTest, UnknownPumpThrows) {
    SimulatedReagentDispenser sim("d", {"X"}, {0.1, 10.0});
    EXPECT_THROW((void)sim.dispense("Q", 1.0), InvalidPumpError);
    EXPECT_THROW((void)sim.getPumpSpeedLimits("Q"), InvalidPumpError);
}

TEST(SimulatedReagentDispenserTest, Construct_InvalidRangeThrows) {
    EXPECT_THROW(SimulatedReagentDispenser("d", {"X"}, {5.0, 1.0}),
                 ConfigError);
    EXPECT_THROW(SimulatedReagentDispenser("d", {}, {0.1, 1.0}), ConfigError);
}

// ========== GPIO Tests ==========

TEST(SimulatedGpioChipTest, SetLine_ByAliasAndNumber) {
    SimulatedGpioChip chip("gpio", {{"BCM_17", 8}});
    chip.setLine("BCM_17", true);
    EXPECT_TRUE(chip.getLine("8"));
    chip.setLine("8", false);
    EXPECT_FALSE(chip.getLine("BCM_17"));
    EXPECT_TRUE(chip.hasAlias("BCM_17"));
    EXPECT_FALSE(chip.hasAlias("8"));
    EXPECT_THROW(chip.setLine("BCM_99", true), HardwareIOError);
}

TEST(GpiodChipsetTest, SetLine_RoutesAliasToOwningChip) {
    auto graph = buildWithBuiltIns(
        {device("set", DeviceType::GPIO_CHIP, "gpiod_chipset",
                {{"defaultChipID", "chip1"},
                 {"additionalChips", json::array({"chip0"})}}),
         device("chip1", DeviceType::GPIO_CHIP, "simulation",
                {{"lineAliases", {{"BCM_26", 84}}}}),
         device("chip0", DeviceType::GPIO_CHIP, "simulation",
                {{"lineAliases", {{"BCM_17", 8}}}})});
    auto set = graph.getAs<GpioChip>("set");
    auto chip0 = graph.getAs<SimulatedGpioChip>("chip0");
    auto chip1 = graph.getAs<SimulatedGpioChip>("chip1");

    set->setLine("BCM_17", true);
    set->setLine("BCM_26", true);
    set->setLine("3", true);

    EXPECT_TRUE(chip0->getLine("BCM_17"));
    EXPECT_TRUE(chip1->getLine("BCM_26"));
    EXPECT_TRUE(chip1->getLine("3"));
    EXPECT_FALSE(chip0->getLine("3"));
    EXPECT_TRUE(set->hasAlias("BCM_17"));
    EXPECT_FALSE(set->hasAlias("BCM_2"));
}

TEST(GpioDevicesTest, BasicTempController_DrivesRelayLines) {
    auto graph = buildWithBuiltIns(
        {device("controller", DeviceType::TEMP_CONTROLLER, "basic",
                {{"thermometerID", "probe"},
                 {"gpioID", "gpio"},
                 {"heaterPin", "HEAT"},
                 {"heaterPumpPin", 6},
                 {"coolerPin", "COOL"},
                 {"minTemp", -20},
                 {"maxTemp", 150}}),
         device("probe", DeviceType::THERMOMETER, "simulation",
                {{"temp", 31.5}}),
         device("gpio", DeviceType::GPIO_CHIP, "simulation",
                {{"lineAliases", {{"HEAT", 1}, {"COOL", 2}}}}),
         device("stirrer", DeviceType::STIRRER, "gpio_stirrer",
                {{"gpioID", "gpio"}, {"stirrerPin", "7"}})});
    auto controller = graph.getAs<TempController>("controller");
    auto stirrer = graph.getAs<Stirrer>("stirrer");
    auto gpio = graph.getAs<SimulatedGpioChip>("gpio");

    controller->turnHeaterOn();
    controller->turnHeaterPumpOn();
    stirrer->turnStirrerOn();
    EXPECT_TRUE(gpio->getLine("HEAT"));
    EXPECT_TRUE(gpio->getLine("6"));
    EXPECT_FALSE(gpio->getLine("COOL"));
    EXPECT_TRUE(gpio->getLine("7"));
    EXPECT_DOUBLE_EQ(controller->getTemp(), 31.5);
    EXPECT_FALSE(controller->getPidConfig().has_value());
}

// ========== G-code Pump Tests ==========

class SyringePumpTest : public Test {
protected:
    void SetUp() override {
        graph_ = buildWithBuiltIns(
            {device("grbl", DeviceType::GRBL, "simulation"),
             device("pumps", DeviceType::REAGENT_DISPENSER, "syringepump",
                    {{"grblID", "grbl"},
                     {"syringePumpsConfig",
                      {{"X",
                        {{"mmPerRev", 0.8},
                         {"stepsPerRev", 200},
                         {"mmPerMl", 3.5},
                         {"maxMmPerMin", 240}}}}}}})});
        grbl_ = graph_.getAs<SimulatedGrbl>("grbl");
        pumps_ = graph_.getAs<ReagentDispenser>("pumps");
    }

    DeviceGraph graph_;
    std::shared_ptr<SimulatedGrbl> grbl_;
    std::shared_ptr<ReagentDispenser> pumps_;
};

TEST_F(SyringePumpTest, Construct_WritesAxisSettings) {
    EXPECT_THAT(grbl_->getHistory(),
                ElementsAre("$100=250.000", "$110=240.000"));
}

TEST_F(SyringePumpTest, Dispense_FullSpeedWithoutDuration) {
    double seconds = pumps_->dispense("X", 1.0);
    EXPECT_EQ(grbl_->getHistory().back(), "G91 G1 X3.500 F240.000");
    EXPECT_DOUBLE_EQ(seconds, 3.5 / 240.0 * 60.0);
}

TEST_F(SyringePumpTest, Dispense_FeedMatchesRequestedDuration) {
    double seconds = pumps_->dispense("X", 1.0, 10.0);
    EXPECT_EQ(grbl_->getHistory().back(), "G91 G1 X3.500 F21.000");
    EXPECT_NEAR(seconds, 10.0, 1e-9);
}

TEST_F(SyringePumpTest, Dispense_RepeatedBurstsDoNotAccumulateRounding) {
    const auto limits = pumps_->getPumpSpeedLimits("X");
    const size_t settings = grbl_->getHistory().size();
    double seconds = 0.0;
    for (int i = 0; i < 60; ++i) {
        seconds += pumps_->dispense("X", limits.minSpeed, 1.0);
    }

    const std::string prefix = "G91 G1 X";
    double commandedMm = 0.0;
    const auto& history = grbl_->getHistory();
    ASSERT_GT(history.size(), settings);
    for (size_t i = settings; i < history.size(); ++i) {
        ASSERT_TRUE(history[i].starts_with(prefix)) << history[i];
        commandedMm += std::stod(history[i].substr(prefix.size()));
    }
    EXPECT_NEAR(commandedMm, 1.0, 1e-9);
    EXPECT_NEAR(seconds, 60.0, 1e-6);
}

TEST_F(SyringePumpTest, SpeedLimits_FromFeedRange) {
    auto limits = pumps_->getPumpSpeedLimits("X");
    EXPECT_DOUBLE_EQ(limits.maxSpeed, 240.0 / 60.0 / 3.5);
    EXPECT_DOUBLE_EQ(limits.minSpeed, 1.0 / 60.0 / 3.5);
    EXPECT_THROW((void)pumps_->getPumpSpeedLimits("Y"), InvalidPumpError);
}

TEST(PeristalticPumpTest, SharedFeedAndPerAxisCalibration) {
    auto graph = buildWithBuiltIns(
        {device("grbl", DeviceType::GRBL, "simulation"),
         device("pumps", DeviceType::REAGENT_DISPENSER, "peristalticpump",
                {{"grblID", "grbl"},
                 {"peristalticPumpsConfig",
                  {{"F", 120},
                   {"minF", 6},
                   {"X", {{"mmPerMl", 2}}},
                   {"Y", {{"mmPerMl", 4}}}}}}})});
    auto pumps = graph.getAs<ReagentDispenser>("pumps");
    auto grbl = graph.getAs<SimulatedGrbl>("grbl");

    EXPECT_THAT(pumps->getPumpIds(), ElementsAre("X", "Y"));
    EXPECT_DOUBLE_EQ(pumps->getPumpSpeedLimits("X").maxSpeed, 1.0);
    EXPECT_DOUBLE_EQ(pumps->getPumpSpeedLimits("Y").maxSpeed, 0.5);
    EXPECT_DOUBLE_EQ(pumps->getPumpSpeedLimits("Y").minSpeed, 6.0 / 60 / 4);

    EXPECT_DOUBLE_EQ(pumps->dispense("Y", 1.0), 2.0);
    EXPECT_EQ(grbl->getHistory().back(), "G91 G1 Y4.000 F120.000");
}

TEST(GcodePumpTest, MissingCalibrationThrows) {
    EXPECT_THROW(
        (void)buildWithBuiltIns(
            {device("grbl", DeviceType::GRBL, "simulation"),
             device("pumps", DeviceType::REAGENT_DISPENSER, "syringepump",
                    {{"grblID", "grbl"},
                     {"syringePumpsConfig", {{"X", {{"mmPerMl", 3.5}}}}}})}),
        ConfigError);
}

// ========== Thermometer Tests ==========

TEST(W1ThermometerTest, ParseReading_Valid) {
    const std::string contents =
        "72 01 4b 46 7f ff 0e 10 57 : crc=57 YES\n"
        "72 01 4b 46 7f ff 0e 10 57 t=23125\n";
    EXPECT_DOUBLE_EQ(W1Thermometer::parseReading(contents), 23.125);
}

TEST(W1ThermometerTest, ParseReading_CrcFailureThrows) {
    const std::string contents =
        "72 01 4b 46 7f ff 0e 10 57 : crc=57 NO\n"
        "72 01 4b 46 7f ff 0e 10 57 t=23125\n";
    EXPECT_THROW((void)W1Thermometer::parseReading(contents), HardwareIOError);
}

TEST(W1ThermometerTest, ParseReading_MissingValueThrows) {
    EXPECT_THROW((void)W1Thermometer::parseReading("crc=57 YES\ngarbage\n"),
                 HardwareIOError);
}
