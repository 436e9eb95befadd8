/*
 * test_hardware.cpp - Tests for the MicroLab hardware facade
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include "exception/exception.hpp"
#include "hardware/hardware.hpp"
#include "hardware/io_retry.hpp"
#include "logging/logging.hpp"
#include "support/mock_devices.hpp"

using namespace microlab;
using namespace microlab::hardware;
using namespace microlab::test;
using namespace testing;

class HardwareTest : public Test {
protected:
    MockRig rig_;
};

// ========== Role Binding Tests ==========

TEST_F(HardwareTest, Construct_MissingRoleThrows) {
    DeviceGraph graph;
    graph.add(rig_.temp);
    graph.add(rig_.stirrer);
    EXPECT_THROW(MicroLabHardware(std::move(graph), rig_.clock), ConfigError);
}

TEST_F(HardwareTest, Construct_NonPositiveSpeedupThrows) {
    EXPECT_THROW((void)rig_.makeHardware(0.0), ConfigError);
    EXPECT_THROW((void)rig_.makeHardware(-2.0), ConfigError);
}

// ========== Heater/Cooler Exclusion Tests ==========

TEST_F(HardwareTest, TurnHeaterOn_TurnsCoolerOffFirst) {
    auto hw = rig_.makeHardware();
    InSequence seq;
    EXPECT_CALL(*rig_.temp, turnCoolerOff());
    EXPECT_CALL(*rig_.temp, turnHeaterOn());
    hw->turnHeaterOn();
}

TEST_F(HardwareTest, TurnCoolerOn_TurnsHeaterOffFirst) {
    auto hw = rig_.makeHardware();
    InSequence seq;
    EXPECT_CALL(*rig_.temp, turnHeaterOff());
    EXPECT_CALL(*rig_.temp, turnCoolerOn());
    hw->turnCoolerOn();
}

TEST_F(HardwareTest, TurnOffEverything_SwitchesAllOff) {
    auto hw = rig_.makeHardware();
    EXPECT_CALL(*rig_.temp, turnHeaterOff());
    EXPECT_CALL(*rig_.temp, turnHeaterPumpOff());
    EXPECT_CALL(*rig_.temp, turnCoolerOff());
    EXPECT_CALL(*rig_.stirrer, turnStirrerOff());
    hw->turnOffEverything();
}

TEST_F(HardwareTest, TurnOffEverything_ContinuesPastFailureThenThrows) {
    auto hw = rig_.makeHardware();
    EXPECT_CALL(*rig_.temp, turnHeaterOff())
        .WillOnce(Throw(std::runtime_error("relay stuck")));
    EXPECT_CALL(*rig_.temp, turnHeaterPumpOff());
    EXPECT_CALL(*rig_.temp, turnCoolerOff());
    EXPECT_CALL(*rig_.stirrer, turnStirrerOff());
    EXPECT_THROW(hw->turnOffEverything(), std::runtime_error);
}

// ========== Delegation Tests ==========

TEST_F(HardwareTest, Delegates_ToBoundDevices) {
    auto hw = rig_.makeHardware();
    hardware::PIDConfig pid{1.0, 0.5, 5.0};
    EXPECT_CALL(*rig_.temp, getTemp()).WillOnce(Return(42.0));
    EXPECT_CALL(*rig_.temp, getPidConfig()).WillOnce(Return(pid));
    EXPECT_CALL(*rig_.temp, getMaxTemperature()).WillOnce(Return(150.0));
    EXPECT_CALL(*rig_.temp, getMinTemperature()).WillOnce(Return(-20.0));
    EXPECT_CALL(*rig_.stirrer, turnStirrerOn());
    EXPECT_CALL(*rig_.dispenser,
                dispense("X", 2.0, std::optional<double>(4.0)))
        .WillOnce(Return(4.0));
    EXPECT_CALL(*rig_.dispenser, getPumpSpeedLimits("Y"))
        .WillOnce(Return(PumpSpeedLimits{0.1, 10.0}));

    EXPECT_DOUBLE_EQ(hw->getTemp(), 42.0);
    EXPECT_DOUBLE_EQ(hw->getPidConfig()->I, 0.5);
    EXPECT_DOUBLE_EQ(hw->getMaxTemperature(), 150.0);
    EXPECT_DOUBLE_EQ(hw->getMinTemperature(), -20.0);
    hw->turnStirrerOn();
    EXPECT_DOUBLE_EQ(hw->pumpDispense("X", 2.0, 4.0), 4.0);
    EXPECT_DOUBLE_EQ(hw->getPumpSpeedLimits("Y").maxSpeed, 10.0);
}

// ========== Virtual Clock Tests ==========

TEST_F(HardwareTest, Uptime_MeasuredFromConstruction) {
    rig_.clock->set(100.0);
    auto hw = rig_.makeHardware();
    EXPECT_DOUBLE_EQ(hw->uptime(), 0.0);
    rig_.clock->advance(2.5);
    EXPECT_DOUBLE_EQ(hw->uptime(), 2.5);
}

TEST_F(HardwareTest, Uptime_ScaledBySpeedup) {
    auto hw = rig_.makeHardware(10.0);
    rig_.clock->advance(3.0);
    EXPECT_DOUBLE_EQ(hw->uptime(), 30.0);
    EXPECT_DOUBLE_EQ(hw->getSpeedup(), 10.0);
}

TEST_F(HardwareTest, Sleep_DividedBySpeedup) {
    auto hw = rig_.makeHardware(4.0);
    hw->sleep(8.0);
    ASSERT_EQ(rig_.clock->sleeps.size(), 1u);
    EXPECT_DOUBLE_EQ(rig_.clock->sleeps[0], 2.0);
}

// ========== IO Retry Tests ==========

TEST(IoRetryTest, RetryIO_SucceedsAfterTransientFailures) {
    auto logger = logging::getLogger("retry-test");
    int calls = 0;
    int result = retryIO(logger, "flaky", 3, [&] {
        if (++calls < 3) {
            throw std::runtime_error("busy");
        }
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
}

TEST(IoRetryTest, RetryIO_ExhaustionThrowsHardwareIOError) {
    auto logger = logging::getLogger("retry-test");
    int calls = 0;
    EXPECT_THROW(retryIO(logger, "broken", DEFAULT_IO_RETRIES,
                         [&] {
                             ++calls;
                             throw std::runtime_error("unplugged");
                         }),
                 HardwareIOError);
    EXPECT_EQ(calls, DEFAULT_IO_RETRIES);
}
