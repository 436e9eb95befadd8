/*
 * test_pump_task.cpp - Tests for rate-limited dispensing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <numeric>

#include "exception/exception.hpp"
#include "support/mock_devices.hpp"
#include "task/pump_task.hpp"

using namespace microlab;
using namespace microlab::task;
using namespace microlab::test;
using namespace testing;

class PumpTaskTest : public Test {
protected:
    void SetUp() override {
        hardware_ = rig_.makeHardware();
        ON_CALL(*rig_.dispenser, dispense(_, _, _))
            .WillByDefault([this](const std::string&, double volume,
                                  std::optional<double> duration) {
                volumes_.push_back(volume);
                return duration.value_or(0.0);
            });
    }

    void setLimits(double minSpeed, double maxSpeed) {
        ON_CALL(*rig_.dispenser, getPumpSpeedLimits("X"))
            .WillByDefault(Return(hardware::PumpSpeedLimits{minSpeed, maxSpeed}));
    }

    // Pull until Done and return every wait.
    auto drain(PumpTask& task) -> std::vector<double> {
        std::vector<double> waits;
        for (int i = 0; i < 100; ++i) {
            auto signal = task.next();
            if (signal.isDone()) {
                return waits;
            }
            waits.push_back(signal.duration);
        }
        ADD_FAILURE() << "pump task never finished";
        return waits;
    }

    auto dispensedTotal() const -> double {
        return std::accumulate(volumes_.begin(), volumes_.end(), 0.0);
    }

    MockRig rig_;
    std::shared_ptr<hardware::MicroLabHardware> hardware_;
    std::vector<double> volumes_;
};

// ========== Single Dispense Tests ==========

TEST_F(PumpTaskTest, NoTime_DispensesAtFullSpeed) {
    setLimits(0.1, 10.0);
    EXPECT_CALL(*rig_.dispenser, dispense("X", 2.0, Eq(std::nullopt)))
        .WillOnce(Return(0.2));

    PumpTask task(hardware_, "X", 2.0);
    EXPECT_THAT(drain(task), ElementsAre(DoubleEq(0.2)));
}

TEST_F(PumpTaskTest, InRange_SingleCallTargetsTime) {
    setLimits(0.1, 10.0);
    EXPECT_CALL(*rig_.dispenser, dispense("X", 5.0, Optional(10.0)))
        .WillOnce(Return(10.0));

    PumpTask task(hardware_, "X", 5.0, 10.0);
    EXPECT_THAT(drain(task), ElementsAre(DoubleEq(10.0)));
}

TEST_F(PumpTaskTest, OverRange_FallsBackToFullSpeed) {
    setLimits(0.1, 10.0);
    EXPECT_CALL(*rig_.dispenser, dispense("X", 100.0, Eq(std::nullopt)))
        .WillOnce(Return(10.0));

    PumpTask task(hardware_, "X", 100.0, 1.0);
    EXPECT_THAT(drain(task), ElementsAre(DoubleEq(10.0)));
}

// ========== Burst Dispense Tests ==========

TEST_F(PumpTaskTest, UnderRange_TenBurstsThenRemainder) {
    setLimits(0.1, 10.0);

    PumpTask task(hardware_, "X", 1.0, 100.0);
    auto waits = drain(task);

    ASSERT_EQ(waits.size(), 11u);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_NEAR(waits[i], 9.0, 1e-9) << "burst " << i;
    }
    EXPECT_NEAR(waits.back(), 0.0, 1e-6);
    EXPECT_NEAR(dispensedTotal(), 1.0, 1e-6);
}

TEST_F(PumpTaskTest, UnderRange_FractionalRemainder) {
    setLimits(2.0, 5.0);

    PumpTask task(hardware_, "X", 5.0, 4.0);
    auto waits = drain(task);

    EXPECT_THAT(waits, ElementsAre(DoubleNear(0.6, 1e-9), DoubleNear(0.6, 1e-9),
                                   DoubleNear(0.8, 1e-9)));
    EXPECT_THAT(volumes_, ElementsAre(DoubleNear(2.0, 1e-9),
                                      DoubleNear(2.0, 1e-9),
                                      DoubleNear(1.0, 1e-9)));
}

TEST_F(PumpTaskTest, UnderRange_BurstsRunAtMinimumSpeed) {
    setLimits(2.0, 5.0);
    EXPECT_CALL(*rig_.dispenser, dispense("X", DoubleNear(2.0, 1e-9),
                                          Optional(DoubleEq(1.0))))
        .Times(2);
    EXPECT_CALL(*rig_.dispenser, dispense("X", DoubleNear(1.0, 1e-9),
                                          Optional(DoubleNear(0.5, 1e-9))))
        .Times(1);

    PumpTask task(hardware_, "X", 5.0, 4.0);
    drain(task);
}

TEST_F(PumpTaskTest, UnderRange_WaitSubtractsBurstExecutionTime) {
    setLimits(0.1, 10.0);
    ON_CALL(*rig_.dispenser, dispense(_, _, _))
        .WillByDefault([this](const std::string&, double volume,
                              std::optional<double>) {
            volumes_.push_back(volume);
            rig_.clock->advance(0.25);
            return 1.0;
        });

    PumpTask task(hardware_, "X", 0.2, 20.0);
    auto waits = drain(task);

    ASSERT_GE(waits.size(), 2u);
    EXPECT_NEAR(waits[0], 8.75, 1e-9);
    EXPECT_NEAR(waits[1], 8.75, 1e-9);
    EXPECT_NEAR(dispensedTotal(), 0.2, 1e-6);
}

// ========== Error Tests ==========

TEST_F(PumpTaskTest, UnknownPump_ReportedOnFirstPull) {
    ON_CALL(*rig_.dispenser, getPumpSpeedLimits("Q"))
        .WillByDefault([](const std::string& pump) -> hardware::PumpSpeedLimits {
            THROW_INVALID_PUMP_ERROR("No pump '", pump, "'");
        });
    EXPECT_CALL(*rig_.dispenser, dispense(_, _, _)).Times(0);

    PumpTask task(hardware_, "Q", 1.0, 10.0);
    EXPECT_THROW((void)task.next(), InvalidPumpError);
    EXPECT_EQ(task.getState(), TaskState::Exhausted);
}
