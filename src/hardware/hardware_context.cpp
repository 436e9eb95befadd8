/*
 * hardware_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "hardware_context.hpp"

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace microlab::hardware {

auto hardwareStateToString(HardwareState state) -> std::string {
    switch (state) {
        case HardwareState::STARTING: return "STARTING";
        case HardwareState::INITIALIZED: return "INITIALIZED";
        case HardwareState::FAILED_TO_START: return "FAILED_TO_START";
    }
    return "UNKNOWN";
}

HardwareContext::HardwareContext(DeviceRegistry registry,
                                 std::shared_ptr<Clock> clock)
    : registry_(std::move(registry)),
      clock_(std::move(clock)),
      logger_(logging::getLogger("hardware")) {}

HardwareContext::~HardwareContext() {
    std::lock_guard lock(mutex_);
    shutdownCurrent();
}

auto HardwareContext::build(const std::vector<DeviceDescriptor>& descriptors,
                            std::optional<double> speedup)
    -> std::shared_ptr<MicroLabHardware> {
    DeviceGraphBuilder builder(registry_);
    return std::make_shared<MicroLabHardware>(builder.build(descriptors),
                                              clock_, speedup);
}

void HardwareContext::shutdownCurrent() {
    if (!hardware_) {
        return;
    }
    try {
        hardware_->turnOffEverything();
    } catch (const std::exception& e) {
        logger_->error("Hardware did not shut down cleanly: {}", e.what());
    }
    hardware_.reset();
}

// Devices are only released once the last reference to the facade is gone.
bool HardwareContext::rejectIfInUse() {
    if (hardware_.use_count() <= 1) {
        return false;
    }
    logger_->error("Hardware is still in use by {} other holder(s), refusing "
                   "to replace it",
                   hardware_.use_count() - 1);
    lastError_ = "Hardware is still in use, finish running tasks first";
    return true;
}

bool HardwareContext::load(const std::vector<DeviceDescriptor>& descriptors,
                           std::optional<double> speedup) {
    std::lock_guard lock(mutex_);
    if (rejectIfInUse()) {
        return false;
    }
    shutdownCurrent();
    state_ = HardwareState::STARTING;
    lastError_.reset();
    try {
        hardware_ = build(descriptors, speedup);
    } catch (const std::exception& e) {
        logger_->error("Failed to start hardware: {}", e.what());
        state_ = HardwareState::FAILED_TO_START;
        lastError_ = e.what();
        return false;
    }
    descriptors_ = descriptors;
    speedup_ = speedup;
    state_ = HardwareState::INITIALIZED;
    logger_->info("Hardware initialized with {} devices", descriptors.size());
    return true;
}

bool HardwareContext::reload(const std::vector<DeviceDescriptor>& descriptors,
                             std::optional<double> speedup) {
    std::lock_guard lock(mutex_);
    try {
        auto order = DeviceGraphBuilder(registry_).plan(descriptors);
        logger_->debug("Reload plan has {} devices", order.size());
        if (speedup && !(*speedup > 0)) {
            THROW_CONFIG_ERROR("hardwareSpeedup must be positive, got ",
                               *speedup);
        }
    } catch (const std::exception& e) {
        logger_->error("Rejected hardware configuration: {}", e.what());
        lastError_ = e.what();
        return false;
    }

    if (rejectIfInUse()) {
        return false;
    }

    const bool hadPrevious = state_ == HardwareState::INITIALIZED;
    logger_->info("Reloading hardware");
    shutdownCurrent();
    state_ = HardwareState::STARTING;

    try {
        hardware_ = build(descriptors, speedup);
        descriptors_ = descriptors;
        speedup_ = speedup;
        state_ = HardwareState::INITIALIZED;
        lastError_.reset();
        logger_->info("Hardware reloaded with {} devices",
                      descriptors.size());
        return true;
    } catch (const std::exception& e) {
        logger_->error("Failed to build new hardware: {}", e.what());
        lastError_ = e.what();
    }

    if (hadPrevious) {
        try {
            hardware_ = build(descriptors_, speedup_);
            state_ = HardwareState::INITIALIZED;
            logger_->warn("Restored previous hardware configuration");
            return false;
        } catch (const std::exception& e) {
            logger_->error("Failed to restore previous hardware: {}",
                           e.what());
            lastError_ = *lastError_ + "; restoring previous: " + e.what();
        }
    }
    state_ = HardwareState::FAILED_TO_START;
    return false;
}

auto HardwareContext::get() const -> std::shared_ptr<MicroLabHardware> {
    std::lock_guard lock(mutex_);
    return state_ == HardwareState::INITIALIZED ? hardware_ : nullptr;
}

auto HardwareContext::getState() const -> HardwareState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto HardwareContext::getLastError() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return lastError_;
}

}  // namespace microlab::hardware
