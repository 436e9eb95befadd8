/*
 * sim_temp_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sim_temp_controller.hpp"

#include "exception/exception.hpp"

namespace microlab::hardware {

SimulatedTempController::SimulatedTempController(
    std::string id, double minTemp, double maxTemp, double startTemp,
    std::optional<PIDConfig> pidConfig)
    : TempController(std::move(id)),
      minTemp_(minTemp),
      maxTemp_(maxTemp),
      temperature_(startTemp),
      pidConfig_(std::move(pidConfig)) {
    if (minTemp_ >= maxTemp_) {
        THROW_CONFIG_ERROR("Device '", id_, "': minTemp (", minTemp_,
                           ") must be below maxTemp (", maxTemp_, ")");
    }
    logger_->debug("Simulated temperature controller ready at {:.1f} C",
                   temperature_);
}

auto SimulatedTempController::fromDescriptor(
    const DeviceDescriptor& descriptor)
    -> std::shared_ptr<SimulatedTempController> {
    return std::make_shared<SimulatedTempController>(
        descriptor.id, descriptor.require<double>("minTemp"),
        descriptor.require<double>("maxTemp"),
        descriptor.valueOr<double>("temp", AMBIENT_TEMPERATURE),
        parsePidConfig(descriptor));
}

void SimulatedTempController::turnHeaterOn() {
    logger_->info("Turning on heat");
    heating_ = true;
}

void SimulatedTempController::turnHeaterOff() {
    logger_->info("Turning off heat");
    heating_ = false;
}

void SimulatedTempController::turnHeaterPumpOn() {
    logger_->info("Heater pump on");
    heaterPump_ = true;
}

void SimulatedTempController::turnHeaterPumpOff() {
    logger_->info("Heater pump off");
    heaterPump_ = false;
}

void SimulatedTempController::turnCoolerOn() {
    logger_->info("Turning on cooling");
    cooling_ = true;
}

void SimulatedTempController::turnCoolerOff() {
    logger_->info("Turning off cooling");
    cooling_ = false;
}

auto SimulatedTempController::getTemp() -> double {
    double delta = 0.0;
    if (heating_) {
        delta = 1.0;
    } else if (cooling_) {
        delta = -1.0;
    } else if (temperature_ > AMBIENT_TEMPERATURE) {
        delta = -0.1;
    } else if (temperature_ < AMBIENT_TEMPERATURE) {
        delta = 0.1;
    }
    temperature_ += delta;
    logger_->debug("Temperature read as {:.2f} C", temperature_);
    return temperature_;
}

}  // namespace microlab::hardware
