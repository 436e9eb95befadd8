/*
 * gpio_devices.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gpio_devices.hpp"

#include "exception/exception.hpp"
#include "hardware/device_graph.hpp"

namespace microlab::hardware {

namespace {

// A pin is a line alias or a raw line number.
auto pinParam(const DeviceDescriptor& descriptor, const std::string& key)
    -> std::string {
    if (descriptor.params.contains(key) &&
        descriptor.params.at(key).is_number_integer()) {
        return std::to_string(descriptor.params.at(key).get<long long>());
    }
    return descriptor.require<std::string>(key);
}

}  // namespace

BasicTempController::BasicTempController(
    std::string id, std::shared_ptr<GpioChip> gpio,
    std::shared_ptr<Thermometer> thermometer, TempControllerPins pins,
    double minTemp, double maxTemp, std::optional<PIDConfig> pidConfig)
    : TempController(std::move(id)),
      gpio_(std::move(gpio)),
      thermometer_(std::move(thermometer)),
      pins_(std::move(pins)),
      minTemp_(minTemp),
      maxTemp_(maxTemp),
      pidConfig_(std::move(pidConfig)) {
    if (minTemp_ >= maxTemp_) {
        THROW_CONFIG_ERROR("Device '", id_, "': minTemp (", minTemp_,
                           ") must be below maxTemp (", maxTemp_, ")");
    }
    // Start from a known state.
    gpio_->setLine(pins_.heater, false);
    gpio_->setLine(pins_.heaterPump, false);
    gpio_->setLine(pins_.cooler, false);
}

BasicTempController::~BasicTempController() {
    try {
        gpio_->setLine(pins_.heater, false);
        gpio_->setLine(pins_.heaterPump, false);
        gpio_->setLine(pins_.cooler, false);
    } catch (const std::exception& e) {
        logger_->error("Failed to switch relays off on shutdown: {}",
                       e.what());
    }
}

auto BasicTempController::fromDescriptor(const DeviceDescriptor& descriptor,
                                         const DeviceGraph& graph)
    -> std::shared_ptr<BasicTempController> {
    auto gpio =
        graph.getAs<GpioChip>(descriptor.require<std::string>("gpioID"));
    auto thermometer = graph.getAs<Thermometer>(
        descriptor.require<std::string>("thermometerID"));
    TempControllerPins pins{pinParam(descriptor, "heaterPin"),
                            pinParam(descriptor, "heaterPumpPin"),
                            pinParam(descriptor, "coolerPin")};
    return std::make_shared<BasicTempController>(
        descriptor.id, std::move(gpio), std::move(thermometer),
        std::move(pins), descriptor.require<double>("minTemp"),
        descriptor.require<double>("maxTemp"), parsePidConfig(descriptor));
}

void BasicTempController::turnHeaterOn() {
    logger_->info("Turning on heat");
    gpio_->setLine(pins_.heater, true);
}

void BasicTempController::turnHeaterOff() {
    logger_->info("Turning off heat");
    gpio_->setLine(pins_.heater, false);
}

void BasicTempController::turnHeaterPumpOn() {
    logger_->info("Heater pump on");
    gpio_->setLine(pins_.heaterPump, true);
}

void BasicTempController::turnHeaterPumpOff() {
    logger_->info("Heater pump off");
    gpio_->setLine(pins_.heaterPump, false);
}

void BasicTempController::turnCoolerOn() {
    logger_->info("Turning on cooling");
    gpio_->setLine(pins_.cooler, true);
}

void BasicTempController::turnCoolerOff() {
    logger_->info("Turning off cooling");
    gpio_->setLine(pins_.cooler, false);
}

auto BasicTempController::getTemp() -> double {
    return thermometer_->getTemperature();
}

GpioStirrer::GpioStirrer(std::string id, std::shared_ptr<GpioChip> gpio,
                         std::string pin)
    : Stirrer(std::move(id)), gpio_(std::move(gpio)), pin_(std::move(pin)) {
    gpio_->setLine(pin_, false);
}

GpioStirrer::~GpioStirrer() {
    try {
        gpio_->setLine(pin_, false);
    } catch (const std::exception& e) {
        logger_->error("Failed to stop stirrer on shutdown: {}", e.what());
    }
}

auto GpioStirrer::fromDescriptor(const DeviceDescriptor& descriptor,
                                 const DeviceGraph& graph)
    -> std::shared_ptr<GpioStirrer> {
    return std::make_shared<GpioStirrer>(
        descriptor.id,
        graph.getAs<GpioChip>(descriptor.require<std::string>("gpioID")),
        pinParam(descriptor, "stirrerPin"));
}

void GpioStirrer::turnStirrerOn() {
    logger_->info("Turning on stirrer");
    gpio_->setLine(pin_, true);
}

void GpioStirrer::turnStirrerOff() {
    logger_->info("Turning off stirrer");
    gpio_->setLine(pin_, false);
}

}  // namespace microlab::hardware
