/*
 * sim_devices.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sim_devices.hpp"

#include <charconv>

#include "exception/exception.hpp"

namespace microlab::hardware {

SimulatedThermometer::SimulatedThermometer(std::string id, double temperature)
    : Thermometer(std::move(id)), temperature_(temperature) {}

auto SimulatedThermometer::getTemperature() -> double {
    logger_->debug("Temperature read as {:.2f} C", temperature_);
    return temperature_;
}

void SimulatedStirrer::turnStirrerOn() {
    logger_->info("Turning on stirrer");
    stirring_ = true;
}

void SimulatedStirrer::turnStirrerOff() {
    logger_->info("Turning off stirrer");
    stirring_ = false;
}

void SimulatedGrbl::writeGcode(const std::string& command, int /*retries*/) {
    logger_->info("gcode: {}", command);
    history_.push_back(command);
}

SimulatedGpioChip::SimulatedGpioChip(std::string id,
                                     std::map<std::string, int> aliases)
    : GpioChip(std::move(id)), aliases_(std::move(aliases)) {}

auto SimulatedGpioChip::resolve(const std::string& line) const -> int {
    if (auto it = aliases_.find(line); it != aliases_.end()) {
        return it->second;
    }
    int offset = 0;
    const auto* end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(line.data(), end, offset);
    if (ec != std::errc() || ptr != end || offset < 0) {
        THROW_HARDWARE_IO_ERROR("GPIO chip '", id_, "' has no line '", line,
                                "'");
    }
    return offset;
}

void SimulatedGpioChip::setLine(const std::string& line, bool value) {
    int offset = resolve(line);
    logger_->info("Setting line {} ({}) to {}", line, offset, value ? 1 : 0);
    values_[offset] = value;
}

auto SimulatedGpioChip::hasAlias(const std::string& line) const -> bool {
    return aliases_.contains(line);
}

auto SimulatedGpioChip::getLine(const std::string& line) const -> bool {
    auto it = values_.find(resolve(line));
    return it != values_.end() && it->second;
}

}  // namespace microlab::hardware
