/*
 * sim_devices.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Simulated thermometer, stirrer, grbl and GPIO chip

**************************************************/

#ifndef MICROLAB_HARDWARE_SIM_DEVICES_HPP
#define MICROLAB_HARDWARE_SIM_DEVICES_HPP

#include <map>
#include <string>
#include <vector>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/gcode_device.hpp"
#include "hardware/template/gpio_chip.hpp"
#include "hardware/template/stirrer.hpp"
#include "hardware/template/thermometer.hpp"

namespace microlab::hardware {

class SimulatedThermometer : public Thermometer {
public:
    SimulatedThermometer(std::string id, double temperature);

    auto getTemperature() -> double override;
    void setTemperature(double temperature) { temperature_ = temperature; }

private:
    double temperature_;
};

class SimulatedStirrer : public Stirrer {
public:
    explicit SimulatedStirrer(std::string id) : Stirrer(std::move(id)) {}

    void turnStirrerOn() override;
    void turnStirrerOff() override;
    bool isStirring() const { return stirring_; }

private:
    bool stirring_{false};
};

/**
 * @brief Grbl controller that accepts and records every command.
 */
class SimulatedGrbl : public GcodeDevice {
public:
    explicit SimulatedGrbl(std::string id) : GcodeDevice(std::move(id)) {}

    void writeGcode(const std::string& command, int retries = 3) override;
    auto getHistory() const -> const std::vector<std::string>& {
        return history_;
    }

private:
    std::vector<std::string> history_;
};

/**
 * @brief GPIO chip that keeps line values in memory.
 */
class SimulatedGpioChip : public GpioChip {
public:
    SimulatedGpioChip(std::string id, std::map<std::string, int> aliases);

    void setLine(const std::string& line, bool value) override;
    auto hasAlias(const std::string& line) const -> bool override;

    /**
     * @return The last value written to the line, false if never written.
     */
    auto getLine(const std::string& line) const -> bool;

private:
    auto resolve(const std::string& line) const -> int;

    std::map<std::string, int> aliases_;
    std::map<int, bool> values_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_SIM_DEVICES_HPP
