/*
 * thermometer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Thermometer capability

*************************************************/

#pragma once

#include "device.hpp"

namespace microlab::hardware {

class Thermometer : public LabDevice {
public:
    explicit Thermometer(std::string id)
        : LabDevice(std::move(id), DeviceType::THERMOMETER) {}

    ~Thermometer() override = default;

    /**
     * @brief Read the current temperature in Celsius.
     * @throws HardwareIOError if the sensor cannot be read.
     */
    virtual auto getTemperature() -> double = 0;
};

}  // namespace microlab::hardware
