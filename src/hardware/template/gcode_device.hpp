/*
 * gcode_device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: G-code motion controller capability (grbl)

*************************************************/

#pragma once

#include <string>

#include "device.hpp"

namespace microlab::hardware {

class GcodeDevice : public LabDevice {
public:
    explicit GcodeDevice(std::string id)
        : LabDevice(std::move(id), DeviceType::GRBL) {}

    ~GcodeDevice() override = default;

    /**
     * @brief Send one G-code command and wait until it is accepted.
     *
     * @param command The raw G-code line, without line terminator.
     * @param retries Number of attempts before giving up.
     * @throws HardwareIOError when every attempt failed.
     */
    virtual void writeGcode(const std::string& command, int retries = 3) = 0;
};

}  // namespace microlab::hardware
