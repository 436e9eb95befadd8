/*
 * stirrer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Stirrer capability

*************************************************/

#pragma once

#include "device.hpp"

namespace microlab::hardware {

class Stirrer : public LabDevice {
public:
    explicit Stirrer(std::string id)
        : LabDevice(std::move(id), DeviceType::STIRRER) {}

    ~Stirrer() override = default;

    virtual void turnStirrerOn() = 0;
    virtual void turnStirrerOff() = 0;
};

}  // namespace microlab::hardware
