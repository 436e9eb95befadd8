/*
 * gpio_chip.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: GPIO output capability

*************************************************/

#pragma once

#include <string>

#include "device.hpp"

namespace microlab::hardware {

/**
 * @brief A set of GPIO output lines addressed by alias or line number.
 */
class GpioChip : public LabDevice {
public:
    explicit GpioChip(std::string id)
        : LabDevice(std::move(id), DeviceType::GPIO_CHIP) {}

    ~GpioChip() override = default;

    /**
     * @brief Drive an output line.
     * @param line Alias from the chip's lineAliases, or a line number.
     * @throws HardwareIOError if the line cannot be driven.
     */
    virtual void setLine(const std::string& line, bool value) = 0;

    /**
     * @return True if the chip knows the alias.
     */
    virtual auto hasAlias(const std::string& line) const -> bool = 0;
};

}  // namespace microlab::hardware
