/*
 * device.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Base class of every device in the hardware graph

*************************************************/

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "hardware/device_descriptor.hpp"
#include "logging/logging.hpp"

namespace microlab::hardware {

class LabDevice {
public:
    LabDevice(std::string id, DeviceType type)
        : id_(std::move(id)), type_(type), logger_(logging::getLogger(id_)) {}

    virtual ~LabDevice() = default;

    LabDevice(const LabDevice&) = delete;
    LabDevice& operator=(const LabDevice&) = delete;

    const std::string& getId() const { return id_; }
    DeviceType getType() const { return type_; }

protected:
    std::string id_;
    DeviceType type_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace microlab::hardware
