/*
 * reagent_dispenser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Reagent dispenser capability

*************************************************/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "device.hpp"

namespace microlab::hardware {

/**
 * @brief Speed range of one pump channel, in ml/s.
 */
struct PumpSpeedLimits {
    double minSpeed{0.0};
    double maxSpeed{0.0};
};

class ReagentDispenser : public LabDevice {
public:
    explicit ReagentDispenser(std::string id)
        : LabDevice(std::move(id), DeviceType::REAGENT_DISPENSER) {}

    ~ReagentDispenser() override = default;

    /**
     * @brief Dispense a volume from one pump.
     *
     * @param pumpId Pump channel, e.g. "X".
     * @param volume Volume in ml.
     * @param duration Requested dispense duration in seconds. Without it the
     * pump runs at its maximum speed.
     * @return How long the dispense takes, in seconds.
     * @throws InvalidPumpError if the channel does not exist.
     * @throws HardwareIOError if the pump cannot be driven.
     */
    virtual auto dispense(const std::string& pumpId, double volume,
                          std::optional<double> duration = std::nullopt)
        -> double = 0;

    /**
     * @throws InvalidPumpError if the channel does not exist.
     */
    virtual auto getPumpSpeedLimits(const std::string& pumpId) const
        -> PumpSpeedLimits = 0;

    virtual auto getPumpIds() const -> std::vector<std::string> = 0;
};

}  // namespace microlab::hardware
