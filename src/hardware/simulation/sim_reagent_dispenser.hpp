/*
 * sim_reagent_dispenser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Simulated multi-channel reagent dispenser

**************************************************/

#ifndef MICROLAB_HARDWARE_SIM_REAGENT_DISPENSER_HPP
#define MICROLAB_HARDWARE_SIM_REAGENT_DISPENSER_HPP

#include <vector>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/reagent_dispenser.hpp"

namespace microlab::hardware {

/**
 * @brief Dispenser that reports dispense durations without moving anything.
 *
 * Every channel shares one speed range. A dispense without a target duration
 * runs at maxSpeed.
 */
class SimulatedReagentDispenser : public ReagentDispenser {
public:
    SimulatedReagentDispenser(std::string id, std::vector<std::string> pumps,
                              PumpSpeedLimits limits);

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<SimulatedReagentDispenser>;

    auto dispense(const std::string& pumpId, double volume,
                  std::optional<double> duration = std::nullopt)
        -> double override;
    auto getPumpSpeedLimits(const std::string& pumpId) const
        -> PumpSpeedLimits override;
    auto getPumpIds() const -> std::vector<std::string> override {
        return pumps_;
    }

    /// Total volume dispensed per channel since construction.
    auto getDispensedVolume(const std::string& pumpId) const -> double;

private:
    void checkPump(const std::string& pumpId) const;

    std::vector<std::string> pumps_;
    PumpSpeedLimits limits_;
    std::vector<double> dispensed_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_SIM_REAGENT_DISPENSER_HPP
