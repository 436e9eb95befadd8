/*
 * gcode_pumps.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Syringe and peristaltic pumps driven through grbl

**************************************************/

#ifndef MICROLAB_HARDWARE_GCODE_PUMPS_HPP
#define MICROLAB_HARDWARE_GCODE_PUMPS_HPP

#include <map>
#include <memory>
#include <string>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/gcode_device.hpp"
#include "hardware/template/reagent_dispenser.hpp"

namespace microlab::hardware {

class DeviceGraph;

/**
 * @brief Calibration of one grbl axis driving a pump.
 */
struct PumpAxis {
    double mmPerMl{0.0};
    double minMmPerMin{1.0};
    double maxMmPerMin{0.0};
};

/**
 * @brief Reagent dispenser whose pumps are grbl axes.
 *
 * A dispense of `volume` ml moves the axis `volume * mmPerMl` mm with a
 * relative `G91 G1` move. Without a target duration the axis runs at its
 * maximum feed rate; with one the feed rate is chosen to match it, clamped
 * to the axis range.
 *
 * Moves are sent with 0.001 mm resolution. Each axis remembers how far it
 * was asked to travel and how far it was commanded, and every move sends the
 * rounded difference, so rounding never accumulates across repeated small
 * dispenses.
 */
class GcodePumpDispenser : public ReagentDispenser {
public:
    GcodePumpDispenser(std::string id, std::shared_ptr<GcodeDevice> grbl,
                       std::map<std::string, PumpAxis> axes);

    auto dispense(const std::string& pumpId, double volume,
                  std::optional<double> duration = std::nullopt)
        -> double override;
    auto getPumpSpeedLimits(const std::string& pumpId) const
        -> PumpSpeedLimits override;
    auto getPumpIds() const -> std::vector<std::string> override;

    /**
     * @brief G-code for one move, `G91 G1 <axis><mm> F<feed>`.
     */
    static auto makeMoveCommand(const std::string& axis, double mm,
                                double feed) -> std::string;

    /**
     * @brief Round a distance to the resolution of a move command.
     */
    static auto roundToResolution(double mm) -> double;

protected:
    auto axis(const std::string& pumpId) const -> const PumpAxis&;

    struct AxisTravel {
        double requestedMm{0.0};
        double commandedMm{0.0};
    };

    std::shared_ptr<GcodeDevice> grbl_;
    std::map<std::string, PumpAxis> axes_;
    std::map<std::string, AxisTravel> travel_;
};

/**
 * @brief Lead-screw syringe pumps.
 *
 * `syringePumpsConfig` maps each axis to
 * `{mmPerRev, stepsPerRev, mmPerMl, maxMmPerMin, minMmPerMin?}`. The steps
 * per mm and max rate of every axis are written to grbl's settings on
 * construction.
 */
class SyringePump : public GcodePumpDispenser {
public:
    static auto fromDescriptor(const DeviceDescriptor& descriptor,
                               const DeviceGraph& graph)
        -> std::shared_ptr<SyringePump>;

    SyringePump(std::string id, std::shared_ptr<GcodeDevice> grbl,
                std::map<std::string, PumpAxis> axes,
                const std::map<std::string, double>& stepsPerMm);
};

/**
 * @brief Peristaltic pumps sharing one maximum feed rate.
 *
 * `peristalticPumpsConfig` holds `F` (max mm/min), optional `minF` and one
 * `{mmPerMl}` map per axis.
 */
class PeristalticPump : public GcodePumpDispenser {
public:
    using GcodePumpDispenser::GcodePumpDispenser;

    static auto fromDescriptor(const DeviceDescriptor& descriptor,
                               const DeviceGraph& graph)
        -> std::shared_ptr<PeristalticPump>;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_GCODE_PUMPS_HPP
