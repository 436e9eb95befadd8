/*
 * sim_temp_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Simulated reactor temperature controller

**************************************************/

#ifndef MICROLAB_HARDWARE_SIM_TEMP_CONTROLLER_HPP
#define MICROLAB_HARDWARE_SIM_TEMP_CONTROLLER_HPP

#include <optional>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/temp_controller.hpp"

namespace microlab::hardware {

/**
 * @brief Temperature controller without hardware.
 *
 * Each temperature reading moves the simulated jacket: +1 C while heating,
 * -1 C while cooling, otherwise 0.1 C back toward the 24 C ambient.
 */
class SimulatedTempController : public TempController {
public:
    static constexpr double AMBIENT_TEMPERATURE = 24.0;

    SimulatedTempController(std::string id, double minTemp, double maxTemp,
                            double startTemp,
                            std::optional<PIDConfig> pidConfig);

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<SimulatedTempController>;

    void turnHeaterOn() override;
    void turnHeaterOff() override;
    void turnHeaterPumpOn() override;
    void turnHeaterPumpOff() override;
    void turnCoolerOn() override;
    void turnCoolerOff() override;
    auto getTemp() -> double override;
    auto getMaxTemperature() const -> double override { return maxTemp_; }
    auto getMinTemperature() const -> double override { return minTemp_; }
    auto getPidConfig() const -> std::optional<PIDConfig> override {
        return pidConfig_;
    }

    bool isHeating() const { return heating_; }
    bool isCooling() const { return cooling_; }
    bool isHeaterPumpOn() const { return heaterPump_; }

private:
    double minTemp_;
    double maxTemp_;
    double temperature_;
    std::optional<PIDConfig> pidConfig_;
    bool heating_{false};
    bool cooling_{false};
    bool heaterPump_{false};
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_SIM_TEMP_CONTROLLER_HPP
