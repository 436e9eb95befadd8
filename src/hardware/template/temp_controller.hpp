/*
 * temp_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-6-1

Description: Reactor jacket temperature controller capability

*************************************************/

#pragma once

#include <optional>

#include "device.hpp"

namespace microlab::hardware {

/**
 * @brief PID tuning read from the controller configuration.
 */
struct PIDConfig {
    double P{0.0};
    double I{0.0};
    double D{0.0};
    bool proportionalOnMeasurement{false};
    bool differentialOnMeasurement{false};

    [[nodiscard]] static auto fromJson(const json& j) -> PIDConfig {
        PIDConfig cfg;
        cfg.P = j.at("P").get<double>();
        cfg.I = j.at("I").get<double>();
        cfg.D = j.at("D").get<double>();
        cfg.proportionalOnMeasurement =
            j.value("proportionalOnMeasurement", false);
        cfg.differentialOnMeasurement =
            j.value("differentialOnMeasurement", false);
        return cfg;
    }
};

/**
 * @brief Read the optional `pidConfig` map of a controller descriptor.
 * @throws ConfigError if present but malformed.
 */
inline auto parsePidConfig(const DeviceDescriptor& descriptor)
    -> std::optional<PIDConfig> {
    if (!descriptor.params.contains("pidConfig") ||
        descriptor.params.at("pidConfig").is_null()) {
        return std::nullopt;
    }
    try {
        return PIDConfig::fromJson(descriptor.params.at("pidConfig"));
    } catch (const json::exception& e) {
        THROW_CONFIG_ERROR("Device '", descriptor.id,
                           "': invalid pidConfig: ", e.what());
    }
}

/**
 * @brief Heats and cools the reactor jacket.
 *
 * Implementations only switch what they are told to; keeping heater and
 * cooler mutually exclusive is the hardware facade's job.
 */
class TempController : public LabDevice {
public:
    explicit TempController(std::string id)
        : LabDevice(std::move(id), DeviceType::TEMP_CONTROLLER) {}

    ~TempController() override = default;

    virtual void turnHeaterOn() = 0;
    virtual void turnHeaterOff() = 0;

    /**
     * @brief Circulation pump moving the heat-exchange fluid past the heater.
     */
    virtual void turnHeaterPumpOn() = 0;
    virtual void turnHeaterPumpOff() = 0;

    virtual void turnCoolerOn() = 0;
    virtual void turnCoolerOff() = 0;

    /**
     * @brief Reactor temperature in Celsius.
     */
    virtual auto getTemp() -> double = 0;

    virtual auto getMaxTemperature() const -> double = 0;
    virtual auto getMinTemperature() const -> double = 0;

    /**
     * @return The PID tuning, or std::nullopt if none is configured.
     */
    virtual auto getPidConfig() const -> std::optional<PIDConfig> = 0;
};

}  // namespace microlab::hardware
