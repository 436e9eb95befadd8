/*
 * gpio_devices.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Relay-driven temperature controller and stirrer

**************************************************/

#ifndef MICROLAB_HARDWARE_GPIO_DEVICES_HPP
#define MICROLAB_HARDWARE_GPIO_DEVICES_HPP

#include <memory>
#include <optional>
#include <string>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/gpio_chip.hpp"
#include "hardware/template/stirrer.hpp"
#include "hardware/template/temp_controller.hpp"
#include "hardware/template/thermometer.hpp"

namespace microlab::hardware {

class DeviceGraph;

struct TempControllerPins {
    std::string heater;
    std::string heaterPump;
    std::string cooler;
};

/**
 * @brief Heater, heater pump and cooler relays on GPIO lines, temperature
 * from a separate thermometer.
 */
class BasicTempController : public TempController {
public:
    BasicTempController(std::string id, std::shared_ptr<GpioChip> gpio,
                        std::shared_ptr<Thermometer> thermometer,
                        TempControllerPins pins, double minTemp,
                        double maxTemp, std::optional<PIDConfig> pidConfig);
    ~BasicTempController() override;

    static auto fromDescriptor(const DeviceDescriptor& descriptor,
                               const DeviceGraph& graph)
        -> std::shared_ptr<BasicTempController>;

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

private:
    std::shared_ptr<GpioChip> gpio_;
    std::shared_ptr<Thermometer> thermometer_;
    TempControllerPins pins_;
    double minTemp_;
    double maxTemp_;
    std::optional<PIDConfig> pidConfig_;
};

class GpioStirrer : public Stirrer {
public:
    GpioStirrer(std::string id, std::shared_ptr<GpioChip> gpio,
                std::string pin);
    ~GpioStirrer() override;

    static auto fromDescriptor(const DeviceDescriptor& descriptor,
                               const DeviceGraph& graph)
        -> std::shared_ptr<GpioStirrer>;

    void turnStirrerOn() override;
    void turnStirrerOff() override;

private:
    std::shared_ptr<GpioChip> gpio_;
    std::string pin_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_GPIO_DEVICES_HPP
