/*
 * hardware.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Hardware facade used by every control task

**************************************************/

#ifndef MICROLAB_HARDWARE_HARDWARE_HPP
#define MICROLAB_HARDWARE_HARDWARE_HPP

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "device_graph.hpp"
#include "template/reagent_dispenser.hpp"
#include "template/stirrer.hpp"
#include "template/temp_controller.hpp"

namespace microlab::hardware {

inline constexpr const char* TEMP_CONTROLLER_ROLE =
    "reactor-temperature-controller";
inline constexpr const char* STIRRER_ROLE = "reactor-stirrer";
inline constexpr const char* REAGENT_DISPENSER_ROLE =
    "reactor-reagent-dispenser";

/**
 * @brief The single control surface of the reactor.
 *
 * Owns the device graph and binds one temperature controller, one stirrer and
 * one reagent dispenser to their roles. Heater and cooler are never on
 * together: turning one on turns the other off first.
 *
 * Time is virtual: uptime() is the elapsed clock time multiplied by the
 * speedup factor and sleep() divides by it.
 */
class MicroLabHardware {
public:
    /**
     * @throws ConfigError if a role is missing or has the wrong capability,
     * or if the speedup is not positive.
     */
    MicroLabHardware(DeviceGraph devices, std::shared_ptr<Clock> clock,
                     std::optional<double> speedup = std::nullopt);

    MicroLabHardware(const MicroLabHardware&) = delete;
    MicroLabHardware& operator=(const MicroLabHardware&) = delete;

    /**
     * @brief Simulated seconds since construction.
     */
    [[nodiscard]] auto uptime() const -> double;

    /**
     * @brief Sleep for `seconds` simulated seconds.
     */
    void sleep(double seconds);

    [[nodiscard]] auto getSpeedup() const -> double { return speedup_; }

    void turnHeaterOn();
    void turnHeaterOff();
    void turnHeaterPumpOn();
    void turnHeaterPumpOff();
    void turnCoolerOn();
    void turnCoolerOff();
    void turnStirrerOn();
    void turnStirrerOff();

    /**
     * @brief Switch off heater, heater pump, cooler and stirrer.
     *
     * Every device is attempted even if an earlier one fails; the first
     * failure is rethrown afterwards.
     */
    void turnOffEverything();

    [[nodiscard]] auto getTemp() -> double;
    [[nodiscard]] auto getPidConfig() const -> std::optional<PIDConfig>;
    [[nodiscard]] auto getMaxTemperature() const -> double;
    [[nodiscard]] auto getMinTemperature() const -> double;

    /**
     * @return The dispense duration reported by the dispenser, in seconds.
     * @throws InvalidPumpError for an unknown pump.
     */
    auto pumpDispense(const std::string& pumpId, double volume,
                      std::optional<double> duration = std::nullopt)
        -> double;

    /**
     * @throws InvalidPumpError for an unknown pump.
     */
    [[nodiscard]] auto getPumpSpeedLimits(const std::string& pumpId) const
        -> PumpSpeedLimits;

private:
    DeviceGraph devices_;
    std::shared_ptr<Clock> clock_;
    double speedup_;
    double startTime_;
    std::shared_ptr<TempController> tempController_;
    std::shared_ptr<Stirrer> stirrer_;
    std::shared_ptr<ReagentDispenser> reagentDispenser_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_HARDWARE_HPP
