/*
 * hardware.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "hardware.hpp"

#include <exception>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace microlab::hardware {

MicroLabHardware::MicroLabHardware(DeviceGraph devices,
                                   std::shared_ptr<Clock> clock,
                                   std::optional<double> speedup)
    : devices_(std::move(devices)),
      clock_(std::move(clock)),
      speedup_(speedup.value_or(1.0)),
      startTime_(clock_->now()),
      logger_(logging::getLogger("hardware")) {
    if (!(speedup_ > 0)) {
        THROW_CONFIG_ERROR("hardwareSpeedup must be positive, got ", speedup_);
    }
    tempController_ = devices_.getAs<TempController>(TEMP_CONTROLLER_ROLE);
    stirrer_ = devices_.getAs<Stirrer>(STIRRER_ROLE);
    reagentDispenser_ = devices_.getAs<ReagentDispenser>(REAGENT_DISPENSER_ROLE);
    if (speedup_ != 1.0) {
        logger_->info("Hardware running at {}x speed", speedup_);
    }
}

auto MicroLabHardware::uptime() const -> double {
    return (clock_->now() - startTime_) * speedup_;
}

void MicroLabHardware::sleep(double seconds) {
    clock_->sleepFor(seconds / speedup_);
}

void MicroLabHardware::turnHeaterOn() {
    tempController_->turnCoolerOff();
    tempController_->turnHeaterOn();
}

void MicroLabHardware::turnHeaterOff() { tempController_->turnHeaterOff(); }

void MicroLabHardware::turnHeaterPumpOn() {
    tempController_->turnHeaterPumpOn();
}

void MicroLabHardware::turnHeaterPumpOff() {
    tempController_->turnHeaterPumpOff();
}

void MicroLabHardware::turnCoolerOn() {
    tempController_->turnHeaterOff();
    tempController_->turnCoolerOn();
}

void MicroLabHardware::turnCoolerOff() { tempController_->turnCoolerOff(); }

void MicroLabHardware::turnStirrerOn() { stirrer_->turnStirrerOn(); }

void MicroLabHardware::turnStirrerOff() { stirrer_->turnStirrerOff(); }

void MicroLabHardware::turnOffEverything() {
    logger_->info("Turning off all hardware");
    std::exception_ptr firstFailure;
    auto attempt = [&](const char* what, auto&& action) {
        try {
            action();
        } catch (const std::exception& e) {
            logger_->error("Failed to turn off {}: {}", what, e.what());
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    };
    attempt("heater", [this] { tempController_->turnHeaterOff(); });
    attempt("heater pump", [this] { tempController_->turnHeaterPumpOff(); });
    attempt("cooler", [this] { tempController_->turnCoolerOff(); });
    attempt("stirrer", [this] { stirrer_->turnStirrerOff(); });
    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
}

auto MicroLabHardware::getTemp() -> double {
    return tempController_->getTemp();
}

auto MicroLabHardware::getPidConfig() const -> std::optional<PIDConfig> {
    return tempController_->getPidConfig();
}

auto MicroLabHardware::getMaxTemperature() const -> double {
    return tempController_->getMaxTemperature();
}

auto MicroLabHardware::getMinTemperature() const -> double {
    return tempController_->getMinTemperature();
}

auto MicroLabHardware::pumpDispense(const std::string& pumpId, double volume,
                                    std::optional<double> duration)
    -> double {
    return reagentDispenser_->dispense(pumpId, volume, duration);
}

auto MicroLabHardware::getPumpSpeedLimits(const std::string& pumpId) const
    -> PumpSpeedLimits {
    return reagentDispenser_->getPumpSpeedLimits(pumpId);
}

}  // namespace microlab::hardware
