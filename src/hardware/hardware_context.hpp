/*
 * hardware_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Owner of the process-wide hardware facade

**************************************************/

#ifndef MICROLAB_HARDWARE_HARDWARE_CONTEXT_HPP
#define MICROLAB_HARDWARE_HARDWARE_CONTEXT_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "device_descriptor.hpp"
#include "device_registry.hpp"
#include "hardware.hpp"

namespace microlab::hardware {

enum class HardwareState { STARTING, INITIALIZED, FAILED_TO_START };

[[nodiscard]] auto hardwareStateToString(HardwareState state) -> std::string;

/**
 * @brief Holds the current MicroLabHardware and swaps it on reload.
 *
 * Loads never fail by throwing; the outcome is reported through getState()
 * and getLastError(). Callers must not run a task while a reload is in
 * progress.
 */
class HardwareContext {
public:
    HardwareContext(DeviceRegistry registry, std::shared_ptr<Clock> clock);
    ~HardwareContext();

    HardwareContext(const HardwareContext&) = delete;
    HardwareContext& operator=(const HardwareContext&) = delete;

    /**
     * @brief Build the hardware for the first time.
     *
     * Like reload(), refused while the current hardware is still held.
     * @return true if the hardware is INITIALIZED.
     */
    bool load(const std::vector<DeviceDescriptor>& descriptors,
              std::optional<double> speedup = std::nullopt);

    /**
     * @brief Replace the hardware with a new device set.
     *
     * The new descriptors are validated before anything is touched, so an
     * invalid configuration leaves the current hardware running. Otherwise
     * the current hardware is switched off and destroyed before the new
     * devices are built; if that build fails the previous configuration is
     * built again.
     *
     * A reload is refused while any caller still holds the hardware returned
     * by get(), since its devices cannot be released until that reference is
     * dropped.
     *
     * @return true if the new configuration is in place.
     */
    bool reload(const std::vector<DeviceDescriptor>& descriptors,
                std::optional<double> speedup = std::nullopt);

    /**
     * @return The current hardware, nullptr unless INITIALIZED.
     */
    [[nodiscard]] auto get() const -> std::shared_ptr<MicroLabHardware>;

    [[nodiscard]] auto getState() const -> HardwareState;
    [[nodiscard]] auto getLastError() const -> std::optional<std::string>;

private:
    auto build(const std::vector<DeviceDescriptor>& descriptors,
               std::optional<double> speedup)
        -> std::shared_ptr<MicroLabHardware>;
    void shutdownCurrent();
    bool rejectIfInUse();

    DeviceRegistry registry_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::shared_ptr<MicroLabHardware> hardware_;
    HardwareState state_{HardwareState::STARTING};
    std::optional<std::string> lastError_;
    std::vector<DeviceDescriptor> descriptors_;
    std::optional<double> speedup_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_HARDWARE_CONTEXT_HPP
