/*
 * serial_grbl.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Grbl motion controller on a serial port

**************************************************/

#ifndef MICROLAB_HARDWARE_SERIAL_GRBL_HPP
#define MICROLAB_HARDWARE_SERIAL_GRBL_HPP

#include <chrono>
#include <memory>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/gcode_device.hpp"
#include "serial_port.hpp"

namespace microlab::hardware {

class SerialGrbl : public GcodeDevice {
public:
    static constexpr int DEFAULT_BAUD_RATE = 115200;
    static constexpr std::chrono::milliseconds REPLY_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds WAKE_DELAY{2000};

    SerialGrbl(std::string id, const std::string& port, int baudRate,
               std::chrono::milliseconds replyTimeout = REPLY_TIMEOUT,
               std::chrono::milliseconds wakeDelay = WAKE_DELAY);

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<SerialGrbl>;

    /**
     * @brief Send one command and wait for `ok`.
     *
     * A failed write or an `error:` reply means grbl did not run the line,
     * so the command is sent again. A missing reply to a motion command may
     * only mean the `ok` was late, and an `ALARM:` halts grbl; neither is
     * retried.
     * @throws HardwareFaultError on an alarm or an unacknowledged move.
     * @throws HardwareIOError once `retries` attempts have failed.
     */
    void writeGcode(const std::string& command, int retries = 3) override;

    /**
     * @brief Whether `command` moves an axis (a G0 or G1 word).
     */
    static auto isMotionCommand(const std::string& command) -> bool;

private:
    void sendOnce(const std::string& command, bool motion);

    std::unique_ptr<SerialPort> port_;
    std::chrono::milliseconds replyTimeout_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_SERIAL_GRBL_HPP
