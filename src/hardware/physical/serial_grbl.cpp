/*
 * serial_grbl.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "serial_grbl.hpp"

#include <cctype>
#include <sstream>
#include <thread>

#include "exception/exception.hpp"
#include "hardware/io_retry.hpp"

namespace microlab::hardware {

SerialGrbl::SerialGrbl(std::string id, const std::string& port, int baudRate,
                       std::chrono::milliseconds replyTimeout,
                       std::chrono::milliseconds wakeDelay)
    : GcodeDevice(std::move(id)),
      port_(std::make_unique<SerialPort>(port, baudRate)),
      replyTimeout_(replyTimeout) {
    // Wake grbl up and drop its startup banner.
    port_->writeLine("\r\n");
    std::this_thread::sleep_for(wakeDelay);
    port_->flushInput();
    logger_->info("Connected to grbl on {}", port);
}

auto SerialGrbl::fromDescriptor(const DeviceDescriptor& descriptor)
    -> std::shared_ptr<SerialGrbl> {
    return std::make_shared<SerialGrbl>(
        descriptor.id, descriptor.require<std::string>("grblPort"),
        descriptor.valueOr<int>("baudRate", DEFAULT_BAUD_RATE));
}

auto SerialGrbl::isMotionCommand(const std::string& command) -> bool {
    std::istringstream words(command);
    std::string word;
    while (words >> word) {
        if (word.size() < 2 ||
            std::toupper(static_cast<unsigned char>(word[0])) != 'G') {
            continue;
        }
        std::string number = word.substr(1);
        number.erase(0, number.find_first_not_of('0'));
        if (number.empty() || number == "1") {
            return true;
        }
    }
    return false;
}

void SerialGrbl::sendOnce(const std::string& command, bool motion) {
    port_->writeLine(command);
    while (true) {
        auto reply = port_->readLine(replyTimeout_);
        if (!reply) {
            if (motion) {
                THROW_HARDWARE_FAULT_ERROR("No reply from grbl to '", command,
                                           "', not resending a move");
            }
            THROW_HARDWARE_IO_ERROR("No reply from grbl to '", command, "'");
        }
        if (*reply == "ok") {
            return;
        }
        if (reply->starts_with("ALARM:")) {
            THROW_HARDWARE_FAULT_ERROR("grbl raised ", *reply, " on '",
                                       command, "'");
        }
        if (reply->starts_with("error:")) {
            THROW_HARDWARE_IO_ERROR("grbl rejected '", command, "': ", *reply);
        }
        // Status or feedback messages, keep waiting for the acknowledgement.
        logger_->debug("grbl: {}", *reply);
    }
}

void SerialGrbl::writeGcode(const std::string& command, int retries) {
    logger_->info("gcode: {}", command);
    const bool motion = isMotionCommand(command);
    retryIO(logger_, "gcode '" + command + "'", retries,
            [&] { sendOnce(command, motion); });
}

}  // namespace microlab::hardware
