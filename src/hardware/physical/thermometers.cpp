/*
 * thermometers.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "thermometers.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

#include "exception/exception.hpp"
#include "hardware/io_retry.hpp"

namespace microlab::hardware {

namespace {

auto parseDouble(std::string_view text) -> std::optional<double> {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

W1Thermometer::W1Thermometer(std::string id, std::string sensorPath)
    : Thermometer(std::move(id)), sensorPath_(std::move(sensorPath)) {
    std::ifstream probe(sensorPath_);
    if (!probe) {
        THROW_HARDWARE_IO_ERROR("Cannot open 1-Wire sensor ", sensorPath_);
    }
}

auto W1Thermometer::fromDescriptor(const DeviceDescriptor& descriptor)
    -> std::shared_ptr<W1Thermometer> {
    return std::make_shared<W1Thermometer>(
        descriptor.id, descriptor.require<std::string>("sensorPath"));
}

auto W1Thermometer::parseReading(const std::string& contents) -> double {
    std::istringstream stream(contents);
    std::string crcLine;
    std::string dataLine;
    std::getline(stream, crcLine);
    std::getline(stream, dataLine);
    if (!crcLine.ends_with("YES")) {
        THROW_HARDWARE_IO_ERROR("1-Wire CRC check failed: '", crcLine, "'");
    }
    auto pos = dataLine.find("t=");
    if (pos == std::string::npos) {
        THROW_HARDWARE_IO_ERROR("1-Wire reading has no temperature: '",
                                dataLine, "'");
    }
    auto milli = parseDouble(std::string_view(dataLine).substr(pos + 2));
    if (!milli) {
        THROW_HARDWARE_IO_ERROR("1-Wire temperature is not a number: '",
                                dataLine, "'");
    }
    return *milli / 1000.0;
}

auto W1Thermometer::getTemperature() -> double {
    double temperature =
        retryIO(logger_, "read " + sensorPath_, DEFAULT_IO_RETRIES, [this] {
            std::ifstream file(sensorPath_);
            if (!file) {
                THROW_HARDWARE_IO_ERROR("Cannot open ", sensorPath_);
            }
            std::stringstream contents;
            contents << file.rdbuf();
            return parseReading(contents.str());
        });
    logger_->debug("Temperature read as {:.2f} C", temperature);
    return temperature;
}

SerialThermometer::SerialThermometer(std::string id, const std::string& device,
                                     int baudRate)
    : Thermometer(std::move(id)),
      port_(std::make_unique<SerialPort>(device, baudRate)) {}

auto SerialThermometer::fromDescriptor(const DeviceDescriptor& descriptor)
    -> std::shared_ptr<SerialThermometer> {
    return std::make_shared<SerialThermometer>(
        descriptor.id, descriptor.require<std::string>("serialDevice"),
        descriptor.valueOr<int>("baudRate", DEFAULT_BAUD_RATE));
}

auto SerialThermometer::getTemperature() -> double {
    double temperature = retryIO(
        logger_, "read " + port_->getPath(), DEFAULT_IO_RETRIES, [this] {
            // Skip whatever was buffered so the value is current.
            port_->flushInput();
            auto line = port_->readLine(std::chrono::milliseconds(2000));
            if (!line) {
                THROW_HARDWARE_IO_ERROR("No reading from ",
                                        port_->getPath());
            }
            auto value = parseDouble(*line);
            if (!value) {
                THROW_HARDWARE_IO_ERROR("Unparseable reading '", *line, "'");
            }
            return *value;
        });
    logger_->debug("Temperature read as {:.2f} C", temperature);
    return temperature;
}

}  // namespace microlab::hardware
