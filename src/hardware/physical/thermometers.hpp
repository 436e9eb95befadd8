/*
 * thermometers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: 1-Wire and serial thermometers

**************************************************/

#ifndef MICROLAB_HARDWARE_THERMOMETERS_HPP
#define MICROLAB_HARDWARE_THERMOMETERS_HPP

#include <memory>
#include <string>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/thermometer.hpp"
#include "serial_port.hpp"

namespace microlab::hardware {

/**
 * @brief DS18B20-style probe read through the kernel w1_therm driver.
 *
 * `sensorPath` is the sensor's `w1_slave` file. A reading whose CRC line does
 * not end in YES is treated as a failed attempt.
 */
class W1Thermometer : public Thermometer {
public:
    W1Thermometer(std::string id, std::string sensorPath);

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<W1Thermometer>;

    auto getTemperature() -> double override;

    /**
     * @brief Parse the two-line `w1_slave` contents into degrees Celsius.
     * @throws HardwareIOError on a CRC failure or malformed data.
     */
    static auto parseReading(const std::string& contents) -> double;

private:
    std::string sensorPath_;
};

/**
 * @brief Probe that prints one temperature per line on a serial port.
 */
class SerialThermometer : public Thermometer {
public:
    static constexpr int DEFAULT_BAUD_RATE = 9600;

    SerialThermometer(std::string id, const std::string& device, int baudRate);

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<SerialThermometer>;

    auto getTemperature() -> double override;

private:
    std::unique_ptr<SerialPort> port_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_THERMOMETERS_HPP
