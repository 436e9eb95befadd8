/*
 * serial_port.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Line-oriented termios serial port

**************************************************/

#ifndef MICROLAB_HARDWARE_SERIAL_PORT_HPP
#define MICROLAB_HARDWARE_SERIAL_PORT_HPP

#include <chrono>
#include <optional>
#include <string>

namespace microlab::hardware {

/**
 * @brief Raw 8N1 serial port exchanging newline-terminated lines.
 *
 * The file descriptor is owned and closed on destruction.
 */
class SerialPort {
public:
    /**
     * @throws HardwareIOError if the port cannot be opened or configured.
     */
    SerialPort(std::string path, int baudRate);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    /**
     * @brief Write `line` followed by a newline.
     * @throws HardwareIOError on a short or failed write.
     */
    void writeLine(const std::string& line);

    /**
     * @brief Read one line, without its terminator.
     * @return std::nullopt if no complete line arrived within `timeout`.
     */
    auto readLine(std::chrono::milliseconds timeout)
        -> std::optional<std::string>;

    /**
     * @brief Discard buffered input.
     */
    void flushInput();

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
    std::string buffer_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_SERIAL_PORT_HPP
