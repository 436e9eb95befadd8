/*
 * serial_port.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "serial_port.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "exception/exception.hpp"

namespace microlab::hardware {

namespace {

auto toSpeed(int baudRate) -> speed_t {
    switch (baudRate) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default: break;
    }
    THROW_CONFIG_ERROR("Unsupported baud rate ", baudRate);
}

}  // namespace

SerialPort::SerialPort(std::string path, int baudRate) : path_(std::move(path)) {
    speed_t speed = toSpeed(baudRate);

    fd_ = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        THROW_HARDWARE_IO_ERROR("Unable to open serial port ", path_, ": ",
                                std::strerror(errno));
    }

    struct termios options {};
    if (::tcgetattr(fd_, &options) != 0) {
        int err = errno;
        ::close(fd_);
        THROW_HARDWARE_IO_ERROR("Unable to read settings of ", path_, ": ",
                                std::strerror(err));
    }
    ::cfmakeraw(&options);
    ::cfsetispeed(&options, speed);
    ::cfsetospeed(&options, speed);
    options.c_cflag |= (CLOCAL | CREAD | CS8);
    options.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS);
    options.c_cc[VTIME] = 0;
    options.c_cc[VMIN] = 0;
    if (::tcsetattr(fd_, TCSANOW, &options) != 0) {
        int err = errno;
        ::close(fd_);
        THROW_HARDWARE_IO_ERROR("Unable to configure ", path_, ": ",
                                std::strerror(err));
    }
}

SerialPort::~SerialPort() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void SerialPort::writeLine(const std::string& line) {
    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            THROW_HARDWARE_IO_ERROR("Write to ", path_, " failed: ",
                                    std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    ::tcdrain(fd_);
}

auto SerialPort::readLine(std::chrono::milliseconds timeout)
    -> std::optional<std::string> {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[128];
    while (true) {
        if (auto pos = buffer_.find('\n'); pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return std::nullopt;
        }
        struct pollfd pfd {
            fd_, POLLIN, 0
        };
        int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW_HARDWARE_IO_ERROR("Poll on ", path_, " failed: ",
                                    std::strerror(errno));
        }
        if (ready == 0) {
            return std::nullopt;
        }
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            THROW_HARDWARE_IO_ERROR("Read from ", path_, " failed: ",
                                    std::strerror(errno));
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void SerialPort::flushInput() {
    ::tcflush(fd_, TCIFLUSH);
    buffer_.clear();
}

}  // namespace microlab::hardware
