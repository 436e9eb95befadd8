/*
 * gpio_chips.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gpio_chips.hpp"

#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <charconv>
#include <cerrno>
#include <cstring>

#include "exception/exception.hpp"
#include "hardware/device_graph.hpp"
#include "hardware/io_retry.hpp"

namespace microlab::hardware {

namespace {
constexpr const char* GPIO_CONSUMER = "microlab";
}

GpiodChip::GpiodChip(std::string id, std::string chipName,
                     std::map<std::string, int> aliases)
    : GpioChip(std::move(id)),
      chipName_(std::move(chipName)),
      aliases_(std::move(aliases)) {
    chipFd_ = ::open(chipName_.c_str(), O_RDWR | O_CLOEXEC);
    if (chipFd_ < 0) {
        THROW_HARDWARE_IO_ERROR("Unable to open GPIO chip ", chipName_, ": ",
                                std::strerror(errno));
    }
    logger_->info("Opened GPIO chip {}", chipName_);
}

GpiodChip::~GpiodChip() {
    for (const auto& [offset, fd] : lineFds_) {
        ::close(fd);
    }
    if (chipFd_ >= 0) {
        ::close(chipFd_);
    }
}

auto GpiodChip::fromDescriptor(const DeviceDescriptor& descriptor)
    -> std::shared_ptr<GpiodChip> {
    return std::make_shared<GpiodChip>(
        descriptor.id, descriptor.require<std::string>("chipName"),
        parseLineAliases(descriptor));
}

auto GpiodChip::resolve(const std::string& line) const -> unsigned int {
    if (auto it = aliases_.find(line); it != aliases_.end()) {
        return static_cast<unsigned int>(it->second);
    }
    unsigned int offset = 0;
    const auto* end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(line.data(), end, offset);
    if (ec != std::errc() || ptr != end) {
        THROW_HARDWARE_IO_ERROR("GPIO chip '", id_, "' has no line '", line,
                                "'");
    }
    return offset;
}

auto GpiodChip::requestLine(unsigned int offset) -> int {
    if (auto it = lineFds_.find(offset); it != lineFds_.end()) {
        return it->second;
    }
    struct gpio_v2_line_request request {};
    request.offsets[0] = offset;
    request.num_lines = 1;
    request.config.flags = GPIO_V2_LINE_FLAG_OUTPUT;
    std::strncpy(request.consumer, GPIO_CONSUMER,
                 sizeof(request.consumer) - 1);
    if (::ioctl(chipFd_, GPIO_V2_GET_LINE_IOCTL, &request) < 0) {
        THROW_HARDWARE_IO_ERROR("Unable to request line ", offset, " on ",
                                chipName_, ": ", std::strerror(errno));
    }
    lineFds_.emplace(offset, request.fd);
    return request.fd;
}

void GpiodChip::writeValue(int lineFd, bool value) {
    struct gpio_v2_line_values values {};
    values.mask = 1;
    values.bits = value ? 1 : 0;
    if (::ioctl(lineFd, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0) {
        THROW_HARDWARE_IO_ERROR("Unable to set line value on ", chipName_,
                                ": ", std::strerror(errno));
    }
}

void GpiodChip::setLine(const std::string& line, bool value) {
    unsigned int offset = resolve(line);
    logger_->debug("Setting line {} ({}) to {}", line, offset, value ? 1 : 0);
    retryIO(logger_, "set line " + line, DEFAULT_IO_RETRIES,
            [&] { writeValue(requestLine(offset), value); });
}

auto GpiodChip::hasAlias(const std::string& line) const -> bool {
    return aliases_.contains(line);
}

GpiodChipset::GpiodChipset(
    std::string id, std::shared_ptr<GpioChip> defaultChip,
    std::vector<std::shared_ptr<GpioChip>> additionalChips)
    : GpioChip(std::move(id)),
      defaultChip_(std::move(defaultChip)),
      additionalChips_(std::move(additionalChips)) {}

auto GpiodChipset::fromDescriptor(const DeviceDescriptor& descriptor,
                                  const DeviceGraph& graph)
    -> std::shared_ptr<GpiodChipset> {
    auto defaultChip = graph.getAs<GpioChip>(
        descriptor.require<std::string>("defaultChipID"));
    std::vector<std::shared_ptr<GpioChip>> additional;
    for (const auto& chipId :
         descriptor.valueOr<std::vector<std::string>>("additionalChips", {})) {
        additional.push_back(graph.getAs<GpioChip>(chipId));
    }
    return std::make_shared<GpiodChipset>(descriptor.id, std::move(defaultChip),
                                          std::move(additional));
}

void GpiodChipset::setLine(const std::string& line, bool value) {
    if (defaultChip_->hasAlias(line)) {
        defaultChip_->setLine(line, value);
        return;
    }
    for (const auto& chip : additionalChips_) {
        if (chip->hasAlias(line)) {
            chip->setLine(line, value);
            return;
        }
    }
    defaultChip_->setLine(line, value);
}

auto GpiodChipset::hasAlias(const std::string& line) const -> bool {
    if (defaultChip_->hasAlias(line)) {
        return true;
    }
    for (const auto& chip : additionalChips_) {
        if (chip->hasAlias(line)) {
            return true;
        }
    }
    return false;
}

}  // namespace microlab::hardware
