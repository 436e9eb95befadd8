/*
 * gpio_chips.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: GPIO chips on the Linux GPIO character device

**************************************************/

#ifndef MICROLAB_HARDWARE_GPIO_CHIPS_HPP
#define MICROLAB_HARDWARE_GPIO_CHIPS_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "hardware/device_descriptor.hpp"
#include "hardware/template/gpio_chip.hpp"

namespace microlab::hardware {

class DeviceGraph;

/**
 * @brief One /dev/gpiochipN.
 *
 * Each line is requested as an output the first time it is set and stays
 * requested until the chip is destroyed.
 */
class GpiodChip : public GpioChip {
public:
    GpiodChip(std::string id, std::string chipName,
              std::map<std::string, int> aliases);
    ~GpiodChip() override;

    static auto fromDescriptor(const DeviceDescriptor& descriptor)
        -> std::shared_ptr<GpiodChip>;

    void setLine(const std::string& line, bool value) override;
    auto hasAlias(const std::string& line) const -> bool override;

private:
    auto resolve(const std::string& line) const -> unsigned int;
    auto requestLine(unsigned int offset) -> int;
    void writeValue(int lineFd, bool value);

    std::string chipName_;
    std::map<std::string, int> aliases_;
    int chipFd_{-1};
    std::map<unsigned int, int> lineFds_;
};

/**
 * @brief Several chips addressed as one.
 *
 * An alias goes to the first chip that knows it, default chip first. Raw line
 * numbers go to the default chip.
 */
class GpiodChipset : public GpioChip {
public:
    GpiodChipset(std::string id, std::shared_ptr<GpioChip> defaultChip,
                 std::vector<std::shared_ptr<GpioChip>> additionalChips);

    static auto fromDescriptor(const DeviceDescriptor& descriptor,
                               const DeviceGraph& graph)
        -> std::shared_ptr<GpiodChipset>;

    void setLine(const std::string& line, bool value) override;
    auto hasAlias(const std::string& line) const -> bool override;

private:
    std::shared_ptr<GpioChip> defaultChip_;
    std::vector<std::shared_ptr<GpioChip>> additionalChips_;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_GPIO_CHIPS_HPP
