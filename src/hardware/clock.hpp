/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Time source used by the hardware facade

**************************************************/

#ifndef MICROLAB_HARDWARE_CLOCK_HPP
#define MICROLAB_HARDWARE_CLOCK_HPP

namespace microlab::hardware {

/**
 * @brief Monotonic time source in seconds.
 *
 * The hardware facade reads time and sleeps only through this interface, so
 * tests can drive time explicitly.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual auto now() const -> double = 0;
    virtual void sleepFor(double seconds) = 0;
};

/**
 * @brief Wall-clock implementation backed by std::chrono::steady_clock.
 */
class SteadyClock : public Clock {
public:
    [[nodiscard]] auto now() const -> double override;
    void sleepFor(double seconds) override;
};

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_CLOCK_HPP
