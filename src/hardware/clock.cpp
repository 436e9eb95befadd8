/*
 * clock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "clock.hpp"

#include <chrono>
#include <thread>

namespace microlab::hardware {

auto SteadyClock::now() const -> double {
    return std::chrono::duration<double>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

void SteadyClock::sleepFor(double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

}  // namespace microlab::hardware
