/*
 * io_retry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bounded retry for device I/O

**************************************************/

#ifndef MICROLAB_HARDWARE_IO_RETRY_HPP
#define MICROLAB_HARDWARE_IO_RETRY_HPP

#include <exception>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace microlab::hardware {

inline constexpr int DEFAULT_IO_RETRIES = 3;

/**
 * @brief Run a device I/O operation, retrying failed attempts.
 *
 * Every failed attempt is logged as a warning. When the last attempt fails
 * a HardwareIOError carrying the last cause is thrown. A HardwareFaultError
 * is never retried and propagates unchanged.
 */
template <typename Fn>
auto retryIO(const std::shared_ptr<spdlog::logger>& logger,
             std::string_view operation, int attempts, Fn&& fn)
    -> decltype(fn()) {
    if (attempts < 1) {
        attempts = 1;
    }
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const HardwareFaultError& e) {
            logger->error("{} failed: {}", operation, e.what());
            throw;
        } catch (const std::exception& e) {
            if (attempt >= attempts) {
                logger->error("{} failed after {} attempts: {}", operation,
                              attempts, e.what());
                THROW_HARDWARE_IO_ERROR(operation, " failed after ", attempts,
                                        " attempts: ", e.what());
            }
            logger->warn("{} failed (attempt {}/{}): {}", operation, attempt,
                         attempts, e.what());
        }
    }
}

}  // namespace microlab::hardware

#endif  // MICROLAB_HARDWARE_IO_RETRY_HPP
