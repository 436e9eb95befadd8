/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: MicroLab exception types

**************************************************/

#ifndef MICROLAB_EXCEPTION_EXCEPTION_HPP
#define MICROLAB_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace microlab {

// ============================================================================
// Configuration Exceptions
// ============================================================================

/**
 * @brief Thrown when a configuration cannot be loaded.
 *
 * Covers the process configuration file, hardware configuration files and
 * the device graph build: unknown implementations, missing dependencies,
 * dependency cycles and device construction failures.
 */
class ConfigError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;
};

#define THROW_CONFIG_ERROR(...)                                        \
    throw microlab::ConfigError(ATOM_FILE_NAME, ATOM_FILE_LINE,        \
                                ATOM_FUNC_NAME, __VA_ARGS__)

// ============================================================================
// Task Exceptions
// ============================================================================

/**
 * @brief Thrown when a pump task names a channel the dispenser does not have.
 */
class InvalidPumpError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;
};

#define THROW_INVALID_PUMP_ERROR(...)                                  \
    throw microlab::InvalidPumpError(ATOM_FILE_NAME, ATOM_FILE_LINE,   \
                                     ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Thrown when a task is pulled again after it yielded Done.
 */
class ExhaustedTaskError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;
};

#define THROW_EXHAUSTED_TASK_ERROR(...)                                \
    throw microlab::ExhaustedTaskError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Thrown when a task is created with missing or malformed parameters.
 */
class InvalidTaskParameterError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;
};

#define THROW_INVALID_TASK_PARAMETER(...)                        \
    throw microlab::InvalidTaskParameterError(                   \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

// ============================================================================
// Hardware Exceptions
// ============================================================================

/**
 * @brief Thrown when a device cannot be written to or read from after all
 * retries are used up.
 */
class HardwareIOError : public atom::error::Exception {
public:
    using atom::error::Exception::Exception;
};

#define THROW_HARDWARE_IO_ERROR(...)                                   \
    throw microlab::HardwareIOError(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief An I/O failure after which the device may already have acted on
 * the command, so it must not be sent again.
 */
class HardwareFaultError : public HardwareIOError {
public:
    using HardwareIOError::HardwareIOError;
};

#define THROW_HARDWARE_FAULT_ERROR(...)                                \
    throw microlab::HardwareFaultError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace microlab

#endif  // MICROLAB_EXCEPTION_EXCEPTION_HPP
