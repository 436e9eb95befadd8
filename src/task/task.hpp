/*
 * task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Pull-driven control task base

**************************************************/

#ifndef MICROLAB_TASK_TASK_HPP
#define MICROLAB_TASK_TASK_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "hardware/hardware.hpp"

namespace microlab::task {

/**
 * @brief What a task asks of its scheduler after one pull.
 */
struct WaitSignal {
    enum class Kind { Wait, Done };

    Kind kind{Kind::Done};
    double duration{0.0};  ///< Simulated seconds, only for Wait

    static auto wait(double seconds) -> WaitSignal {
        return {Kind::Wait, seconds};
    }
    static auto done() -> WaitSignal { return {Kind::Done, 0.0}; }

    [[nodiscard]] bool isDone() const { return kind == Kind::Done; }
};

enum class TaskState {
    Created,    ///< Never pulled
    Active,     ///< Pulled, has yielded only waits
    Completed,  ///< Yielded Done
    Exhausted   ///< Failed, or pulled after Done
};

inline auto stateToString(TaskState state) -> std::string {
    switch (state) {
        case TaskState::Created:
            return "created";
        case TaskState::Active:
            return "active";
        case TaskState::Completed:
            return "completed";
        case TaskState::Exhausted:
            return "exhausted";
    }
    return "unknown";
}

/**
 * @brief A finite, non-restartable control routine.
 *
 * Each call to next() performs the hardware actions due now and returns how
 * long the caller should wait before the next pull. The task's clock starts
 * at its first pull. Any exception thrown by a step leaves the task
 * Exhausted.
 */
class Task {
public:
    Task(std::string name,
         std::shared_ptr<hardware::MicroLabHardware> hardware);
    virtual ~Task() = default;

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /**
     * @throws ExhaustedTaskError if the task already yielded Done or failed.
     */
    auto next() -> WaitSignal;

    [[nodiscard]] auto getName() const -> const std::string& { return name_; }
    [[nodiscard]] auto getState() const -> TaskState { return state_; }

protected:
    /**
     * @brief Perform one pull. Called for the first time right after the
     * start time has been recorded.
     */
    virtual auto step() -> WaitSignal = 0;

    /**
     * @brief Simulated seconds since the first pull.
     */
    [[nodiscard]] auto elapsed() const -> double;

    hardware::MicroLabHardware& hardware() { return *hardware_; }

    std::shared_ptr<spdlog::logger> logger_;

private:
    std::string name_;
    std::shared_ptr<hardware::MicroLabHardware> hardware_;
    TaskState state_{TaskState::Created};
    double startTime_{0.0};
};

/// Poll interval of the polling tasks, in simulated seconds.
inline constexpr double POLL_INTERVAL = 1.0;

}  // namespace microlab::task

#endif  // MICROLAB_TASK_TASK_HPP
