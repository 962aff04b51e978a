/**
 * \file supervisor/TaskResult.hpp
 * \brief Tagged outcome of one `TaskSupervisor::execute` call.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace SysTask::Supervisor {

/** \brief Why a task did not succeed. */
enum class TaskFailureKind {
    None,          ///< success
    Unavailable,   ///< worker not running, or restart budget exhausted
    Timeout,       ///< no reply within the configured window
    TaskError,     ///< handler reported a failure
    Transport,     ///< request could not be written to the worker
    Shutdown,      ///< supervisor disposed while outstanding
};

inline std::string_view to_string(TaskFailureKind kind) {
    switch (kind) {
        case TaskFailureKind::None:        return "none";
        case TaskFailureKind::Unavailable: return "unavailable";
        case TaskFailureKind::Timeout:     return "timeout";
        case TaskFailureKind::TaskError:   return "task-error";
        case TaskFailureKind::Transport:   return "transport";
        case TaskFailureKind::Shutdown:    return "shutdown";
    }
    return "unknown";
}

/** \brief Messages used for supervisor-generated failures. */
namespace FailureMessages {
    inline constexpr std::string_view Unavailable = "worker unavailable";
    inline constexpr std::string_view Timeout = "Task timeout";
    inline constexpr std::string_view Shutdown = "Task executor shutting down";
}

/**
 * \brief `{success, data}` or `{success=false, error, code}`.
 * \details `code` is set for handler failures (the handler's code, -1 by default)
 * and timeouts (-1); supervisor-side refusals carry no code.
 */
struct TaskResult {
    bool success{false};
    nlohmann::json data;
    std::string error;
    std::optional<int> code;
    TaskFailureKind failure{TaskFailureKind::None};

    static TaskResult ok(nlohmann::json data) {
        TaskResult r;
        r.success = true;
        r.data = std::move(data);
        return r;
    }

    static TaskResult failed(TaskFailureKind kind, std::string error, std::optional<int> code = std::nullopt) {
        TaskResult r;
        r.success = false;
        r.error = std::move(error);
        r.code = code;
        r.failure = kind;
        return r;
    }
};

} // namespace SysTask::Supervisor
