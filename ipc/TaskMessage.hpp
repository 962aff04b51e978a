/**
 * \file ipc/TaskMessage.hpp
 * \brief Logical messages exchanged between the supervisor and the worker.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace SysTask::Ipc {

/** \brief Wire type names, used in logs. */
namespace MessageType {
    inline constexpr std::string_view ExecuteTask = "execute-task";
    inline constexpr std::string_view TaskComplete = "task-complete";
    inline constexpr std::string_view TaskError = "task-error";
    inline constexpr std::string_view WorkerReady = "worker-ready";
}

/** \brief Dispatch request (supervisor -> worker). `args` is a JSON array of positional arguments. */
struct ExecuteTaskMessage {
    std::string task_id;
    std::string task_name;
    nlohmann::json args = nlohmann::json::array();
};

/** \brief Successful reply (worker -> supervisor). */
struct TaskCompleteMessage {
    std::string task_id;
    nlohmann::json result;
};

/** \brief Failed reply (worker -> supervisor). */
struct TaskErrorMessage {
    std::string task_id;
    std::string error;
    int code{-1};
};

/** \brief Readiness announcement sent by the worker once its registry is built. */
struct WorkerReadyMessage {
    int pid{0};
    std::vector<std::string> tasks;
};

using Message = std::variant<ExecuteTaskMessage, TaskCompleteMessage, TaskErrorMessage, WorkerReadyMessage>;

inline std::string_view message_type(const Message& message) {
    struct Visitor {
        std::string_view operator()(const ExecuteTaskMessage&) const { return MessageType::ExecuteTask; }
        std::string_view operator()(const TaskCompleteMessage&) const { return MessageType::TaskComplete; }
        std::string_view operator()(const TaskErrorMessage&) const { return MessageType::TaskError; }
        std::string_view operator()(const WorkerReadyMessage&) const { return MessageType::WorkerReady; }
    };
    return std::visit(Visitor{}, message);
}

} // namespace SysTask::Ipc
