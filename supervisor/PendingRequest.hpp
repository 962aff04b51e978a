/**
 * \file supervisor/PendingRequest.hpp
 * \brief Entry of the supervisor's correlation table.
 */
#pragma once

#include "TaskResult.hpp"
#include "runtime/CoroIoContext.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace SysTask::Supervisor {

/** \brief Continuation receiving the single resolution of a request. */
using Completion = std::function<void(TaskResult)>;

/**
 * \brief One outstanding request, owned by the supervisor.
 * \details Removed from the table by whichever comes first: its reply, its timeout,
 * or `dispose()`.
 */
struct PendingRequest {
    std::string task_id;
    std::string task_name;
    Completion completion;
    runtime::CoroIoContext::TimerId timer{0};
    std::chrono::steady_clock::time_point created;
    std::chrono::milliseconds timeout{0};
};

} // namespace SysTask::Supervisor
