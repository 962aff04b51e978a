/**
 * \file supervisor/WorkerLauncher.hpp
 * \brief Seam between the supervisor and how a worker process is started.
 * \details The production launcher forks the worker executable; tests substitute
 * an in-process fake that scripts replies and exits.
 */
#pragma once

#include "ipc/TaskMessage.hpp"
#include "processUtils.hpp"
#include "runtime/CoroIoContext.hpp"

#include <functional>
#include <memory>
#include <string>

namespace SysTask::Supervisor {

enum class OutputStream { Stdout, Stderr };

/**
 * \brief Callbacks from a running worker. All are invoked on the loop thread.
 * \details `on_exit` is the last callback for a given process.
 */
struct WorkerEvents {
    std::function<void(Ipc::Message)> on_message;
    std::function<void(OutputStream, const std::string&)> on_output;
    std::function<void(ExitStatus)> on_exit;
};

/** \brief Handle to one spawned worker process. */
class IWorkerProcess {
public:
    virtual ~IWorkerProcess() = default;

    virtual int pid() const = 0;

    /** \brief Queue a message for the worker. Returns false if the channel is unusable. */
    virtual bool send(const Ipc::Message& message) = 0;

    /** \brief Ask the worker to exit (SIGTERM, escalating to SIGKILL). `on_exit` still fires. */
    virtual void terminate() = 0;
};

class IWorkerLauncher {
public:
    virtual ~IWorkerLauncher() = default;

    /**
     * \brief Spawn a worker wired to `events`.
     * \throws std::system_error / std::runtime_error on spawn failure.
     */
    virtual std::shared_ptr<IWorkerProcess> launch(std::shared_ptr<runtime::CoroIoContext> loop, WorkerEvents events) = 0;
};

} // namespace SysTask::Supervisor
