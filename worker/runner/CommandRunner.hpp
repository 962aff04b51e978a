/**
 * \file worker/runner/CommandRunner.hpp
 * \brief Runs shell commands as child processes driven by the worker event loop.
 */
#pragma once

#include "tasks/handlers/ICommandRunner.hpp"
#include "runtime/CoroIoContext.hpp"
#include "logger.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace SysTask::Worker {

/**
 * \brief `ICommandRunner` backed by `/bin/sh -c`.
 * \details Each command runs in its own process group with stdin on /dev/null and
 * stdout/stderr captured through non-blocking pipes. A pending operation on the
 * context drains the pipes, enforces the deadline and the output cap (killing the
 * whole group on violation), and reaps the child with `waitpid(WNOHANG)`.
 * Many commands may be in flight at once.
 */
class CommandRunner : public Tasks::ICommandRunner {
public:
    CommandRunner(std::shared_ptr<runtime::CoroIoContext> context,
                  std::shared_ptr<Logger> logger,
                  Tasks::CommandOptions defaults = {});

    using ICommandRunner::run;

    Tasks::CommandOptions default_options() const override { return defaults_; }

    runtime::CoTask<std::string> run(std::string command_line, Tasks::CommandOptions options) override;

    /** \brief Commands spawned and not yet reaped. */
    size_t running_count() const { return running_.load(); }

private:
    struct Execution;

    std::shared_ptr<runtime::CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;
    Tasks::CommandOptions defaults_;
    std::atomic<size_t> running_{0};
};

/** \brief Strip leading and trailing whitespace. */
std::string trim_output(std::string text);

} // namespace SysTask::Worker
