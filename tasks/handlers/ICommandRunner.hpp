/**
 * @file tasks/handlers/ICommandRunner.hpp
 * @brief Shell command execution seam used by task handlers.
 */
#pragma once

#include "runtime/CoTask.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace SysTask::Tasks {

/**
 * @brief Failure raised by a task handler.
 *
 * The worker reports `what()` and `code()` back to the supervisor as a task-error.
 */
class TaskFailure : public std::runtime_error {
public:
    explicit TaskFailure(const std::string& message, int code = -1)
        : std::runtime_error(message), code_(code) {}
    [[nodiscard]] int code() const noexcept { return code_; }
private:
    int code_;
};

/// A shell command that exited non-zero, was killed, timed out, or overflowed its output limit.
class CommandError : public TaskFailure {
public:
    CommandError(const std::string& message, int code, std::string stderr_text = {})
        : TaskFailure(message, code), stderr_text_(std::move(stderr_text)) {}
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }
private:
    std::string stderr_text_;
};

/// Limits for one command invocation.
struct CommandOptions {
    std::chrono::milliseconds timeout{30000};
    std::size_t max_output_bytes{10 * 1024 * 1024};
};

/**
 * @brief Runs one shell command line and yields its trimmed stdout.
 *
 * Implementations never retry. Failures surface as CommandError from the awaited task.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Limits applied when a caller does not pass its own.
    [[nodiscard]] virtual CommandOptions default_options() const = 0;

    virtual runtime::CoTask<std::string> run(std::string command_line, CommandOptions options) = 0;

    runtime::CoTask<std::string> run(std::string command_line) {
        return run(std::move(command_line), default_options());
    }
};

} // namespace SysTask::Tasks
