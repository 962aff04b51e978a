/**
 * \file supervisor/ChildWorkerLauncher.hpp
 * \brief Launches the worker executable as a child process.
 * \details The child receives one end of a `socketpair` as descriptor 3 (announced
 * with `--channel-fd 3`); its stdout and stderr are captured line by line. A
 * single polling operation on the supervisor loop drains output, reads channel
 * frames and reaps the child, so `on_exit` is always delivered after the last
 * message and output line of that process.
 */
#pragma once

#include "WorkerLauncher.hpp"
#include "logger.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace SysTask::Supervisor {

class ChildWorkerLauncher : public IWorkerLauncher {
public:
    /// Descriptor number the channel is moved to in the child.
    static constexpr int child_channel_fd = 3;

    /**
     * \param worker_path Worker executable.
     * \param worker_args Extra arguments appended after `--channel-fd 3`.
     * \param logger Launcher diagnostics; may be null.
     */
    ChildWorkerLauncher(std::filesystem::path worker_path,
                        std::vector<std::string> worker_args = {},
                        std::shared_ptr<Logger> logger = nullptr);

    /**
     * \brief fork/exec the worker.
     * \throws std::runtime_error if the executable does not exist.
     * \throws std::system_error if descriptors cannot be created, fork fails, or exec fails.
     */
    std::shared_ptr<IWorkerProcess> launch(std::shared_ptr<runtime::CoroIoContext> loop, WorkerEvents events) override;

    /// Delay between SIGTERM and SIGKILL in `IWorkerProcess::terminate`.
    void set_kill_grace(std::chrono::milliseconds grace) { kill_grace_ = grace; }

    const std::filesystem::path& worker_path() const { return worker_path_; }

private:
    std::filesystem::path worker_path_;
    std::vector<std::string> worker_args_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds kill_grace_{2000};
};

} // namespace SysTask::Supervisor
