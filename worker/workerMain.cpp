/**
 * \file worker/workerMain.cpp
 * \brief Entrypoint for the worker process spawned by the supervisor.
 */

#include "session/WorkerSession.hpp"
#include "WorkerOptions.hpp"
#include "tasks/registry/TaskRegistry.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace {

// Any exception escaping the worker's own code ends the process; the supervisor
// restarts it.
[[noreturn]] void on_terminate() {
    std::cerr << "[CRITICAL] worker terminating on uncaught failure";
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << ": " << e.what();
        } catch (...) {
            std::cerr << ": non-standard exception";
        }
    }
    std::cerr << std::endl;
    std::_Exit(1);
}

} // namespace

/** \brief Entrypoint for the worker binary. */
int main(int argc, char* argv[]) {
    std::set_terminate(on_terminate);
    try {
        SysTask::worker_opts::register_options();
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err, "systask-worker");
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "worker option parse error: " << opt_err << std::endl;
            return 2;
        }
        auto opts = SysTask::worker_opts::resolve();

        // Setup logger; the supervisor captures stdout into the session log
        auto logger = std::make_shared<Logger>("Worker");
        auto stdout_sink = std::make_shared<StdoutSink>();
        stdout_sink->set_level(opts.log_level);
        logger->add_sink(stdout_sink);

        // Keep the channel out of every command the worker spawns
        std::error_code ec;
        if (!ProcessUtils::set_cloexec(opts.channel_fd, true, ec)) {
            logger->critical("Worker: channel descriptor " + std::to_string(opts.channel_fd) + " unusable: " + ec.message());
            return 1;
        }

        auto registry = SysTask::Tasks::TaskRegistry::create_builtin(logger);
        logger->info("Worker started, pid " + std::to_string(ProcessUtils::current_pid()) +
                     ", registered tasks: " + std::to_string(registry->task_count()));

        SysTask::Worker::WorkerSession session(opts, *registry, logger);
        return session.run();
    } catch (const std::exception& e) {
        std::cerr << "worker error: " << e.what() << std::endl;
        return 1;
    }
}
