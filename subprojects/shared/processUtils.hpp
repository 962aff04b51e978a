#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <sys/syscall.h>
#include <unistd.h>

// How a child process ended, decoded from a waitpid() status.
struct ExitStatus {
    int code{0};        // exit code when !signaled
    int signal{0};      // terminating signal when signaled
    bool signaled{false};

    bool clean() const { return !signaled && code == 0; }
    std::string describe() const;
};

class ProcessUtils {
public:
    static std::filesystem::path get_executable_path();
    static std::filesystem::path get_executable_dir();

    static int current_pid() { return static_cast<int>(::getpid()); }

    // Get the native thread ID that appears in debuggers
    static uint64_t get_native_thread_id() {
        return static_cast<uint64_t>(syscall(SYS_gettid));
    }

    // Set current thread name (best-effort; Linux truncates to 15 chars)
    static void set_current_thread_name(const std::string& name);

    // File descriptor flags. Return false and fill `ec` on failure.
    static bool set_nonblocking(int fd, std::error_code& ec);
    static bool set_cloexec(int fd, bool enabled, std::error_code& ec);

    static ExitStatus decode_wait_status(int status);

    // Close ignoring EINTR; errors are not actionable at close time.
    static void close_fd(int& fd);

private:
    static std::filesystem::path get_executable_path_impl();
};
