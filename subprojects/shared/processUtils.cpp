#include "processUtils.hpp"

#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <sys/wait.h>

std::string ExitStatus::describe() const {
    if (signaled) {
        const char* name = ::strsignal(signal);
        return "killed by signal " + std::to_string(signal) + (name ? std::string(" (") + name + ")" : std::string{});
    }
    return "exited with code " + std::to_string(code);
}

std::filesystem::path ProcessUtils::get_executable_path_impl() {
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len != -1) {
        buffer[len] = '\0';
        return std::filesystem::path(buffer);
    }
    return std::filesystem::current_path();
}

std::filesystem::path ProcessUtils::get_executable_path() {
    static std::filesystem::path cached_path = get_executable_path_impl();
    return cached_path;
}

std::filesystem::path ProcessUtils::get_executable_dir() {
    return get_executable_path().parent_path();
}

void ProcessUtils::set_current_thread_name(const std::string& name) {
    // Linux limits names to 16 chars including NUL
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

bool ProcessUtils::set_nonblocking(int fd, std::error_code& ec) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

bool ProcessUtils::set_cloexec(int fd, bool enabled, std::error_code& ec) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    flags = enabled ? (flags | FD_CLOEXEC) : (flags & ~FD_CLOEXEC);
    if (::fcntl(fd, F_SETFD, flags) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

ExitStatus ProcessUtils::decode_wait_status(int status) {
    ExitStatus out;
    if (WIFSIGNALED(status)) {
        out.signaled = true;
        out.signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        out.code = WEXITSTATUS(status);
    }
    return out;
}

void ProcessUtils::close_fd(int& fd) {
    if (fd < 0) return;
    while (::close(fd) < 0 && errno == EINTR) {
    }
    fd = -1;
}
