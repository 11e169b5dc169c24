#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <chrono>

#include <fmt/format.h>

namespace platform {

// Children run in their own process group so signals reach anything the
// script started. Falls back to the pid alone if the group is gone.
static void signal_child(int pid, int sig) {
    if (::kill(-pid, sig) != 0) ::kill(pid, sig);
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (pid_ > 0 && !exited_) {
        signal_child(pid_, SIGKILL);
        waitpid(pid_, nullptr, 0);
    }
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !exited_) {
            signal_child(pid_, SIGKILL);
            waitpid(pid_, nullptr, 0);
        }
        close_output();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        exited_ = other.exited_;
        signaled_ = other.signaled_;
        read_failed_ = other.read_failed_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.exited_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::reap(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
        signaled_ = false;
    } else {
        exit_code_ = -1;
        signaled_ = WIFSIGNALED(status);
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || exited_) return false;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reap(status);
        return false;
    }
    if (ret < 0) {
        // Already reaped elsewhere; nothing more to learn about it
        exited_ = true;
        return false;
    }
    return true;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exited_) return exit_code_;
    if (timeout_ms < 0) {
        int status = 0;
        if (waitpid(pid_, &status, 0) == pid_) reap(status);
        return exit_code_;
    }
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ > 0 && !exited_) signal_child(pid_, SIGTERM);
}

void ProcessHandle::kill() {
    if (pid_ > 0 && !exited_) signal_child(pid_, SIGKILL);
}

std::string ProcessHandle::read_available() {
    std::string out;
    if (out_fd_ < 0) return out;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(out_fd_, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_output();  // writer side closed
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            read_failed_ = true;
            close_output();
        }
        break;
    }
    return out;
}

void ProcessHandle::close_output() {
    if (out_fd_ >= 0) {
        ::close(out_fd_);
        out_fd_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    // Close-on-exec: children spawned by other threads must not inherit it
    int out_pipe[2] = {-1, -1};
    if (options.capture_output && pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessHandle>::Err(fmt::format("pipe: {}", std::strerror(errno)));
    }

    // Exec status pipe: closed by a successful exec, carries errno otherwise
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        if (out_pipe[0] >= 0) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
        return Result<ProcessHandle>::Err(fmt::format("pipe: {}", std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        if (out_pipe[0] >= 0) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return Result<ProcessHandle>::Err(fmt::format("fork: {}", std::strerror(e)));
    }

    if (pid == 0) {
        // Child process
        ::close(err_pipe[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (options.capture_output) {
            ::close(out_pipe[0]);
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
            ::close(out_pipe[1]);
        }
        // New process group so a kill reaches the script's children too
        setpgid(0, 0);

        int child_errno = 0;
        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            child_errno = errno;
        }
        for (const auto& [key, value] : options.env) {
            if (child_errno == 0 && setenv(key.c_str(), value.c_str(), 1) != 0) {
                child_errno = errno;
            }
        }

        if (child_errno == 0) {
            std::vector<const char*> argv;
            argv.push_back(program.c_str());
            for (const auto& a : args) argv.push_back(a.c_str());
            argv.push_back(nullptr);
            execvp(program.c_str(), const_cast<char* const*>(argv.data()));
            child_errno = errno;
        }
        ssize_t ignored = ::write(err_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent. Set the group here too so an early signal cannot miss it.
    setpgid(pid, pid);
    ::close(err_pipe[1]);
    ProcessHandle handle;
    handle.pid_ = pid;

    if (options.capture_output) {
        ::close(out_pipe[1]);
        fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
        handle.out_fd_ = out_pipe[0];
    }

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        handle.wait();
        return Result<ProcessHandle>::Err(
            fmt::format("{}: {}", program, std::strerror(child_errno)));
    }

    return Result<ProcessHandle>::Ok(std::move(handle));
}

CaptureResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_secs) {
    CaptureResult result;
    auto spawned = spawn(program, args);
    if (spawned.is_err()) {
        result.error = spawned.error;
        return result;
    }
    result.started = true;
    ProcessHandle& proc = spawned.value;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    while (proc.running()) {
        result.output += proc.read_available();
        if (timeout_secs > 0 && std::chrono::steady_clock::now() >= deadline) {
            proc.kill();
            proc.wait();
            result.timed_out = true;
            result.error = fmt::format("{} timed out after {}s", program, timeout_secs);
            break;
        }
        sleep_ms(20);
    }
    result.output += proc.read_available();
    result.exit_code = proc.exit_code();
    return result;
}

} // namespace platform
