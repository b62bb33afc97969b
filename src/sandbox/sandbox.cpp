#include "cbroker/sandbox.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace cbroker {

namespace {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

constexpr int kExecFailed = 127;
constexpr int kMaxInheritedFd = 65536;

std::string errno_string(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Closes any descriptors still open when it goes out of scope.
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

bool make_pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    read_end.fd = fds[0];
    write_end.fd = fds[1];
    return true;
}

int highest_fd() {
    struct rlimit rl;
    if (::getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        return static_cast<int>(std::min<rlim_t>(rl.rlim_cur, kMaxInheritedFd));
    }
    return kMaxInheritedFd;
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

// ============================================================================
// Exit classification
// ============================================================================

Error signal_failure(int sig, const SandboxLimits& limits) {
    // RLIMIT_CPU delivers SIGXCPU at the soft limit.
    if (sig == SIGXCPU) {
        return Error(ErrorCode::SCRIPT_TIMEOUT,
                     "Script exceeded CPU time limit of " + std::to_string(limits.cpu_seconds) + " s");
    }
    if (sig == SIGKILL) {
        return Error(ErrorCode::SANDBOX_FAILURE, "Sandbox helper was killed (SIGKILL)");
    }
    if (sig == SIGSYS) {
        return Error(ErrorCode::SANDBOX_FAILURE, "Sandbox helper made a forbidden system call");
    }
    return Error(ErrorCode::SANDBOX_FAILURE, "Sandbox helper terminated by signal " + std::to_string(sig));
}

// ============================================================================
// Helper location
// ============================================================================

std::string default_helper_path() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return "cbroker-sandbox";
    return (self.parent_path() / "cbroker-sandbox").string();
}

// ============================================================================
// SandboxExecutor
// ============================================================================

SandboxExecutor::SandboxExecutor(SandboxLimits limits) : limits_(std::move(limits)) {
    if (limits_.helper_path.empty()) {
        limits_.helper_path = default_helper_path();
    }
}

Result<json> SandboxExecutor::execute(const std::string& script, const json& input) const {
    return execute(script, input, limits_.timeout_ms);
}

Result<json> SandboxExecutor::execute(const std::string& script,
                                      const json& input,
                                      int64_t timeout_ms) const {
    using R = Result<json>;
    ignore_sigpipe_once();

    json request = {
        {"script", script},
        {"input", input},
    };
    std::string payload;
    try {
        payload = request.dump();
    } catch (const json::exception& e) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE,
                            std::string("cannot encode sandbox request: ") + e.what()));
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> argv_strings = {
        limits_.helper_path,
        "--memory-mb", std::to_string(limits_.memory_limit_mb),
        "--cpu-seconds", std::to_string(limits_.cpu_seconds),
    };
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);
    char* envp[] = {nullptr};
    const int max_fd = highest_fd();

    Fd stdin_read, stdin_write, stdout_read, stdout_write;
    if (!make_pipe(stdin_read, stdin_write) || !make_pipe(stdout_read, stdout_write)) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE, errno_string("pipe")));
    }
    Fd dev_null(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    if (dev_null.fd < 0) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE, errno_string("open /dev/null")));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE, errno_string("fork")));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only until execve.
        if (::dup2(stdin_read.fd, STDIN_FILENO) < 0 ||
            ::dup2(stdout_write.fd, STDOUT_FILENO) < 0 ||
            ::dup2(dev_null.fd, STDERR_FILENO) < 0) {
            _exit(kExecFailed);
        }
        for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
            ::close(fd);
        }
        if (::chdir("/") != 0) {
            _exit(kExecFailed);
        }
        ::execve(argv[0], argv.data(), envp);
        _exit(kExecFailed);
    }

    // Parent
    stdin_read.reset();
    stdout_write.reset();
    dev_null.reset();

    ::fcntl(stdin_write.fd, F_SETFL, O_NONBLOCK);
    ::fcntl(stdout_read.fd, F_SETFL, O_NONBLOCK);

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t written = 0;
    std::string output;
    char buf[16384];

    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            kill_and_reap(pid);
            spdlog::warn("sandbox: script killed after {} ms", timeout_ms);
            return R::err(Error(ErrorCode::SCRIPT_TIMEOUT,
                                "Script execution timed out after " +
                                std::to_string(timeout_ms) + " ms"));
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {stdout_read.fd, POLLIN, 0};
        if (stdin_write.fd >= 0) {
            fds[nfds++] = {stdin_write.fd, POLLOUT, 0};
        }

        int rc = ::poll(fds, nfds, static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::string msg = errno_string("poll");
            kill_and_reap(pid);
            return R::err(Error(ErrorCode::SANDBOX_FAILURE, msg));
        }
        if (rc == 0) continue;

        if (nfds > 1 && fds[1].revents != 0) {
            if (fds[1].revents & (POLLERR | POLLHUP)) {
                // Helper closed its stdin early; its reply (or exit status) tells why.
                stdin_write.reset();
            } else {
                ssize_t n = ::write(stdin_write.fd, payload.data() + written, payload.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == payload.size()) stdin_write.reset();
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_write.reset();
                }
            }
        }

        if (fds[0].revents != 0) {
            ssize_t n = ::read(stdout_read.fd, buf, sizeof(buf));
            if (n > 0) {
                output.append(buf, static_cast<size_t>(n));
                if (output.size() > limits_.max_output_bytes) {
                    kill_and_reap(pid);
                    return R::err(Error(ErrorCode::SANDBOX_FAILURE,
                                        "Sandbox output exceeded " +
                                        std::to_string(limits_.max_output_bytes) + " bytes"));
                }
            } else if (n == 0) {
                break;
            } else if (errno != EAGAIN && errno != EINTR) {
                std::string msg = errno_string("read");
                kill_and_reap(pid);
                return R::err(Error(ErrorCode::SANDBOX_FAILURE, msg));
            }
        }
    }

    int status = 0;
    pid_t waited;
    while ((waited = ::waitpid(pid, &status, 0)) == -1 && errno == EINTR) {
    }
    if (waited == -1) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE, errno_string("waitpid")));
    }

    if (WIFSIGNALED(status)) {
        auto failure = signal_failure(WTERMSIG(status), limits_);
        spdlog::warn("sandbox: {}", failure.message());
        return R::err(failure);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailed && output.empty()) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE,
                            "Sandbox helper could not be started: " + limits_.helper_path));
    }

    json reply = json::parse(output, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.contains("ok") ||
        !reply["ok"].is_boolean()) {
        return R::err(Error(ErrorCode::SANDBOX_FAILURE, "Sandbox helper returned an invalid reply"));
    }
    if (reply["ok"].get<bool>()) {
        return R::ok(reply.value("value", json()));
    }
    std::string message = "Script error";
    if (reply.contains("error") && reply["error"].is_string()) {
        message = reply["error"].get<std::string>();
    }
    return R::err(Error(ErrorCode::SCRIPT_ERROR, message));
}

} // namespace cbroker
