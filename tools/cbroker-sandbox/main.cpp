/**
 * cbroker-sandbox - transform script helper (JSONata)
 *
 * Started by the broker's SandboxExecutor, one process per script. Lowers
 * its own limits, installs a syscall filter, then reads one request from
 * stdin and writes one reply to stdout. Never logs.
 */

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "cbroker/script.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <new>
#include <string>
#include <vector>

#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>

namespace {

using json = nlohmann::json;

constexpr int kSetupFailed = 2;

#if defined(__x86_64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t kAuditArch = AUDIT_ARCH_AARCH64;
#else
#error "cbroker-sandbox: no seccomp architecture mapping for this target"
#endif

bool set_limit(int resource, rlim_t value, rlim_t hard_slack = 0) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value + hard_slack;
    return ::setrlimit(resource, &rl) == 0;
}

bool apply_rlimits(uint64_t memory_mb, uint64_t cpu_seconds) {
    // SIGXCPU at the soft limit; the hard limit (SIGKILL) follows a second later.
    if (cpu_seconds > 0 && !set_limit(RLIMIT_CPU, static_cast<rlim_t>(cpu_seconds), 1)) return false;
    if (memory_mb > 0 && !set_limit(RLIMIT_AS, static_cast<rlim_t>(memory_mb) * 1024 * 1024)) return false;
    // stdin/stdout/stderr stay usable; nothing new can be opened or spawned.
    return set_limit(RLIMIT_NOFILE, 3) &&
           set_limit(RLIMIT_NPROC, 0) &&
           set_limit(RLIMIT_CORE, 0) &&
           set_limit(RLIMIT_FSIZE, 0);
}

// Everything else fails with EPERM: no open, socket, connect, clone, execve.
const std::vector<long>& allowed_syscalls() {
    static const std::vector<long> list = {
        SYS_read, SYS_write, SYS_close, SYS_lseek,
        SYS_fstat, SYS_newfstatat,
        SYS_brk, SYS_mmap, SYS_munmap, SYS_mremap, SYS_madvise, SYS_mprotect,
        SYS_futex, SYS_clock_gettime,
        SYS_rt_sigreturn, SYS_rt_sigprocmask,
        SYS_exit, SYS_exit_group,
    };
    return list;
}

bool install_seccomp() {
    std::vector<sock_filter> prog;
    prog.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    prog.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, kAuditArch, 1, 0));
    prog.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    prog.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
#if defined(__x86_64__)
    // x32 syscall numbers alias the allowlist; refuse them outright.
    prog.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0x40000000u, 0, 1));
    prog.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
#endif
    for (long nr : allowed_syscalls()) {
        prog.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1));
        prog.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    }
    prog.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA)));

    struct sock_fprog fprog;
    fprog.len = static_cast<unsigned short>(prog.size());
    fprog.filter = prog.data();

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) return false;
    return ::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &fprog) == 0;
}

void reply(const json& j) {
    std::cout << j.dump(-1, ' ', false, json::error_handler_t::replace);
    std::cout.flush();
}

} // namespace

int main(int argc, char** argv) {
    uint64_t memory_mb = 256;
    uint64_t cpu_seconds = 5;

    CLI::App app{"cbroker-sandbox - isolated transform script runner"};
    app.add_option("--memory-mb", memory_mb, "Address space limit in MiB (0 = none)");
    app.add_option("--cpu-seconds", cpu_seconds, "CPU time limit in seconds (0 = none)");
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        return kSetupFailed;
    }

    if (!apply_rlimits(memory_mb, cpu_seconds) || !install_seccomp()) {
        return kSetupFailed;
    }

    try {
        std::string raw((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        json request = json::parse(raw, nullptr, false);
        if (request.is_discarded() || !request.is_object() ||
            !request.contains("script") || !request["script"].is_string()) {
            reply({{"ok", false}, {"error", "malformed sandbox request"}});
            return 1;
        }

        auto result = cbroker::script::run_script(request["script"].get<std::string>(),
                                                  request.value("input", json()));
        if (result.ok) {
            reply({{"ok", true}, {"value", std::move(result.value)}});
        } else {
            reply({{"ok", false}, {"error", result.error}});
        }
    } catch (const std::bad_alloc&) {
        reply({{"ok", false}, {"error", "Script exceeded memory limit"}});
    } catch (const std::exception& e) {
        reply({{"ok", false}, {"error", e.what()}});
    }
    return 0;
}
