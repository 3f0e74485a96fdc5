#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <unistd.h>
#ifdef SECRET_HUNTER_HAVE_LIBCAP
#include <sys/capability.h>
#endif
#ifdef SECRET_HUNTER_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace secret_hunter {

#ifdef SECRET_HUNTER_HAVE_SECCOMP
namespace {
    const int kAllowedSyscalls[] = {
        SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(writev), SCMP_SYS(pread64), SCMP_SYS(open), SCMP_SYS(openat),
        SCMP_SYS(close), SCMP_SYS(fstat), SCMP_SYS(newfstatat), SCMP_SYS(stat), SCMP_SYS(lstat), SCMP_SYS(statx),
        SCMP_SYS(lseek), SCMP_SYS(getdents64), SCMP_SYS(fcntl), SCMP_SYS(readlink), SCMP_SYS(readlinkat),
        SCMP_SYS(access), SCMP_SYS(getcwd), SCMP_SYS(ioctl),
        SCMP_SYS(mmap), SCMP_SYS(mprotect), SCMP_SYS(munmap), SCMP_SYS(mremap), SCMP_SYS(madvise), SCMP_SYS(brk),
        SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
        SCMP_SYS(futex), SCMP_SYS(clone), SCMP_SYS(clone3), SCMP_SYS(set_robust_list), SCMP_SYS(rseq),
        SCMP_SYS(sched_yield), SCMP_SYS(getpid), SCMP_SYS(gettid), SCMP_SYS(clock_gettime), SCMP_SYS(nanosleep),
        SCMP_SYS(getrandom), SCMP_SYS(prlimit64), SCMP_SYS(getuid), SCMP_SYS(geteuid), SCMP_SYS(getgid),
        SCMP_SYS(getegid), SCMP_SYS(exit), SCMP_SYS(exit_group)
    };
}
#endif

// Helper function to log current capability state
static void log_capabilities(const std::string& context) {
#ifdef SECRET_HUNTER_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if(cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    (void)context;
#endif
}

bool drop_capabilities(bool keep_cap_dac) {
#ifdef SECRET_HUNTER_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keep_cap_dac=" + std::string(keep_cap_dac ? "true" : "false") + ")");
    log_capabilities("before drop");

    cap_t caps = cap_get_proc();
    if(!caps) {
        Logger::instance().error("cap_get_proc failed");
        return false;
    }
    cap_clear(caps);
    if(keep_cap_dac) {
        cap_value_t v = CAP_DAC_READ_SEARCH;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
    }
    bool ok = cap_set_proc(caps) == 0;
    if(!ok) Logger::instance().error("cap_set_proc failed");
    else log_capabilities("after drop");
    cap_free(caps);
    return ok;
#else
    (void)keep_cap_dac;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
    return true;
#endif
}

bool apply_seccomp_profile() {
#ifdef SECRET_HUNTER_HAVE_SECCOMP
    static bool seccomp_applied = false;
    if(seccomp_applied) return true;

    Logger::instance().info("Applying seccomp profile");
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_KILL_PROCESS);
    if(!ctx) {
        Logger::instance().error("Failed to initialize seccomp context");
        return false;
    }
    for(int c : kAllowedSyscalls) {
        // syscalls unknown on this architecture resolve to negative numbers
        if(c < 0) continue;
        if(seccomp_rule_add(ctx, SCMP_ACT_ALLOW, c, 0) != 0) {
            Logger::instance().error("Failed to allow syscall " + std::to_string(c) + " in seccomp");
            seccomp_release(ctx);
            return false;
        }
    }
    if(seccomp_load(ctx) != 0) {
        Logger::instance().error("Failed to load seccomp profile");
        seccomp_release(ctx);
        return false;
    }
    seccomp_release(ctx);
    seccomp_applied = true;
    return true;
#else
    Logger::instance().info("Seccomp not available (not compiled in)");
    return false;
#endif
}

bool is_privilege_available() {
#ifdef SECRET_HUNTER_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

bool is_seccomp_available() {
#ifdef SECRET_HUNTER_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

int get_seccomp_allowed_syscalls_count() {
#ifdef SECRET_HUNTER_HAVE_SECCOMP
    return static_cast<int>(sizeof(kAllowedSyscalls) / sizeof(kAllowedSyscalls[0]));
#else
    return 0;
#endif
}

}
