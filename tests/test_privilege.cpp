#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"

// Only checks that can run in-process; loading a seccomp filter here would
// constrain the rest of the test binary.

namespace secret_hunter {

TEST(PrivilegeTest, IsPrivilegeAvailable) {
    bool result = is_privilege_available();
#ifdef SECRET_HUNTER_HAVE_LIBCAP
    EXPECT_TRUE(result);
#else
    EXPECT_FALSE(result);
#endif
}

TEST(PrivilegeTest, IsSeccompAvailable) {
    bool result = is_seccomp_available();
#ifdef SECRET_HUNTER_HAVE_SECCOMP
    EXPECT_TRUE(result);
#else
    EXPECT_FALSE(result);
#endif
}

TEST(PrivilegeTest, GetSeccompAllowedSyscallsCount) {
    int count = get_seccomp_allowed_syscalls_count();
#ifdef SECRET_HUNTER_HAVE_SECCOMP
    EXPECT_GT(count, 0);
#else
    EXPECT_EQ(count, 0);
#endif
}

#ifndef SECRET_HUNTER_HAVE_SECCOMP
TEST(PrivilegeTest, SeccompReportsFailureWhenNotCompiledIn) {
    Logger::instance().set_level(LogLevel::Error);
    EXPECT_FALSE(apply_seccomp_profile());
    Logger::instance().set_level(LogLevel::Info);
}
#endif

// Runs last in this binary: clearing capabilities cannot be undone.
TEST(PrivilegeTest, DropCapabilities) {
    Logger::instance().set_level(LogLevel::Error);
    EXPECT_TRUE(drop_capabilities(false));
    Logger::instance().set_level(LogLevel::Info);
}

}
