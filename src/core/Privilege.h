// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
namespace secret_hunter {
// Clears every capability, optionally keeping CAP_DAC_READ_SEARCH so unreadable
// trees can still be listed. Returns false if the new set could not be applied.
bool drop_capabilities(bool keep_cap_dac);
// Installs an allowlist covering directory walking, file reads, output writes
// and worker threads. Returns false if the filter could not be loaded.
bool apply_seccomp_profile();
bool is_privilege_available();
bool is_seccomp_available();
int get_seccomp_allowed_syscalls_count();
}
