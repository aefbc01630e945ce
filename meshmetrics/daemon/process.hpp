// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

/*
 * daemon/process.hpp
 *
 * POSIX process setup for running as a system service: detaching from the terminal, shedding root, and the PID
 * file. Every function throws std::runtime_error on failure; the caller treats all of them as fatal.
 */

#pragma once

#include <csignal>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace meshmetrics {

// Double fork, setsid, chdir("/"), umask(0) and stdio on /dev/null. Returns only in the grandchild.
void daemonize();

struct PrivilegeTarget {
    std::string user;
    std::string group;
};

/**
 * Switches to the target group, then the target user. Only acts when the effective uid is 0; otherwise, or when
 * neither name is set, it returns false without changing anything.
 *
 * With a group, the supplementary groups are reduced to that group. With only a user, the user's primary and
 * supplementary groups are adopted. After switching user, regaining root must be impossible.
 */
bool drop_privileges(const PrivilegeTarget& target);

// Writes "<pid>\n", creating the parent directory if needed.
void write_pid_file(const std::filesystem::path& path);

// A file that is already gone is not an error. Other failures are logged, never thrown.
void remove_pid_file(const std::filesystem::path& path);

using SignalHandler = void (*)(int);

/**
 * Installs signal dispositions for the lifetime of the object and restores the previous ones on destruction.
 *
 * Installation is all or nothing: if any sigaction() call fails, the dispositions already changed are restored
 * before the constructor throws.
 */
class ScopedSignalHandlers {
public:
    explicit ScopedSignalHandlers(std::initializer_list<std::pair<int, SignalHandler>> handlers);
    ~ScopedSignalHandlers();

    ScopedSignalHandlers(const ScopedSignalHandlers&) = delete;
    ScopedSignalHandlers& operator=(const ScopedSignalHandlers&) = delete;

private:
    void restore();

    struct Installed {
        int signal;
        struct sigaction previous;
    };
    std::vector<Installed> installed_;
};

}  // namespace meshmetrics
