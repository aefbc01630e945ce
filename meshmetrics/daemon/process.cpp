// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <tt-logger/tt-logger.hpp>

#include <daemon/process.hpp>
#include <utils/assert.hpp>
#include <utils/atomic_file.hpp>

namespace meshmetrics {

namespace {

size_t lookup_buffer_size(int name) {
    long size = ::sysconf(name);
    return size > 0 ? static_cast<size_t>(size) : 16384;
}

void fork_and_exit_parent(const char* which) {
    pid_t pid = ::fork();
    MESHMETRICS_FATAL(pid >= 0, "Fork #{} failed: {}", which, std::strerror(errno));
    if (pid > 0) {
        ::_exit(0);
    }
}

void redirect_stdio_to_null() {
    int null_fd = ::open("/dev/null", O_RDWR);
    MESHMETRICS_FATAL(null_fd >= 0, "Cannot open /dev/null: {}", std::strerror(errno));
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        MESHMETRICS_FATAL(::dup2(null_fd, fd) >= 0, "Cannot redirect fd {}: {}", fd, std::strerror(errno));
    }
    if (null_fd > STDERR_FILENO) {
        ::close(null_fd);
    }
}

gid_t lookup_group(const std::string& name) {
    std::vector<char> buffer(lookup_buffer_size(_SC_GETGR_R_SIZE_MAX));
    struct group entry {};
    struct group* result = nullptr;
    int rc = ::getgrnam_r(name.c_str(), &entry, buffer.data(), buffer.size(), &result);
    MESHMETRICS_FATAL(rc == 0 && result != nullptr, "Group not found: {}", name);
    return entry.gr_gid;
}

struct UserEntry {
    uid_t uid;
    gid_t gid;
};

UserEntry lookup_user(const std::string& name) {
    std::vector<char> buffer(lookup_buffer_size(_SC_GETPW_R_SIZE_MAX));
    struct passwd entry {};
    struct passwd* result = nullptr;
    int rc = ::getpwnam_r(name.c_str(), &entry, buffer.data(), buffer.size(), &result);
    MESHMETRICS_FATAL(rc == 0 && result != nullptr, "User not found: {}", name);
    return UserEntry{.uid = entry.pw_uid, .gid = entry.pw_gid};
}

}  // namespace

void daemonize() {
    fork_and_exit_parent("1");

    MESHMETRICS_FATAL(::chdir("/") == 0, "chdir(\"/\") failed: {}", std::strerror(errno));
    MESHMETRICS_FATAL(::setsid() >= 0, "setsid failed: {}", std::strerror(errno));
    ::umask(0);

    fork_and_exit_parent("2");

    redirect_stdio_to_null();
}

bool drop_privileges(const PrivilegeTarget& target) {
    if (::geteuid() != 0) {
        return false;
    }
    if (target.user.empty() && target.group.empty()) {
        return false;
    }

    // Resolve both names before changing anything so a typo fails without a half-dropped process
    std::optional<gid_t> gid;
    if (!target.group.empty()) {
        gid = lookup_group(target.group);
    }
    std::optional<UserEntry> user;
    if (!target.user.empty()) {
        user = lookup_user(target.user);
    }

    if (gid) {
        MESHMETRICS_FATAL(
            ::setgroups(1, &*gid) == 0,
            "Cannot set supplementary groups for {}: {}",
            target.group,
            std::strerror(errno));
        MESHMETRICS_FATAL(::setgid(*gid) == 0, "Cannot change to group: {}: {}", target.group, std::strerror(errno));
        log_info(tt::LogAlways, "Dropped to group: {}", target.group);
    } else if (user) {
        MESHMETRICS_FATAL(
            ::setgid(user->gid) == 0, "Cannot change to primary group of {}: {}", target.user, std::strerror(errno));
        MESHMETRICS_FATAL(
            ::initgroups(target.user.c_str(), user->gid) == 0,
            "Cannot set supplementary groups for {}: {}",
            target.user,
            std::strerror(errno));
    }

    if (user) {
        MESHMETRICS_FATAL(::setuid(user->uid) == 0, "Cannot change to user: {}: {}", target.user, std::strerror(errno));
        MESHMETRICS_FATAL(::setuid(0) != 0, "Privilege drop to {} is reversible", target.user);
        log_info(tt::LogAlways, "Dropped to user: {}", target.user);
    }
    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        write_file_in_place(path, fmt::format("{}\n", ::getpid()));
    } catch (const std::exception& e) {
        MESHMETRICS_THROW("Failed to write PID file {}: {}", path.string(), e.what());
    }
    log_debug(tt::LogAlways, "PID file written: {}", path.string());
}

ScopedSignalHandlers::ScopedSignalHandlers(std::initializer_list<std::pair<int, SignalHandler>> handlers) {
    installed_.reserve(handlers.size());
    for (const auto& [signal, handler] : handlers) {
        struct sigaction action {};
        action.sa_handler = handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;

        Installed entry{.signal = signal, .previous = {}};
        if (::sigaction(signal, &action, &entry.previous) != 0) {
            int error = errno;
            restore();
            MESHMETRICS_THROW("Cannot install handler for signal {}: {}", signal, std::strerror(error));
        }
        installed_.push_back(entry);
    }
}

ScopedSignalHandlers::~ScopedSignalHandlers() { restore(); }

void ScopedSignalHandlers::restore() {
    for (auto it = installed_.rbegin(); it != installed_.rend(); ++it) {
        if (::sigaction(it->signal, &it->previous, nullptr) != 0) {
            log_warning(tt::LogAlways, "Cannot restore handler for signal {}: {}", it->signal, std::strerror(errno));
        }
    }
    installed_.clear();
}

void remove_pid_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        log_debug(tt::LogAlways, "PID file removed: {}", path.string());
    } else if (ec) {
        log_warning(tt::LogAlways, "Failed to remove PID file {}: {}", path.string(), ec.message());
    }
}

}  // namespace meshmetrics
