// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <cerrno>
#include <cstdio>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <tt-logger/tt-logger.hpp>

#include <utils/atomic_file.hpp>
#include <utils/cleanup.hpp>

namespace meshmetrics {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void write_all(int fd, std::string_view content, const std::string& path) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_errno("write " + path);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

}  // namespace

void write_file_atomic(
    const std::filesystem::path& target, std::string_view content, const BeforeReplaceHook& before_replace) {
    std::filesystem::path directory = target.parent_path();
    if (directory.empty()) {
        directory = ".";
    }

    // .<name>.XXXXXX.tmp -- hidden so textfile collectors matching *.prom never pick it up
    std::string temp_template = (directory / ("." + target.filename().string() + ".XXXXXX.tmp")).string();
    std::vector<char> temp_name(temp_template.begin(), temp_template.end());
    temp_name.push_back('\0');

    int fd = ::mkstemps(temp_name.data(), 4);
    if (fd < 0) {
        throw_errno("create temporary file in " + directory.string());
    }
    const std::filesystem::path temp_path(temp_name.data());

    bool fd_open = true;
    bool temp_exists = true;
    auto cleanup = make_cleanup([&]() {
        if (fd_open) {
            ::close(fd);
        }
        if (temp_exists && ::unlink(temp_path.c_str()) != 0 && errno != ENOENT) {
            log_warning(tt::LogAlways, "Failed to remove temporary file {}", temp_path.string());
        }
    });

    // mkstemp creates 0600; published metrics must stay readable by the scraper
    if (::fchmod(fd, 0644) != 0) {
        throw_errno("chmod " + temp_path.string());
    }

    write_all(fd, content, temp_path.string());

    if (::fsync(fd) != 0) {
        throw_errno("fsync " + temp_path.string());
    }
    fd_open = false;
    if (::close(fd) != 0) {
        throw_errno("close " + temp_path.string());
    }

    if (before_replace) {
        before_replace(temp_path, target);
    }

    if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        throw_errno("rename " + temp_path.string() + " -> " + target.string());
    }
    temp_exists = false;

    // Persist the directory entry as well; failure here does not undo the (already visible) replacement
    int dir_fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        if (::fsync(dir_fd) != 0) {
            log_debug(tt::LogAlways, "fsync of directory {} failed (errno {})", directory.string(), errno);
        }
        ::close(dir_fd);
    }

    log_debug(tt::LogAlways, "Atomically wrote file: {}", target.string());
}

void write_file_in_place(const std::filesystem::path& target, std::string_view content) {
    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw_errno("open " + target.string());
    }
    auto close_fd = make_cleanup([fd]() { ::close(fd); });
    write_all(fd, content, target.string());
}

}  // namespace meshmetrics
