// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "browser_launcher.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace magpie {

namespace {

#ifdef __APPLE__
constexpr const char* OPENER = "open";
#else
constexpr const char* OPENER = "xdg-open";
#endif

bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

} // namespace

bool spawn_detached(const std::string& program, const std::string& arg) {
    // The grandchild reports a failed exec through this pipe. A successful
    // exec closes the write end, so the parent reads EOF.
    int report[2];
    if (pipe(report) != 0) {
        spdlog::warn("[Browser] pipe failed: {}", strerror(errno));
        return false;
    }
    if (!set_cloexec(report[0]) || !set_cloexec(report[1])) {
        spdlog::warn("[Browser] Cannot mark pipe close-on-exec: {}", strerror(errno));
        close(report[0]);
        close(report[1]);
        return false;
    }

    // Double fork so the program is reparented and never becomes a zombie
    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("[Browser] fork failed: {}", strerror(errno));
        close(report[0]);
        close(report[1]);
        return false;
    }

    if (pid == 0) {
        close(report[0]);
        pid_t grandchild = fork();
        if (grandchild != 0) {
            if (grandchild < 0) {
                int err = errno;
                ssize_t n = write(report[1], &err, sizeof(err));
                (void)n;
            }
            _exit(grandchild < 0 ? 1 : 0);
        }
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execlp(program.c_str(), program.c_str(), arg.c_str(), static_cast<char*>(nullptr));
        int err = errno;
        ssize_t n = write(report[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    close(report[1]);

    int status = 0;
    pid_t reaped;
    do {
        reaped = waitpid(pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    int child_errno = 0;
    ssize_t got;
    do {
        got = read(report[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close(report[0]);

    if (got > 0) {
        spdlog::warn("[Browser] Could not start {}: {}", program, strerror(child_errno));
        return false;
    }
    if (reaped < 0 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::warn("[Browser] Could not start {}", program);
        return false;
    }

    spdlog::debug("[Browser] Launched {}", program);
    return true;
}

bool open_in_browser(const std::string& url) {
    return spawn_detached(OPENER, url);
}

} // namespace magpie
