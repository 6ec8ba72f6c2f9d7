// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include <tt-logger/tt-logger.hpp>

#include <tracelink/common/assert.hpp>
#include <tracelink/daemon/process.hpp>

namespace tracelink {

SpawnRole spawn_detached() {
    pid_t pid = fork();
    if (pid < 0) {
        TL_THROW("Failed to fork detached worker (errno={})", errno);
    }
    if (pid > 0) {
        log_info(tt::LogAlways, "[Lifecycle] Spawned detached worker with pid {}", pid);
        return SpawnRole::Launcher;
    }

    if (setsid() < 0) {
        log_warning(tt::LogAlways, "[Lifecycle] setsid() failed in worker (errno={})", errno);
    }
    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd >= 0) {
        if (dup2(null_fd, STDIN_FILENO) < 0) {
            log_warning(tt::LogAlways, "[Lifecycle] Failed to redirect stdin (errno={})", errno);
        }
        close(null_fd);
    }
    return SpawnRole::Worker;
}

}  // namespace tracelink
