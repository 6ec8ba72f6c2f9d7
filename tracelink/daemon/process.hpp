// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace tracelink {

enum class SpawnRole {
    Launcher,  // original process; should exit 0 right away
    Worker,    // detached child in its own session; runs the daemon
};

// Forks a detached worker. The worker starts a new session and redirects stdin to /dev/null.
// Throws std::runtime_error if the fork fails.
SpawnRole spawn_detached();

}  // namespace tracelink
