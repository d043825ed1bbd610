// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/config.h"
#include "ctr_adapter/container_record.h"
#include "ctr_adapter/state_directory.h"

#include <vector>

#include <sys/types.h>

namespace ctr_adapter::impl {

struct monitor_stdio
{
    // -1: stdin is /dev/null, output only goes to the log. Descriptors are
    // expected to be close-on-exec, the runtime only gets its own copies.
    int input{ -1 };
    int output{ -1 };
    int error{ -1 };
    // descriptors of the caller the monitor must not keep open, e.g. the
    // write end of the stdin pipe
    std::vector<int> caller_only;
};

// Forks the monitor of a container. The monitor runs the OCI runtime in the
// foreground, copies the container output into the log (and to the attached
// streams), writes <tmp_dir>/exits/<id> and marks the record exited.
// Returns the pid of the monitor once the runtime has been executed; a
// failure to execute it is thrown as std::system_error.
auto spawn_monitor(const container_record &record,
                   state_directory &states,
                   const runtime_config &config,
                   const monitor_stdio &stdio) -> pid_t;

} // namespace ctr_adapter::impl
