// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tickprobe::app {

/**
 * @brief Parameters used to launch a tickprobe_worker process.
 */
struct WorkerLaunchConfig {
    /// Executable name or path of the worker binary.
    std::string worker_bin{"tickprobe_worker"};

    /// Configuration file the worker loads.
    std::string config_path{"tickprobe.yaml"};

    /// Identifier echoed back by the worker.
    std::string probe_id{"default"};

    /// server|client|local
    std::string role{"server"};

    /// Overrides for the config file values, when set.
    std::optional<std::string> address;
    std::optional<double> duration_seconds;
};

/**
 * @brief Result of a worker spawn attempt.
 */
struct WorkerSpawnResult {
    /// Raw waitpid() status, or -1 when the process could not be started.
    int status{-1};

    /// Everything the worker wrote to stdout.
    std::string output;
};

/// Command line handed to the worker (argv[0] included).
std::vector<std::string> build_worker_argv(const WorkerLaunchConfig& cfg);

/**
 * @brief Fork/exec the worker, capture its stdout and wait for it to exit.
 */
WorkerSpawnResult spawn_worker_process(const WorkerLaunchConfig& cfg);

} // namespace tickprobe::app
