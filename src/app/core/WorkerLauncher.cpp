// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/WorkerLauncher.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>
#include <utility>

namespace tickprobe::app {

std::vector<std::string> build_worker_argv(const WorkerLaunchConfig& cfg) {
    std::vector<std::string> args;
    auto add = [&](std::string v) { args.push_back(std::move(v)); };

    add(cfg.worker_bin);
    add("--config");
    add(cfg.config_path);
    add("--probe-id");
    add(cfg.probe_id);
    add("--role");
    add(cfg.role);

    if (cfg.address && !cfg.address->empty()) {
        add("--address");
        add(*cfg.address);
    }
    if (cfg.duration_seconds) {
        std::ostringstream oss;
        oss << *cfg.duration_seconds;
        add("--duration");
        add(oss.str());
    }
    return args;
}

WorkerSpawnResult spawn_worker_process(const WorkerLaunchConfig& cfg) {
    int pipefd[2];
    WorkerSpawnResult result;

    // Built before fork so the child only execs.
    const auto argv_storage = build_worker_argv(cfg);
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (const auto& s : argv_storage) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    if (pipe(pipefd) != 0) {
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdout into the pipe, stderr stays with the daemon.
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(cfg.worker_bin.c_str(), argv.data());
        _exit(127);
    }

    close(pipefd[1]);
    char buf[512];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = -1;
            break;
        }
    }
    result.status = status;
    return result;
}

} // namespace tickprobe::app
