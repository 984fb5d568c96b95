// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/app/core/ProbeDriver.h"
#include "tickprobe/config/Config.h"
#include "tickprobe/grpc/ProbeService.h"
#include "tickprobe/log/Log.h"

#include <grpcpp/grpcpp.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <signal.h>
#include <system_error>
#include <thread>

namespace {

struct DaemonArgs {
    std::string config_path{"configs/tickprobe.yaml"};
    std::string listen{"0.0.0.0:50051"};
    std::optional<std::string> log_level;
};

DaemonArgs parse_args(int argc, char** argv) {
    DaemonArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            args.listen = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            args.log_level = argv[++i];
        }
    }
    return args;
}

// Worker binary installed next to this executable, if any.
std::optional<std::string> sibling_worker() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    const auto candidate = self.parent_path() / "tickprobe_worker";
    if (!std::filesystem::exists(candidate, ec)) return std::nullopt;
    return candidate.string();
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    auto cfg = tickprobe::Config::from_file(args.config_path);
    const bool loaded = cfg.has_value();
    if (!cfg) cfg = tickprobe::Config{};
    if (args.log_level) cfg->log_level = *args.log_level;

    auto log = tickprobe::make_logger(tickprobe::logger_config_from(*cfg), "tickprobed");
    if (!loaded) {
        TPLOG_WARN(log, "Failed to load config at %s, using defaults", args.config_path.c_str());
    }

    tickprobe::grpc_service::ProbeServiceImpl service(*cfg, args.config_path, log);
    if (auto worker = sibling_worker()) {
        service.set_worker_bin(*worker);
    }

    ::grpc::ServerBuilder builder;
    builder.AddListeningPort(args.listen, ::grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<::grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        TPLOG_ERROR(log, "Failed to start tickprobed gRPC server on %s", args.listen.c_str());
        return 1;
    }

    TPLOG_INFO(log, "tickprobed listening on %s", args.listen.c_str());
    // Handle SIGINT/SIGTERM for graceful shutdown using sigwait.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    std::thread sig_thread([&]() {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            TPLOG_INFO(log, "tickprobed received signal %d, shutting down...", sig);
            server->Shutdown();
        }
    });

    server->Wait();
    if (sig_thread.joinable()) sig_thread.join();

    TPLOG_INFO(log, "tickprobed shutdown complete");
    return 0;
}
