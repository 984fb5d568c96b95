// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "tickprobe/config/Config.h"
#include "tickprobe/log/Log.h"
#include "tickprobe_service.grpc.pb.h"

#include <string>
#include <utility>

namespace tickprobe::grpc_service {

/**
 * @brief gRPC control service running probes in worker subprocesses.
 *
 * Each StartProbe call spawns one tickprobe_worker, waits for it and maps its
 * key=value output onto the response. The service keeps no per-probe state, so
 * concurrent calls from gRPC threads are independent.
 */
class ProbeServiceImpl final :
    public tickprobe::api::ProbeService::Service {
public:
    /**
     * @param defaults    Config supplying the role when a request leaves it empty.
     * @param config_path Base config handed to workers (and merged with overrides).
     * @param log         Daemon logger.
     */
    ProbeServiceImpl(const Config& defaults, std::string config_path, LoggerPtr log);

    /**
     * @brief Run one probe.
     *
     * @return INVALID_ARGUMENT for a missing request, an unknown role or a
     *         malformed override; OK otherwise (worker failures are reported
     *         through response->status()).
     */
    ::grpc::Status StartProbe(::grpc::ServerContext* context,
                              const tickprobe::api::StartProbeRequest* request,
                              tickprobe::api::StartProbeResponse* response) override;

    void set_worker_bin(std::string bin) { worker_bin_ = std::move(bin); }

    /**
     * @brief Write the base config merged with @p override_json to a temporary
     *        YAML file beside the base config.
     * @return Path of the temporary file; empty on failure with @p error set.
     */
    std::string write_merged_config(const std::string& override_json, std::string& error) const;

    /// Apply worker key=value output to @p response.
    static void apply_worker_output(const std::string& output, tickprobe::api::StartProbeResponse& response);

private:
    Config defaults_{};
    std::string config_path_{};
    LoggerPtr log_;
    std::string worker_bin_{"tickprobe_worker"};
};

} // namespace tickprobe::grpc_service
