// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/grpc/ProbeService.h"

#include "tickprobe/app/core/ProbeDriver.h"
#include "tickprobe/app/core/WorkerLauncher.h"
#include "tickprobe/config/ConfigJson.h"

#include <grpcpp/grpcpp.h>
#include <nlohmann/json.hpp>

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace tickprobe::grpc_service {

namespace {

/**
 * @brief Parse a "key=value" line into separate key and value strings.
 */
bool parse_kv_line(const std::string& line, std::string& key, std::string& value) {
    auto pos = line.find('=');
    if (pos == std::string::npos) return false;
    key = line.substr(0, pos);
    value = line.substr(pos + 1);
    return true;
}

} // namespace

ProbeServiceImpl::ProbeServiceImpl(const Config& defaults, std::string config_path, LoggerPtr log)
    : defaults_(defaults), config_path_(std::move(config_path)), log_(std::move(log)) {}

std::string ProbeServiceImpl::write_merged_config(const std::string& override_json,
                                                  std::string& error) const {
    nlohmann::json patch;
    try {
        patch = nlohmann::json::parse(override_json);
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid config override: ") + e.what();
        return {};
    }
    if (!patch.is_object()) {
        error = "invalid config override: expected a JSON object";
        return {};
    }

    auto merged = load_config_json(config_path_);
    if (!merged) {
        TPLOG_WARN(log_, "Failed to load base config %s, applying override alone", config_path_.c_str());
        merged = nlohmann::json::object();
    }
    merged->merge_patch(patch);

    // The temp file sits beside the base config so the worker finds config_schema.json.
    std::filesystem::path base_dir = std::filesystem::path(config_path_).parent_path();
    if (base_dir.empty()) base_dir = std::filesystem::current_path();
    std::string pattern = (base_dir / "tickprobe_cfg_XXXXXX.yaml").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), 5); // ".yaml"
    if (fd < 0) {
        error = "failed to create temp config file in " + base_dir.string();
        return {};
    }
    std::string path = buf.data();
    {
        std::ofstream ofs(path);
        // JSON is a YAML subset.
        ofs << merged->dump(2);
        if (!ofs) {
            close(fd);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            error = "failed to write temp config " + path;
            return {};
        }
    }
    close(fd);
    return path;
}

void ProbeServiceImpl::apply_worker_output(const std::string& output,
                                           tickprobe::api::StartProbeResponse& response) {
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();
        const std::string line = output.substr(start, end - start);
        start = end + 1;
        if (line.empty()) continue;

        std::string k, v;
        if (!parse_kv_line(line, k, v)) continue;

        try {
            if (k == "status") response.set_status(v);
            else if (k == "probe_id") response.set_probe_id(v);
            else if (k == "role") response.set_role(v);
            else if (k == "error") response.set_error(v);
            else if (k == "has_data") response.set_has_data(v == "1");
            else if (k == "total_ticks") response.set_total_ticks(std::stoull(v));
            else if (k == "messages_received") response.set_messages_received(std::stoull(v));
            else if (k == "messages_sent" || k == "client_messages_sent") response.set_messages_sent(std::stoull(v));
            else if (k == "out_of_order") response.set_out_of_order(std::stoull(v));
            else if (k == "lost") response.set_lost(std::stoull(v));
            else if (k == "loss_percent") response.set_loss_percent(std::stod(v));
            else if (k == "batched_ticks") response.set_batched_ticks(std::stoull(v));
            else if (k == "empty_ticks") response.set_empty_ticks(std::stoull(v));
            else if (k == "max_batch") response.set_max_batch(std::stoull(v));
            else if (k == "sequence_first") response.set_sequence_first(std::stoull(v));
            else if (k == "sequence_last") response.set_sequence_last(std::stoull(v));
            else if (k == "json") response.set_json_summary(v);
        } catch (const std::logic_error&) {
            // Malformed numeric value; the field keeps its default.
            continue;
        }
    }

    if (response.status().empty()) {
        response.set_status("error");
    }
}

::grpc::Status ProbeServiceImpl::StartProbe(::grpc::ServerContext*,
                                            const tickprobe::api::StartProbeRequest* request,
                                            tickprobe::api::StartProbeResponse* response) {
    if (!request || !response) {
        return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "missing request");
    }

    const std::string role_text = request->role().empty() ? defaults_.probe.role : request->role();
    const auto role = parse_role(role_text);
    if (!role) {
        return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "unknown role: " + role_text);
    }

    app::WorkerLaunchConfig worker_cfg{};
    // Prefer local build path for the worker binary if present.
    const std::filesystem::path local_worker = std::filesystem::current_path() / "build" / "tickprobe_worker";
    worker_cfg.worker_bin = std::filesystem::exists(local_worker) ? local_worker.string() : worker_bin_;
    worker_cfg.config_path = config_path_;
    worker_cfg.probe_id = request->probe_id().empty() ? "default" : request->probe_id();
    worker_cfg.role = to_string(*role);
    if (request->has_address() && !request->address().empty()) {
        worker_cfg.address = request->address();
    }
    if (request->has_duration_seconds()) {
        worker_cfg.duration_seconds = request->duration_seconds();
    }

    TPLOG_INFO(log_, "[grpc_start] probe_id=%s role=%s override_bytes=%zu",
               worker_cfg.probe_id.c_str(),
               worker_cfg.role.c_str(),
               request->has_config_override_json() ? request->config_override_json().size() : 0);

    std::string temp_config_path;
    if (request->has_config_override_json() && !request->config_override_json().empty()) {
        std::string error;
        temp_config_path = write_merged_config(request->config_override_json(), error);
        if (temp_config_path.empty()) {
            TPLOG_ERROR(log_, "[grpc_start] %s", error.c_str());
            return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, error);
        }
        TPLOG_DEBUG(log_, "[grpc_config] wrote merged override to %s", temp_config_path.c_str());
        worker_cfg.config_path = temp_config_path;
    }

    const auto spawned = app::spawn_worker_process(worker_cfg);
    if (spawned.status != 0) {
        TPLOG_ERROR(log_, "[grpc_start] worker exited with status=%d", spawned.status);
    }
    if (!temp_config_path.empty()) {
        std::error_code ec;
        std::filesystem::remove(temp_config_path, ec);
        if (ec) {
            TPLOG_WARN(log_, "Failed to remove temp config %s: %s",
                       temp_config_path.c_str(), ec.message().c_str());
        }
    }

    apply_worker_output(spawned.output, *response);
    if (response->probe_id().empty()) response->set_probe_id(worker_cfg.probe_id);
    if (response->role().empty()) response->set_role(worker_cfg.role);
    if (response->status() == "error" && response->error().empty()) {
        response->set_error(spawned.status < 0 ? "failed to start worker " + worker_cfg.worker_bin
                                               : "worker exited with status " + std::to_string(spawned.status));
    }

    TPLOG_INFO(log_, "[grpc_end] probe_id=%s status=%s ticks=%llu received=%llu lost=%llu",
               response->probe_id().c_str(),
               response->status().c_str(),
               static_cast<unsigned long long>(response->total_ticks()),
               static_cast<unsigned long long>(response->messages_received()),
               static_cast<unsigned long long>(response->lost()));

    return ::grpc::Status::OK;
}

} // namespace tickprobe::grpc_service
