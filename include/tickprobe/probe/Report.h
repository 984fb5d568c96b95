// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Report.h
 * @brief Rendering of ServerStats / ClientStats.
 *
 * Three renderings are provided: a human-readable block for the CLI, flat
 * key=value lines parsed by the control daemon, and a JSON document.
 */

#include "tickprobe/probe/StatsCollector.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace tickprobe {

void write_server_report(std::ostream& os, const ServerStats& stats);
void write_client_report(std::ostream& os, const ClientStats& stats);

/// One "key=value" line per metric, each key prefixed with @p prefix.
void write_server_kv(std::ostream& os, const ServerStats& stats, const std::string& prefix = {});
void write_client_kv(std::ostream& os, const ClientStats& stats, const std::string& prefix = {});

nlohmann::json to_json(const ServerStats& stats);
nlohmann::json to_json(const ClientStats& stats);

} // namespace tickprobe
