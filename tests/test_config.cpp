// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/config/Config.h"
#include "tickprobe/config/ConfigJson.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace {

// Scratch directory holding a config next to a copy of the schema.
fs::path make_config_dir(const std::string& name, const std::string& yaml) {
    fs::path dir = fs::temp_directory_path() / ("tickprobe_test_" + name + "_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    fs::copy_file(fs::path(TICKPROBE_CONFIG_DIR) / "config_schema.json",
                  dir / "config_schema.json",
                  fs::copy_options::overwrite_existing);
    std::ofstream(dir / "tickprobe.yaml") << yaml;
    return dir;
}

} // namespace

int main() {
    // Defaults.
    tickprobe::Config defaults;
    assert(defaults.probe.role == "server");
    assert(defaults.probe.address == "127.0.0.1:25570");
    assert(defaults.tick_period() == microseconds(15625));
    assert(defaults.send_interval() == microseconds(15625));
    assert(defaults.run_duration() == seconds(10));
    assert(defaults.transport.kind == "udp");

    // Shipped config loads and validates.
    auto shipped = tickprobe::Config::from_file(std::string(TICKPROBE_CONFIG_DIR) + "/tickprobe.yaml");
    assert(shipped);
    assert(shipped->probe.tick_rate_hz == 64.0);
    assert(shipped->transport.udp.resend_interval_ms == 100);

    // Custom values, including the ip/duration aliases.
    {
        auto dir = make_config_dir("custom",
                                   "log:\n  level: debug\n"
                                   "probe:\n  role: local\n  ip: 10.0.0.1:4000\n  duration: 2.5\n"
                                   "  tick_rate_hz: 32\n  send_rate_hz: 16\n"
                                   "transport:\n  kind: simulated\n  simulated:\n    loss_percent: 5\n"
                                   "    duplicate_every: 4\n    seed: 99\n");
        auto cfg = tickprobe::Config::from_file((dir / "tickprobe.yaml").string());
        assert(cfg);
        assert(cfg->log_level == "debug");
        assert(cfg->probe.role == "local");
        assert(cfg->probe.address == "10.0.0.1:4000");
        assert(cfg->run_duration() == milliseconds(2500));
        assert(cfg->tick_period() == microseconds(31250));
        assert(cfg->send_interval() == microseconds(62500));
        assert(cfg->transport.kind == "simulated");
        assert(cfg->transport.simulated.loss_percent == 5.0);
        assert(cfg->transport.simulated.duplicate_every == 4);
        assert(cfg->transport.simulated.seed == 99);

        auto as_json = tickprobe::load_config_json((dir / "tickprobe.yaml").string());
        assert(as_json);
        assert((*as_json)["probe"]["tick_rate_hz"] == 32);
        assert((*as_json)["probe"]["role"] == "local");
        fs::remove_all(dir);
    }

    // Schema rejects an unknown role.
    {
        auto dir = make_config_dir("badrole", "probe:\n  role: observer\n");
        assert(!tickprobe::Config::from_file((dir / "tickprobe.yaml").string()));
        fs::remove_all(dir);
    }

    // Missing file.
    assert(!tickprobe::Config::from_file("/nonexistent/tickprobe.yaml"));
    assert(!tickprobe::load_config_json("/nonexistent/tickprobe.yaml"));

    assert(tickprobe::seconds_to_duration(0.5) == milliseconds(500));

    return 0;
}
