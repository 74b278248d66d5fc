#pragma once
#include <chrono>
#include <string>

#include "../manager/manager_config.h"
#include "../shared/logging.h"

struct proxyfleet_paths;

struct daemon_config
{
    manager_config manager;

    std::string socket_path;
    std::string log_file;
    log_level level = log_info;

    int workers = 4;
    std::chrono::milliseconds monitor_interval{2000};

    // Defaults derived from the resolved paths
    static daemon_config defaults(const proxyfleet_paths& paths);
};

// Evaluates config.lua and applies its global `config` table on top of
// `cfg`. A missing file is not an error. Returns false with `error` set when
// the script fails or a key has an unusable value.
bool load_daemon_config(const std::string& path, daemon_config& cfg, std::string& error);
