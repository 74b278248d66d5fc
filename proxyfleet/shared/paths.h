#pragma once
#include <filesystem>
#include <string>

struct proxyfleet_paths
{
    std::filesystem::path socket_path;
    std::filesystem::path data_dir;      // instances/ lives here
    std::filesystem::path config_path;   // daemon config.lua
    bool system_mode = false;            // true when running as root

    static proxyfleet_paths resolve();
};
