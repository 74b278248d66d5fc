#pragma once
#include <chrono>
#include <filesystem>
#include <string>

// Settings shared by the lifecycle components. Loaded by the daemon from
// config.lua; tests fill it in directly.
struct manager_config
{
    std::filesystem::path data_dir;

    std::string squid_binary = "/usr/sbin/squid";
    std::string nginx_binary = "/usr/sbin/nginx";
    std::string auth_helper  = "/usr/lib/squid/basic_ncsa_auth";

    // "load_module <path>;" emitted when nginx needs the stream module loaded
    std::string nginx_stream_module;

    // Daemon runtime user: artifacts are chowned to it when running as root
    std::string runtime_user;

    std::chrono::milliseconds ready_timeout{5000};
    std::chrono::milliseconds stop_timeout{5000};

    std::filesystem::path instances_dir() const { return data_dir / "instances"; }
};
