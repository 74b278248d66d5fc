#pragma once
#include <cstdlib>
#include <filesystem>
#include <string>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "manager/manager_config.h"

#ifndef PROXYFLEET_FAKE_DAEMON
#define PROXYFLEET_FAKE_DAEMON "fake_daemon"
#endif

// mkdtemp directory removed with its contents on scope exit
struct temp_dir
{
    std::filesystem::path path;

    temp_dir()
    {
        char tmpl[] = "/tmp/proxyfleet-test-XXXXXX";
        if (mkdtemp(tmpl))
            path = tmpl;
    }

    ~temp_dir()
    {
        std::error_code ec;
        if (!path.empty())
            std::filesystem::remove_all(path, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;
};

// Settings pointing both daemon binaries at the fake_daemon fixture
inline manager_config test_config(const std::filesystem::path& data_dir)
{
    manager_config cfg;
    cfg.data_dir = data_dir;
    cfg.squid_binary = PROXYFLEET_FAKE_DAEMON;
    cfg.nginx_binary = PROXYFLEET_FAKE_DAEMON;
    cfg.auth_helper = "/usr/lib/squid/basic_ncsa_auth";
    cfg.ready_timeout = std::chrono::milliseconds(3000);
    cfg.stop_timeout = std::chrono::milliseconds(2000);
    return cfg;
}

// A port the kernel considers free right now (ephemeral range, >= 1024)
inline uint16_t free_port()
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return 0;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    uint16_t port = 0;
    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
        getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0)
        port = ntohs(addr.sin_port);

    close(fd);
    return port;
}
