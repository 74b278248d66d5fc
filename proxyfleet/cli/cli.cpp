#include "cli.h"
#include <iostream>
#include <string_view>
#include <string>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>

#include "command_hashing.h"
#include "ipc_client.h"
#include "../daemon/daemon.h"
#include "../daemon/daemon_config.h"
#include "../daemon/daemon_handler.h"
#include "../shared/paths.h"

// Socket the CLI talks to: PROXYFLEET_SOCKET, then config.lua, then the default
static std::string resolve_socket_path()
{
    const char* env = std::getenv("PROXYFLEET_SOCKET");
    if (env && env[0])
        return env;

    auto paths = proxyfleet_paths::resolve();
    daemon_config cfg = daemon_config::defaults(paths);

    std::string error;
    if (!load_daemon_config(paths.config_path.string(), cfg, error))
        std::cerr << "warning: " << error << "\n";

    return cfg.socket_path;
}

static bool ensure_daemon()
{
    if (daemon_handler::is_running())
        return true;

    pid_t pid = fork();
    if (pid < 0)
        return false;

    if (pid == 0)
    {
        // Child: become daemon
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0)
        {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > 2)
                close(devnull);
        }

        // Re-exec as daemon (use /proc/self/exe for reliable path)
        char self_exe[4096];
        ssize_t len = readlink("/proc/self/exe", self_exe, sizeof(self_exe) - 1);
        if (len > 0)
        {
            self_exe[len] = '\0';
            execl(self_exe, self_exe, "daemon", nullptr);
        }
        _exit(1);
    }

    // Parent: wait for daemon to be ready. Restoring running instances
    // happens before the socket answers, so allow a few seconds.
    for (int i = 0; i < 250; ++i)   // 250 * 20ms = 5s max
    {
        usleep(20000);
        if (daemon_handler::is_running())
            return true;
    }

    return false;
}

void cli_usage()
{
    std::cout <<
        "usage: proxyfleet <command> [args]\n"
        "\n"
        "  create forward <name> -p <port> [--https] [--dpi] [--cn name] [--user u:p]... [-s]\n"
        "  create tunnel <name> -p <port> --forward <host:port> [--cover domain] [--cn name] [-s]\n"
        "  start|stop|restart|remove <name> [name...]\n"
        "  update <name> [--port N] [--https|--no-https] [--dpi|--no-dpi]\n"
        "                [--forward host:port] [--cover domain|--no-cover] [--cn name]\n"
        "  ls [-s]\n"
        "  show <name>\n"
        "  user add <name> <user> <password>\n"
        "  user rm <name> <user>\n"
        "  user ls <name>\n"
        "  cert regen <name> [--cn name] [--days N] [--bits N]\n"
        "  cert info <name>\n"
        "  logs <name> [daemon|access|cache|error] [-n lines]\n"
        "  logs clear <name>\n"
        "  test <name> --user u --password p [--url http(s)://host/path]\n"
        "  test <name> cover|forward\n"
        "  ovpn <name> <file.ovpn> [--host h] [--user u --password p] > patched.ovpn\n"
        "  daemon [--log-level level] [--config path]\n";
}

int cli_dispatch(int argc, char** argv)
{
    if (argc < 2)
    {
        cli_usage();
        return 1;
    }

    std::string_view cmd = argv[1];

    switch (fnv1a(cmd))
    {
        case fnv1a("daemon"):
            return cli_daemon(argc, argv);

        case fnv1a("help"):
        case fnv1a("-h"):
        case fnv1a("--help"):
            cli_usage();
            return 0;

        case fnv1a("version"):
        case fnv1a("--version"):
            std::cout << "proxyfleet " << PROXYFLEET_VERSION << "\n";
            return 0;

        default:
            break;
    }

    daemon_handler::socket_path = resolve_socket_path();

    switch (fnv1a(cmd))
    {
        case fnv1a("create"):
        case fnv1a("start"):
        case fnv1a("stop"):
        case fnv1a("restart"):
        case fnv1a("remove"):
        case fnv1a("rm"):
        case fnv1a("update"):
        case fnv1a("ls"):
        case fnv1a("show"):
        case fnv1a("user"):
        case fnv1a("cert"):
        case fnv1a("logs"):
        case fnv1a("test"):
        case fnv1a("ovpn"):
            break;

        default:
            std::cerr << "unknown command: " << cmd << "\n";
            return 1;
    }

    // All other commands need the daemon; auto-start if not running
    if (!ensure_daemon())
    {
        std::cerr << "failed to start daemon\n";
        return 2;
    }

    return cli_forward(argc, argv);
}

int cli_forward(int argc, char** argv)
{
    // The daemon has its own working directory, so profile paths go absolute
    bool is_ovpn = std::string_view(argv[1]) == "ovpn";

    std::string command;
    for (int i = 1; i < argc; ++i)
    {
        if (i > 1) command += ' ';
        if (is_ovpn && i == 3)
        {
            std::error_code ec;
            auto path = std::filesystem::absolute(argv[i], ec);
            command += ec ? std::string(argv[i]) : path.string();
        }
        else
        {
            command += argv[i];
        }
    }

    std::string data;
    int exit_code = ipc_send(daemon_handler::socket_path, command, data);

    if (exit_code < 0)
    {
        std::cerr << "failed to connect to daemon\n";
        return 2;
    }

    if (!data.empty())
        (exit_code == 0 ? std::cout : std::cerr) << data;

    return exit_code;
}

int cli_daemon(int argc, char** argv)
{
    return daemon_start(argc, argv);
}
