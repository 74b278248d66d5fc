#include "daemon.h"
#include "daemon_config.h"
#include "daemon_handler.h"
#include "task_pool.h"
#include "../manager/proxy_manager.h"
#include "../shared/event_loop.h"
#include "../shared/file_util.h"
#include "../shared/logging.h"
#include "../shared/paths.h"

#include <csignal>
#include <cstdlib>
#include <unistd.h>
#include <string>
#include <string_view>

static int g_signal_write_fd = -1;

static void signal_handler(int)
{
    if (g_signal_write_fd >= 0)
    {
        char c = 1;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
        write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    }
}

void install_signal_handlers(int signal_write_fd)
{
    g_signal_write_fd = signal_write_fd;

    // Broken client connections surface as -EPIPE on the write CQE
    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
}

static void restore_instances(proxy_manager& manager)
{
    auto outcomes = manager.restore();

    size_t failed = 0;
    for (const auto& o : outcomes)
    {
        if (!o.result)
            ++failed;
    }

    if (failed > 0)
        LOG_WARNF("restore: %zu of %zu instance(s) failed to start", failed, outcomes.size());
    else if (!outcomes.empty())
        LOG_INFOF("restore: %zu instance(s) running", outcomes.size());
}

int daemon_start(int argc, char** argv)
{
    auto paths = proxyfleet_paths::resolve();

    std::string config_path = paths.config_path.string();
    std::string cli_level;

    for (int i = 2; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc)
            cli_level = argv[++i];
        else if ((arg == "--config" || arg == "-c") && i + 1 < argc)
            config_path = argv[++i];
        else
        {
            LOG_ERRORF("unknown daemon flag: %s", argv[i]);
            return 1;
        }
    }

    daemon_config cfg = daemon_config::defaults(paths);

    std::string error;
    if (!load_daemon_config(config_path, cfg, error))
    {
        LOG_ERRORF("[config] %s", error.c_str());
        return 1;
    }

    if (!cli_level.empty() && !parse_log_level(cli_level, cfg.level))
    {
        LOG_ERRORF("invalid log level: %s", cli_level.c_str());
        return 1;
    }
    logger::g_level = cfg.level;

    if (!cfg.log_file.empty() && !logger::open_file(cfg.log_file.c_str()))
        LOG_WARNF("cannot open log file %s", cfg.log_file.c_str());

    daemon_handler::socket_path = cfg.socket_path;

    // If another daemon is already running on this socket, exit gracefully
    if (daemon_handler::is_running())
        return 0;

    if (paths.system_mode)
    {
        if (auto r = ensure_directory(paths.socket_path.parent_path(), 0750); !r)
        {
            LOG_ERRORF("%s", r.message.c_str());
            return 1;
        }
    }

    proxy_manager manager(cfg.manager);
    if (auto r = manager.init(); !r)
    {
        LOG_ERRORF("cannot initialize %s: %s", cfg.manager.data_dir.c_str(), r.describe().c_str());
        return 1;
    }

    event_loop loop;
    if (!loop.init())
    {
        LOG_ERROR("failed to init event loop");
        return 1;
    }

    task_pool pool(static_cast<size_t>(cfg.workers));

    daemon_handler handler(manager, loop, pool);
    handler.set_monitor_interval(cfg.monitor_interval);

    if (!handler.setup())
    {
        LOG_ERROR("failed to setup ipc socket");
        return 1;
    }

    // A signal during the restore is held in the pipe; the loop then exits
    // on its first pass and the shutdown below stops what was started
    install_signal_handlers(loop.get_signal_write_fd());

    // Bring back the instances that were running before the last shutdown
    restore_instances(manager);

    LOG_INFOF("daemon started (data %s, socket %s)",
        cfg.manager.data_dir.c_str(), daemon_handler::socket_path.c_str());

    loop.run();

    g_signal_write_fd = -1;

    // Finish commands already handed to workers, then stop the daemons.
    // Desired states are kept so the next start restores the same set.
    pool.stop();
    manager.shutdown();
    handler.teardown();

    LOG_INFO("daemon stopped");
    logger::close_file();

    return 0;
}
