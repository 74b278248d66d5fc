#include "paths.h"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace fs = std::filesystem;

static fs::path get_home()
{
    const char* home = std::getenv("HOME");
    if (home && home[0])
        return home;

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir)
        return pw->pw_dir;

    return {};
}

proxyfleet_paths proxyfleet_paths::resolve()
{
    proxyfleet_paths p;

    if (getuid() == 0)
    {
        p.system_mode = true;
        p.socket_path = "/run/proxyfleet/proxyfleet.sock";
        p.data_dir    = "/var/lib/proxyfleet";
        p.config_path = "/etc/proxyfleet/config.lua";
    }
    else
    {
        p.system_mode = false;

        const char* runtime = std::getenv("XDG_RUNTIME_DIR");
        if (runtime && runtime[0])
            p.socket_path = fs::path(runtime) / "proxyfleet.sock";
        else
            p.socket_path = "/tmp/proxyfleet-" + std::to_string(getuid()) + ".sock";

        fs::path home = get_home();
        if (!home.empty())
        {
            p.data_dir    = home / ".local" / "share" / "proxyfleet";
            p.config_path = home / ".config" / "proxyfleet" / "config.lua";
        }
        else
        {
            p.data_dir = "/tmp/proxyfleet-" + std::to_string(getuid());
            p.config_path.clear();
        }
    }

    // An explicit config file wins over the default location
    const char* override_path = std::getenv("PROXYFLEET_CONFIG");
    if (override_path && override_path[0])
        p.config_path = override_path;

    return p;
}
