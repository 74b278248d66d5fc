#include "daemon_config.h"
#include "../shared/paths.h"

#include <unistd.h>
#include <sol/sol.hpp>

daemon_config daemon_config::defaults(const proxyfleet_paths& paths)
{
    daemon_config cfg;
    cfg.socket_path = paths.socket_path.string();
    cfg.manager.data_dir = paths.data_dir;
    if (paths.system_mode)
        cfg.manager.runtime_user = "proxy";
    return cfg;
}

namespace {

bool read_string(sol::table& t, const char* key, std::string& out)
{
    sol::object v = t[key];
    if (!v.valid() || v.get_type() == sol::type::lua_nil)
        return true;
    if (v.get_type() != sol::type::string)
        return false;
    out = v.as<std::string>();
    return true;
}

bool read_int(sol::table& t, const char* key, int64_t min, int64_t max, int64_t& out)
{
    sol::object v = t[key];
    if (!v.valid() || v.get_type() == sol::type::lua_nil)
        return true;
    if (v.get_type() != sol::type::number)
        return false;
    int64_t n = v.as<int64_t>();
    if (n < min || n > max)
        return false;
    out = n;
    return true;
}

} // namespace

bool load_daemon_config(const std::string& path, daemon_config& cfg, std::string& error)
{
    if (path.empty() || access(path.c_str(), R_OK) != 0)
        return true;

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::os);

    auto result = lua.safe_script_file(path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        error = std::string("error loading ") + path + ": " + err.what();
        return false;
    }

    sol::optional<sol::table> table = lua["config"];
    if (!table)
        return true;

    sol::table t = *table;
    auto bad = [&error](const char* key) {
        error = std::string("config.") + key + " has an invalid value";
        return false;
    };

    std::string data_dir = cfg.manager.data_dir.string();
    if (!read_string(t, "data_dir", data_dir)) return bad("data_dir");
    cfg.manager.data_dir = data_dir;

    if (!read_string(t, "socket_path", cfg.socket_path)) return bad("socket_path");
    if (!read_string(t, "log_file", cfg.log_file)) return bad("log_file");

    std::string level;
    if (!read_string(t, "log_level", level)) return bad("log_level");
    if (!level.empty() && !parse_log_level(level, cfg.level))
        return bad("log_level");

    if (!read_string(t, "squid_binary", cfg.manager.squid_binary)) return bad("squid_binary");
    if (!read_string(t, "nginx_binary", cfg.manager.nginx_binary)) return bad("nginx_binary");
    if (!read_string(t, "auth_helper", cfg.manager.auth_helper)) return bad("auth_helper");
    if (!read_string(t, "nginx_stream_module", cfg.manager.nginx_stream_module))
        return bad("nginx_stream_module");
    if (!read_string(t, "runtime_user", cfg.manager.runtime_user)) return bad("runtime_user");

    int64_t workers = cfg.workers;
    if (!read_int(t, "workers", 1, 64, workers)) return bad("workers");
    cfg.workers = static_cast<int>(workers);

    int64_t monitor = cfg.monitor_interval.count();
    if (!read_int(t, "monitor_interval_ms", 100, 3600000, monitor)) return bad("monitor_interval_ms");
    cfg.monitor_interval = std::chrono::milliseconds(monitor);

    int64_t ready = cfg.manager.ready_timeout.count();
    if (!read_int(t, "ready_timeout_ms", 100, 600000, ready)) return bad("ready_timeout_ms");
    cfg.manager.ready_timeout = std::chrono::milliseconds(ready);

    int64_t stop = cfg.manager.stop_timeout.count();
    if (!read_int(t, "stop_timeout_ms", 100, 600000, stop)) return bad("stop_timeout_ms");
    cfg.manager.stop_timeout = std::chrono::milliseconds(stop);

    return true;
}
