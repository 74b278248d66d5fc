#include "logging.h"
#include "../cli/command_hashing.h"

bool parse_log_level(std::string_view str, log_level& level)
{
    switch (fnv1a(str))
    {
        case fnv1a("debug"): level = log_debug; return true;
        case fnv1a("info"):  level = log_info;  return true;
        case fnv1a("warn"):  level = log_warn;  return true;
        case fnv1a("error"): level = log_error; return true;
        default: return false;
    }
}

bool logger::open_file(const char* path)
{
    std::FILE* f = std::fopen(path, "ae");
    if (!f)
        return false;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file)
        std::fclose(s_file);
    s_file = f;
    return true;
}

void logger::close_file()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file)
    {
        std::fclose(s_file);
        s_file = nullptr;
    }
}
