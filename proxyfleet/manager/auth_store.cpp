#include "auth_store.h"
#include "password_hash.h"
#include "../shared/logging.h"

#include <utility>

namespace fs = std::filesystem;

auth_store::auth_store(fs::path instances_dir, file_owner owner)
    : m_instances_dir(std::move(instances_dir)), m_owner(owner)
{
}

op_result auth_store::path_for(std::string_view instance, fs::path& out) const
{
    if (auto r = validate_name(instance); !r)
        return r;
    out = instance_layout(m_instances_dir, instance).passwd();
    return op_result::ok();
}

op_result auth_store::load(const fs::path& path, entry_map& entries) const
{
    entries.clear();

    std::string content;
    auto r = read_file(path, content);
    if (r.code == err_not_found)
        return op_result::ok();
    if (!r)
        return r;

    size_t pos = 0;
    while (pos < content.size())
    {
        size_t nl = content.find('\n', pos);
        if (nl == std::string::npos)
            nl = content.size();

        std::string_view line(content.data() + pos, nl - pos);
        pos = nl + 1;

        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty() || line.front() == '#')
            continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0)
        {
            LOG_WARNF("skipping malformed line in %s", path.c_str());
            continue;
        }
        entries.emplace(std::string(line.substr(0, colon)), std::string(line.substr(colon + 1)));
    }
    return op_result::ok();
}

op_result auth_store::save(const fs::path& path, const entry_map& entries) const
{
    std::string content;
    for (const auto& [user, hash] : entries)
    {
        content += user;
        content += ':';
        content += hash;
        content += '\n';
    }
    return write_file_atomic(path, content, 0640, m_owner);
}

op_result auth_store::add(std::string_view instance, std::string_view user, std::string_view password)
{
    if (auto r = validate_username(user); !r)
        return r;
    if (auto r = validate_password(password); !r)
        return r;

    fs::path path;
    if (auto r = path_for(instance, path); !r)
        return r;

    entry_map entries;
    if (auto r = load(path, entries); !r)
        return r;

    if (entries.find(user) != entries.end())
        return op_result::fail(err_duplicate_user,
            "user '" + std::string(user) + "' already exists on " + std::string(instance));

    std::string salt = apr1_random_salt();
    std::string hash = salt.empty() ? std::string() : apr1_crypt(password, salt);
    if (hash.empty())
        return op_result::fail(err_io, "could not hash password");

    entries.emplace(std::string(user), std::move(hash));
    return save(path, entries);
}

op_result auth_store::remove(std::string_view instance, std::string_view user)
{
    if (auto r = validate_username(user); !r)
        return r;

    fs::path path;
    if (auto r = path_for(instance, path); !r)
        return r;

    entry_map entries;
    if (auto r = load(path, entries); !r)
        return r;

    auto it = entries.find(user);
    if (it == entries.end())
        return op_result::fail(err_not_found,
            "user '" + std::string(user) + "' not found on " + std::string(instance));

    entries.erase(it);
    return save(path, entries);
}

op_result auth_store::list(std::string_view instance, std::vector<std::string>& users) const
{
    users.clear();

    fs::path path;
    if (auto r = path_for(instance, path); !r)
        return r;

    entry_map entries;
    if (auto r = load(path, entries); !r)
        return r;

    users.reserve(entries.size());
    for (const auto& [user, hash] : entries)
        users.push_back(user);
    return op_result::ok();
}

op_result auth_store::verify(std::string_view instance, std::string_view user,
                             std::string_view password, bool& matches) const
{
    matches = false;

    fs::path path;
    if (auto r = path_for(instance, path); !r)
        return r;

    entry_map entries;
    if (auto r = load(path, entries); !r)
        return r;

    auto it = entries.find(user);
    if (it == entries.end())
        return op_result::fail(err_not_found, "user '" + std::string(user) + "' not found");

    matches = apr1_verify(password, it->second);
    return op_result::ok();
}

op_result auth_store::ensure_file(std::string_view instance)
{
    fs::path path;
    if (auto r = path_for(instance, path); !r)
        return r;
    return touch_file(path, 0640, m_owner);
}

bool auth_store::has_users(std::string_view instance) const
{
    std::vector<std::string> users;
    return list(instance, users).is_ok() && !users.empty();
}
