#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/file_util.h"
#include "instance.h"

// Per-instance credential file ("user:$apr1$..." lines, sorted, mode 0640).
// The file path is built from the validated instance name only, so one
// instance's calls never reach another instance's file. Callers hold the
// instance lock.
class auth_store
{
public:
    auth_store(std::filesystem::path instances_dir, file_owner owner);

    op_result add(std::string_view instance, std::string_view user, std::string_view password);
    op_result remove(std::string_view instance, std::string_view user);
    op_result list(std::string_view instance, std::vector<std::string>& users) const;
    op_result verify(std::string_view instance, std::string_view user, std::string_view password,
                     bool& matches) const;

    // Creates an empty credential file if missing
    op_result ensure_file(std::string_view instance);

    bool has_users(std::string_view instance) const;

private:
    using entry_map = std::map<std::string, std::string, std::less<>>;

    op_result path_for(std::string_view instance, std::filesystem::path& out) const;
    op_result load(const std::filesystem::path& path, entry_map& entries) const;
    op_result save(const std::filesystem::path& path, const entry_map& entries) const;

    std::filesystem::path m_instances_dir;
    file_owner m_owner;
};
