#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <sys/types.h>

#include "op_result.h"

// Owner applied to generated artifacts so the daemon's runtime user can
// read them. Unset (the default) leaves ownership with the manager.
struct file_owner
{
    uid_t uid = static_cast<uid_t>(-1);
    gid_t gid = static_cast<gid_t>(-1);

    bool is_set() const { return uid != static_cast<uid_t>(-1); }

    // Looks up a system user; returns an unset owner if the name is empty
    // or the manager is not running as root.
    static file_owner resolve(std::string_view user_name);
};

// Write-to-temp then rename: readers see either the old or the new content,
// never a partial file. The temp file is fsync'ed and created with `mode`.
op_result write_file_atomic(const std::filesystem::path& path, std::string_view content,
                            mode_t mode, const file_owner& owner = {});

op_result read_file(const std::filesystem::path& path, std::string& out);

// mkdir -p with the given mode on the leaf directory
op_result ensure_directory(const std::filesystem::path& path, mode_t mode,
                           const file_owner& owner = {});

// Rejects directories any user may write into
op_result check_not_world_writable(const std::filesystem::path& dir);

// Creates an empty file with the given mode if it does not exist yet
op_result touch_file(const std::filesystem::path& path, mode_t mode,
                     const file_owner& owner = {});

std::string iso8601_now();
