#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../shared/file_util.h"
#include "instance.h"

// Durable instance records: <instances_dir>/<name>/instance.json. Every read
// goes to disk; there is no cache to fall out of sync with other tooling.
class instance_registry
{
public:
    instance_registry(std::filesystem::path instances_dir, file_owner owner);

    // Creates the instances directory and sweeps leftovers of interrupted
    // creates and removes
    op_result init();

    // Name and port uniqueness are checked and committed under the claim
    // lock. A tunnel without a cover port gets one assigned here. On success
    // `record` holds the stored values (timestamps, cover port).
    op_result create(instance_record& record);

    op_result get(std::string_view name, instance_record& out) const;

    // Sorted by name; unreadable or malformed records are skipped with a warning
    std::vector<instance_record> list() const;

    // Rewrites an existing record. Port changes are re-checked under the
    // claim lock. Sets updated_at.
    op_result update(instance_record& record);

    // Removes the record and the whole instance directory
    op_result remove(std::string_view name);

    bool exists(std::string_view name) const;

    const std::filesystem::path& instances_dir() const { return m_instances_dir; }

    static std::string format_json(const instance_record& record);
    static op_result parse_json(const std::string& json, instance_record& out);

private:
    op_result read_record(const std::filesystem::path& dir, instance_record& out) const;
    op_result check_ports(instance_record& record, std::string_view excluding) const;

    std::filesystem::path m_instances_dir;
    file_owner m_owner;
    mutable std::mutex m_claim_mutex;
};
