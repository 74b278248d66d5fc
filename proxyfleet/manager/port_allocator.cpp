#include "port_allocator.h"

bool port_allocator::is_claimed(uint16_t port, const std::vector<instance_record>& records,
                                std::string_view excluding)
{
    for (const auto& rec : records)
    {
        if (!excluding.empty() && rec.name == excluding)
            continue;
        for (uint16_t p : rec.claimed_ports())
        {
            if (p == port)
                return true;
        }
    }
    return false;
}

op_result port_allocator::reserve(int64_t port, const std::vector<instance_record>& records,
                                  std::string_view excluding)
{
    if (auto r = validate_port(port); !r)
        return r;

    if (is_claimed(static_cast<uint16_t>(port), records, excluding))
        return op_result::fail(err_port_conflict,
            "port " + std::to_string(port) + " is already claimed by another instance");

    return op_result::ok();
}

uint16_t port_allocator::pick_cover_port(uint16_t port, const std::vector<instance_record>& records,
                                         std::string_view excluding)
{
    for (uint32_t offset : {10000u, 1000u})
    {
        uint32_t candidate = port + offset;
        if (candidate <= max_port && candidate != port &&
            !is_claimed(static_cast<uint16_t>(candidate), records, excluding))
            return static_cast<uint16_t>(candidate);
    }

    for (uint32_t candidate = cover_scan_start; candidate <= max_port; ++candidate)
    {
        if (candidate != port && !is_claimed(static_cast<uint16_t>(candidate), records, excluding))
            return static_cast<uint16_t>(candidate);
    }
    return 0;
}
