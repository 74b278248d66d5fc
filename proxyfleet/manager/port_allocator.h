#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

#include "instance.h"

// Port claims are derived from the registry records, so there is no separate
// allocation table to keep in sync. Callers hold the registry claim lock
// between reserve() and the commit.
class port_allocator
{
public:
    static constexpr uint16_t min_port = 1024;
    static constexpr uint16_t max_port = 65535;
    static constexpr uint16_t cover_scan_start = 20000;

    // err_validation outside 1024..65535, err_port_conflict if another
    // instance (other than `excluding`) listens on it or uses it as cover port
    static op_result reserve(int64_t port, const std::vector<instance_record>& records,
                             std::string_view excluding = {});

    static bool is_claimed(uint16_t port, const std::vector<instance_record>& records,
                           std::string_view excluding = {});

    // Loopback port for a tunnel's cover site: port+10000, else port+1000,
    // else the first free port from 20000 upward. Returns 0 if none is free.
    static uint16_t pick_cover_port(uint16_t port, const std::vector<instance_record>& records,
                                    std::string_view excluding = {});
};
