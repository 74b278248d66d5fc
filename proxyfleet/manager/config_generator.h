#pragma once
#include <string>
#include <string_view>

#include "instance.h"
#include "manager_config.h"

// Renders daemon configuration text from instance parameters. Output depends
// only on the arguments and the binary/helper paths in manager_config.
class config_generator
{
public:
    explicit config_generator(const manager_config& cfg);

    // squid.conf or nginx.conf body, depending on the record's proxy kind.
    // Forward proxies always require basic auth against the instance's
    // passwd file; with no users in it nobody is admitted.
    std::string generate(const instance_record& record, const instance_layout& layout) const;

    std::string generate_squid(const instance_record& record, const instance_layout& layout) const;
    std::string generate_nginx(const instance_record& record, const instance_layout& layout) const;

    static std::string default_cover_page();

    // Instance name usable inside an nginx variable name
    static std::string safe_name(std::string_view name);

private:
    const manager_config& m_cfg;
};
