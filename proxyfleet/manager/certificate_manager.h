#pragma once
#include <filesystem>
#include <string>
#include <string_view>

#include "../shared/file_util.h"
#include "instance.h"

struct cert_params
{
    std::string common_name;
    int validity_days = 365;
    int key_size = 2048;
};

struct cert_info
{
    std::string common_name;
    std::string not_before;    // ISO-8601 UTC
    std::string not_after;
    int key_size = 0;
    std::string serial;        // hex
    std::string fingerprint;   // SHA-256, colon separated hex
};

// Self-signed server certificate per instance in certs/server.{crt,key}.
// Both files are written temp-then-rename, mode 0640.
class certificate_manager
{
public:
    static constexpr int min_key_size = 2048;
    static constexpr int max_key_size = 8192;
    static constexpr int max_validity_days = 3650;

    certificate_manager(std::filesystem::path instances_dir, file_owner owner);

    static op_result validate(const cert_params& params);

    op_result generate(std::string_view instance, const cert_params& params);

    // Same as generate; the caller restarts the daemon afterwards
    op_result regenerate(std::string_view instance, const cert_params& params)
    {
        return generate(instance, params);
    }

    // Generates only when the certificate or the key is missing
    op_result ensure(std::string_view instance, const cert_params& params);

    op_result info(std::string_view instance, cert_info& out) const;

    bool exists(std::string_view instance) const;

private:
    std::filesystem::path m_instances_dir;
    file_owner m_owner;
};
