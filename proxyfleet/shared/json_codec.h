#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

// Minimal JSON for flat metadata records. Objects are one level deep with
// string, integer and boolean values, which is all instance.json needs.

std::string json_escape(std::string_view s);
std::string json_unescape(std::string_view s);

bool json_has_key(const std::string& json, std::string_view key);
std::string json_get_string(const std::string& json, std::string_view key);
bool json_get_bool(const std::string& json, std::string_view key, bool default_val = false);
int64_t json_get_int(const std::string& json, std::string_view key, int64_t default_val = 0);

// Pretty-printed flat object writer ("    \"key\": value,\n" per field)
class json_object_writer
{
public:
    json_object_writer& field(std::string_view key, std::string_view value);
    json_object_writer& field(std::string_view key, const char* value) { return field(key, std::string_view(value)); }
    json_object_writer& field(std::string_view key, int value) { return field(key, static_cast<int64_t>(value)); }
    json_object_writer& field(std::string_view key, int64_t value);
    json_object_writer& field(std::string_view key, bool value);

    std::string str() const;

private:
    void key(std::string_view k);

    std::ostringstream m_out;
    bool m_first = true;
};
