#include "json_codec.h"

#include <charconv>
#include <cstdio>

std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 4);
    for (char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string json_unescape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '\\' && i + 1 < s.size())
        {
            ++i;
            switch (s[i])
            {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':
                {
                    // Only the control-character range we emit ourselves
                    unsigned code = 0;
                    if (i + 4 < s.size())
                    {
                        auto [ptr, ec] = std::from_chars(s.data() + i + 1, s.data() + i + 5, code, 16);
                        if (ec == std::errc{} && ptr == s.data() + i + 5 && code < 0x80)
                        {
                            out += static_cast<char>(code);
                            i += 4;
                            break;
                        }
                    }
                    out += "\\u";
                    break;
                }
                default:   out += '\\'; out += s[i]; break;
            }
        }
        else
        {
            out += s[i];
        }
    }
    return out;
}

namespace {

// Position just after the ':' following "key", or npos. Only matches a key
// position: the quoted token must be followed by a colon.
size_t find_value(const std::string& json, std::string_view key)
{
    std::string needle;
    needle.reserve(key.size() + 2);
    needle += '"';
    needle += key;
    needle += '"';

    size_t pos = 0;
    while ((pos = json.find(needle, pos)) != std::string::npos)
    {
        size_t after = json.find_first_not_of(" \t\n\r", pos + needle.size());
        if (after != std::string::npos && json[after] == ':')
            return json.find_first_not_of(" \t\n\r", after + 1);
        pos += needle.size();
    }
    return std::string::npos;
}

} // namespace

bool json_has_key(const std::string& json, std::string_view key)
{
    return find_value(json, key) != std::string::npos;
}

std::string json_get_string(const std::string& json, std::string_view key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string::npos)
        return {};

    if (json[pos] == '"')
    {
        ++pos;
        std::string raw;
        while (pos < json.size() && json[pos] != '"')
        {
            if (json[pos] == '\\' && pos + 1 < json.size())
            {
                raw += json[pos];
                raw += json[pos + 1];
                pos += 2;
            }
            else
            {
                raw += json[pos];
                ++pos;
            }
        }
        return json_unescape(raw);
    }

    // Not a string: extract until comma or closing brace
    size_t end = json.find_first_of(",}", pos);
    if (end == std::string::npos)
        end = json.size();
    std::string val = json.substr(pos, end - pos);
    while (!val.empty() && (val.back() == ' ' || val.back() == '\n' || val.back() == '\r' || val.back() == '\t'))
        val.pop_back();
    return val;
}

bool json_get_bool(const std::string& json, std::string_view key, bool default_val)
{
    std::string v = json_get_string(json, key);
    if (v == "true")  return true;
    if (v == "false") return false;
    return default_val;
}

int64_t json_get_int(const std::string& json, std::string_view key, int64_t default_val)
{
    std::string v = json_get_string(json, key);
    if (v.empty())
        return default_val;

    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || ptr != v.data() + v.size())
        return default_val;
    return out;
}

// ─── json_object_writer ───

void json_object_writer::key(std::string_view k)
{
    if (m_first)
    {
        m_out << "{\n";
        m_first = false;
    }
    else
    {
        m_out << ",\n";
    }
    m_out << "    \"" << json_escape(k) << "\": ";
}

json_object_writer& json_object_writer::field(std::string_view k, std::string_view value)
{
    key(k);
    m_out << '"' << json_escape(value) << '"';
    return *this;
}

json_object_writer& json_object_writer::field(std::string_view k, int64_t value)
{
    key(k);
    m_out << value;
    return *this;
}

json_object_writer& json_object_writer::field(std::string_view k, bool value)
{
    key(k);
    m_out << (value ? "true" : "false");
    return *this;
}

std::string json_object_writer::str() const
{
    if (m_first)
        return "{}\n";
    return m_out.str() + "\n}\n";
}
