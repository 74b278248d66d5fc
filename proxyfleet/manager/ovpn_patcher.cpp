#include "ovpn_patcher.h"

#include <array>
#include <vector>

namespace {

constexpr std::array<std::string_view, 15> known_directives = {
    "client", "dev", "proto", "remote", "resolv-retry", "nobind", "persist-key",
    "persist-tun", "ca", "cert", "key", "tls-auth", "tls-crypt", "cipher", "verb"
};

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r';
}

// Whitespace-separated words of one line
std::vector<std::string_view> words(std::string_view line)
{
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && is_space(line[i]))
            ++i;
        size_t start = i;
        while (i < line.size() && !is_space(line[i]))
            ++i;
        if (i > start)
            out.push_back(line.substr(start, i - start));
    }
    return out;
}

std::string_view directive(std::string_view line)
{
    auto w = words(line);
    return w.empty() ? std::string_view() : w.front();
}

std::vector<std::string> split_lines(std::string_view content)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (true)
    {
        size_t nl = content.find('\n', start);
        if (nl == std::string_view::npos)
        {
            lines.emplace_back(content.substr(start));
            break;
        }
        lines.emplace_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

// Index just past the first `client` line, or 0
size_t insert_position(const std::vector<std::string>& lines)
{
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (directive(lines[i]) == "client")
            return i + 1;
    }
    return 0;
}

} // namespace

op_result validate_ovpn_content(std::string_view content)
{
    bool blank = true;
    for (char c : content)
    {
        if (!is_space(c) && c != '\n')
        {
            blank = false;
            break;
        }
    }
    if (blank)
        return op_result::fail(err_validation, "file is empty");

    if (content.size() > max_ovpn_size)
        return op_result::fail(err_validation, "file too large (max 1MB)");

    for (const auto& line : split_lines(content))
    {
        std::string_view d = directive(line);
        if (d.empty() || d.front() == '#' || d.front() == ';')
            continue;
        for (auto known : known_directives)
        {
            if (d == known)
                return op_result::ok();
        }
    }

    return op_result::fail(err_validation, "file does not look like an OpenVPN config");
}

std::string patch_ovpn_for_forward_proxy(std::string_view content, std::string_view proxy_host,
                                         uint16_t proxy_port, std::string_view username,
                                         std::string_view password)
{
    std::vector<std::string> lines;
    for (auto& line : split_lines(content))
    {
        if (directive(line) != "http-proxy")
            lines.push_back(std::move(line));
    }

    std::vector<std::string> block;
    block.push_back("http-proxy " + std::string(proxy_host) + " " + std::to_string(proxy_port));
    if (!username.empty() && !password.empty())
    {
        block.emplace_back("<http-proxy-user-pass>");
        block.emplace_back(username);
        block.emplace_back(password);
        block.emplace_back("</http-proxy-user-pass>");
    }

    size_t at = insert_position(lines);
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at), block.begin(), block.end());
    return join_lines(lines);
}

std::string patch_ovpn_for_tunnel(std::string_view content, std::string_view tunnel_host,
                                  uint16_t tunnel_port, std::string& vpn_server)
{
    vpn_server.clear();

    std::vector<std::string> lines = split_lines(content);
    std::string remote = "remote " + std::string(tunnel_host) + " " + std::to_string(tunnel_port);

    for (auto& line : lines)
    {
        auto w = words(line);
        if (w.empty() || w.front() != "remote")
            continue;

        if (w.size() >= 3)
            vpn_server = std::string(w[1]) + ":" + std::string(w[2]);
        else if (w.size() == 2)
            vpn_server = std::string(w[1]) + ":1194";

        line = remote;
        return join_lines(lines);
    }

    size_t at = insert_position(lines);
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(at), remote);
    return join_lines(lines);
}
