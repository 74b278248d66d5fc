#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "../shared/op_result.h"

// Rewrites OpenVPN client profiles so they connect through one of our
// instances. Lines other than the rewritten ones are kept byte for byte.

constexpr size_t max_ovpn_size = 1024 * 1024;

// Non-empty, at most max_ovpn_size, and at least one known directive
// outside comments. Fails with err_validation.
op_result validate_ovpn_content(std::string_view content);

// Drops existing http-proxy lines and adds "http-proxy <host> <port>" after
// the first `client` line (or at the top). With a username and password an
// inline <http-proxy-user-pass> block follows it.
std::string patch_ovpn_for_forward_proxy(std::string_view content, std::string_view proxy_host,
                                         uint16_t proxy_port, std::string_view username = {},
                                         std::string_view password = {});

// Replaces the first `remote` line with "remote <host> <port>" (or adds one
// after `client`, or at the top). `vpn_server` receives the replaced
// endpoint as host:port, port 1194 when the line had none, and stays empty
// when there was no remote line.
std::string patch_ovpn_for_tunnel(std::string_view content, std::string_view tunnel_host,
                                  uint16_t tunnel_port, std::string& vpn_server);
