#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "../shared/op_result.h"

// Outcome of one end-to-end check. A check that ran but did not get
// through is not an op_result failure: success stays false and message
// says where it stopped.
struct connectivity_result
{
    bool success = false;
    int http_code = 0;
    std::string message;
};

struct target_url
{
    bool tls = false;
    std::string host;
    uint16_t port = 0;
    std::string path = "/";
};

// http://host[:port][/path] or https://...; err_validation otherwise
op_result parse_target_url(std::string_view url, target_url& out);

struct check_timeouts
{
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds io{10000};
};

// Fetches `target` through the forward proxy on 127.0.0.1:proxy_port with
// basic auth. `proxy_tls` wraps the proxy connection itself in TLS (an
// https_port proxy). https targets go through CONNECT. Certificates are
// not verified on either hop.
connectivity_result check_forward_proxy(uint16_t proxy_port, bool proxy_tls, std::string_view username,
                                        std::string_view password, const target_url& target,
                                        const check_timeouts& timeouts = {});

// TLS handshake with `sni`, then GET / on host:port
connectivity_result check_tls_site(std::string_view host, uint16_t port, std::string_view sni,
                                   const check_timeouts& timeouts = {});

// Plain TCP connect to host:port; success when it is accepted in time
connectivity_result check_tcp_endpoint(std::string_view host, uint16_t port,
                                       const check_timeouts& timeouts = {});

// 200, 301, 302 and 307 count as getting through
bool is_success_status(int http_code);

// "Basic <base64(user:password)>"
std::string basic_auth_header(std::string_view username, std::string_view password);
