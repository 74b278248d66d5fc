#include "config_generator.h"

#include <sstream>

config_generator::config_generator(const manager_config& cfg)
    : m_cfg(cfg)
{
}

std::string config_generator::generate(const instance_record& record, const instance_layout& layout) const
{
    if (record.kind() == proxy_tls_tunnel)
        return generate_nginx(record, layout);
    return generate_squid(record, layout);
}

std::string config_generator::safe_name(std::string_view name)
{
    std::string out(name);
    for (char& c : out)
    {
        if (c == '-' || c == '.')
            c = '_';
    }
    return out;
}

std::string config_generator::generate_squid(const instance_record& record,
                                             const instance_layout& layout) const
{
    const auto& fp = *record.forward();
    std::ostringstream out;

    out << "# squid configuration for instance " << record.name << "\n\n";

    if (fp.https_enabled)
    {
        // Terminates client TLS only; upstream traffic is never intercepted
        out << "https_port " << record.port
            << " tls-cert=" << layout.cert().string()
            << " tls-key=" << layout.key().string();
        if (fp.dpi_evasion_enabled)
            out << " tls-min-version=1.2";
        out << "\n";
    }
    else
    {
        out << "http_port " << record.port << "\n";
    }
    out << "\n";

    if (!m_cfg.runtime_user.empty())
        out << "cache_effective_user " << m_cfg.runtime_user << "\n";

    out << "pid_filename " << layout.pid_file(proxy_forward).string() << "\n"
        << "access_log stdio:" << (layout.logs_dir() / "access.log").string() << "\n"
        << "cache_log " << (layout.logs_dir() / "cache.log").string() << "\n"
        << "cache_store_log none\n"
        << "coredump_dir " << layout.run_dir().string() << "\n"
        << "cache deny all\n"
        << "shutdown_lifetime 1 seconds\n\n";

    out << "via off\n"
        << "forwarded_for delete\n"
        << "request_header_access X-Forwarded-For deny all\n";

    if (fp.dpi_evasion_enabled)
    {
        out << "httpd_suppress_version_string on\n"
            << "request_header_access Via deny all\n"
            << "reply_header_access Server deny all\n"
            << "reply_header_access Via deny all\n"
            << "reply_header_access X-Cache deny all\n"
            << "reply_header_access X-Cache-Lookup deny all\n"
            << "reply_header_access X-Squid-Error deny all\n"
            << "tls_outgoing_options min-version=1.2\n";
    }
    out << "\n";

    out << "auth_param basic program " << m_cfg.auth_helper << " " << layout.passwd().string() << "\n"
        << "auth_param basic realm proxy\n"
        << "auth_param basic credentialsttl 2 hours\n"
        << "acl authenticated proxy_auth REQUIRED\n"
        << "http_access allow authenticated\n";
    out << "http_access deny all\n";

    return out.str();
}

std::string config_generator::generate_nginx(const instance_record& record,
                                             const instance_layout& layout) const
{
    const auto& tp = *record.tunnel();
    const bool has_cover = !tp.cover_domain.empty();
    const std::string backend = "$backend_" + safe_name(record.name);

    std::ostringstream out;

    if (!m_cfg.nginx_stream_module.empty())
        out << "load_module " << m_cfg.nginx_stream_module << ";\n";

    out << "# nginx configuration for instance " << record.name << "\n"
        << "daemon off;\n"
        << "worker_processes 1;\n"
        << "pid " << layout.pid_file(proxy_tls_tunnel).string() << ";\n"
        << "error_log " << (layout.logs_dir() / "error.log").string() << " warn;\n\n"
        << "events {\n"
        << "    worker_connections 1024;\n"
        << "}\n\n";

    out << "stream {\n"
        << "    map $ssl_preread_server_name " << backend << " {\n";
    if (has_cover)
        out << "        " << tp.cover_domain << " 127.0.0.1:" << tp.cover_site_port << ";\n";
    out << "        default " << tp.forward_address << ";\n"
        << "    }\n\n"
        << "    server {\n"
        << "        listen " << record.port << ";\n"
        << "        ssl_preread on;\n"
        << "        proxy_pass " << backend << ";\n"
        << "        proxy_connect_timeout 5s;\n"
        << "        proxy_timeout 86400s;\n"
        << "    }\n"
        << "}\n";

    if (has_cover)
    {
        out << "\nhttp {\n"
            << "    access_log " << (layout.logs_dir() / "cover_access.log").string() << ";\n"
            << "    client_body_temp_path " << (layout.run_dir() / "client_body").string() << ";\n"
            << "    proxy_temp_path " << (layout.run_dir() / "proxy").string() << ";\n"
            << "    fastcgi_temp_path " << (layout.run_dir() / "fastcgi").string() << ";\n"
            << "    uwsgi_temp_path " << (layout.run_dir() / "uwsgi").string() << ";\n"
            << "    scgi_temp_path " << (layout.run_dir() / "scgi").string() << ";\n"
            << "    server_tokens off;\n\n"
            << "    server {\n"
            << "        listen 127.0.0.1:" << tp.cover_site_port << " ssl;\n"
            << "        server_name " << tp.cover_domain << ";\n"
            << "        ssl_certificate " << layout.cert().string() << ";\n"
            << "        ssl_certificate_key " << layout.key().string() << ";\n"
            << "        ssl_protocols TLSv1.2 TLSv1.3;\n"
            << "        root " << layout.cover_dir().string() << ";\n"
            << "        index index.html;\n\n"
            << "        location / {\n"
            << "            try_files $uri $uri/ /index.html;\n"
            << "        }\n"
            << "    }\n"
            << "}\n";
    }

    return out.str();
}

std::string config_generator::default_cover_page()
{
    return
        "<!DOCTYPE html>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "    <meta charset=\"utf-8\">\n"
        "    <meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">\n"
        "    <title>Welcome</title>\n"
        "    <style>\n"
        "        body { font-family: sans-serif; margin: 4em auto; max-width: 40em; color: #333; }\n"
        "        h1 { font-weight: normal; }\n"
        "    </style>\n"
        "</head>\n"
        "<body>\n"
        "    <h1>Welcome</h1>\n"
        "    <p>This site is under construction. Please check back soon.</p>\n"
        "</body>\n"
        "</html>\n";
}
