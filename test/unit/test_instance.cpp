#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "manager/instance.h"
#include "manager/instance_registry.h"
#include "shared/json_codec.h"

// ─── Field validation ───

TEST_CASE("instance names")
{
    CHECK(validate_name("office"));
    CHECK(validate_name("vpn-front.eu_1"));
    CHECK(validate_name(std::string(64, 'a')));

    CHECK(validate_name("").code == err_validation);
    CHECK(validate_name(std::string(65, 'a')).code == err_validation);
    CHECK(validate_name(".hidden").code == err_validation);
    CHECK(validate_name("a/b").code == err_validation);
    CHECK(validate_name("..").code == err_validation);
    CHECK(validate_name("has space").code == err_validation);
}

TEST_CASE("listening ports")
{
    CHECK(validate_port(1024));
    CHECK(validate_port(3128));
    CHECK(validate_port(65535));

    CHECK(validate_port(0).code == err_validation);
    CHECK(validate_port(80).code == err_validation);
    CHECK(validate_port(1023).code == err_validation);
    CHECK(validate_port(65536).code == err_validation);
    CHECK(validate_port(-1).code == err_validation);
}

TEST_CASE("forward addresses")
{
    CHECK(validate_forward_address("10.0.0.5:443"));
    CHECK(validate_forward_address("backend.internal:8443"));
    CHECK(validate_forward_address("[2001:db8::1]:443"));

    CHECK_FALSE(validate_forward_address(""));
    CHECK_FALSE(validate_forward_address("10.0.0.5"));
    CHECK_FALSE(validate_forward_address("10.0.0.5:0"));
    CHECK_FALSE(validate_forward_address("10.0.0.5:70000"));
    CHECK_FALSE(validate_forward_address(":443"));
    CHECK_FALSE(validate_forward_address("host;rm -rf:443"));
    CHECK_FALSE(validate_forward_address("a b:443"));
}

TEST_CASE("cover domains")
{
    CHECK(validate_cover_domain(""));
    CHECK(validate_cover_domain("www.example.com"));
    CHECK_FALSE(validate_cover_domain("example.com;"));
    CHECK_FALSE(validate_cover_domain("exa mple.com"));
    CHECK_FALSE(validate_cover_domain("-bad.example.com"));
}

TEST_CASE("credentials")
{
    CHECK(validate_username("alice"));
    CHECK(validate_username("bob_2"));
    CHECK_FALSE(validate_username(""));
    CHECK_FALSE(validate_username("al:ice"));
    CHECK_FALSE(validate_username("alice smith"));
    CHECK_FALSE(validate_username(std::string(33, 'a')));

    CHECK(validate_password("s3cret pass"));
    CHECK_FALSE(validate_password(""));
    CHECK_FALSE(validate_password("a:b"));
    CHECK_FALSE(validate_password("line\nbreak"));
    CHECK_FALSE(validate_password(std::string(129, 'x')));
}

TEST_CASE("record level checks")
{
    instance_record rec;
    rec.name = "vpn-front";
    rec.port = 8443;
    rec.params = tls_tunnel_params{ "10.0.0.5:443", "www.example.com", 8443 };

    CHECK(validate_record(rec).code == err_validation);

    rec.tunnel()->cover_site_port = 18443;
    CHECK(validate_record(rec));
    CHECK(rec.needs_certificate());

    auto ports = rec.claimed_ports();
    REQUIRE(ports.size() == 2);
    CHECK(ports[0] == 8443);
    CHECK(ports[1] == 18443);

    rec.tunnel()->cover_domain.clear();
    CHECK_FALSE(rec.needs_certificate());
}

TEST_CASE("forward proxy certificate need follows https")
{
    instance_record rec;
    rec.name = "office";
    rec.port = 3128;
    rec.params = forward_proxy_params{ false, false };
    CHECK_FALSE(rec.needs_certificate());
    CHECK(rec.claimed_ports().size() == 1);

    rec.forward()->https_enabled = true;
    CHECK(rec.needs_certificate());
    CHECK(rec.https_enabled());
    CHECK_FALSE(rec.dpi_evasion_enabled());
}

TEST_CASE("kind and state names")
{
    proxy_kind kind;
    CHECK(parse_proxy_kind("forward_proxy", kind));
    CHECK(kind == proxy_forward);
    CHECK(parse_proxy_kind("tunnel", kind));
    CHECK(kind == proxy_tls_tunnel);
    CHECK_FALSE(parse_proxy_kind("socks", kind));

    desired_state desired;
    CHECK(parse_desired_state("running", desired));
    CHECK(desired == desired_running);
    CHECK_FALSE(parse_desired_state("paused", desired));

    CHECK(std::string(kind_to_string(proxy_tls_tunnel)) == "tls_tunnel");
    CHECK(std::string(status_to_string(status_error)) == "error");
}

// ─── instance.json ───

TEST_CASE("instance.json format")
{
    instance_record rec;
    rec.name = "office";
    rec.port = 3128;
    rec.params = forward_proxy_params{ true, true };
    rec.desired = desired_running;
    rec.created_at = "2026-01-02T03:04:05Z";

    std::string json = instance_registry::format_json(rec);
    CHECK(json.find("\"proxy_type\": \"forward_proxy\"") != std::string::npos);
    CHECK(json.find("\"port\": 3128") != std::string::npos);
    CHECK(json.find("\"https_enabled\": true") != std::string::npos);
    CHECK(json.find("\"desired_state\": \"running\"") != std::string::npos);
    CHECK(json.find("forward_address") == std::string::npos);

    instance_record back;
    REQUIRE(instance_registry::parse_json(json, back));
    CHECK(back.name == "office");
    CHECK(back.kind() == proxy_forward);
    CHECK(back.https_enabled());
    CHECK(back.dpi_evasion_enabled());
    CHECK(back.desired == desired_running);
    CHECK(back.created_at == rec.created_at);
}

TEST_CASE("instance.json rejects broken records")
{
    instance_record out;
    CHECK_FALSE(instance_registry::parse_json("not json", out));
    CHECK_FALSE(instance_registry::parse_json(
        "{\"name\": \"x\", \"proxy_type\": \"socks\", \"port\": 3128}", out));
    CHECK_FALSE(instance_registry::parse_json(
        "{\"name\": \"x\", \"proxy_type\": \"forward_proxy\", \"port\": 99999}", out));
}

TEST_CASE("json escaping")
{
    CHECK(json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n");
    CHECK(json_unescape(json_escape("tab\there \x01")) == "tab\there \x01");

    std::string json = "{\n    \"name\": \"x\\\"y\",\n    \"port\": 42,\n    \"on\": true\n}\n";
    CHECK(json_get_string(json, "name") == "x\"y");
    CHECK(json_get_int(json, "port") == 42);
    CHECK(json_get_bool(json, "on"));
    CHECK_FALSE(json_has_key(json, "missing"));
    CHECK(json_get_int(json, "missing", -7) == -7);
}
