#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "manager/instance_registry.h"
#include "shared/file_util.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

instance_record forward_on(const std::string& name, uint16_t port)
{
    instance_record rec;
    rec.name = name;
    rec.port = port;
    rec.params = forward_proxy_params{};
    return rec;
}

} // namespace

TEST_CASE("registry create and read back")
{
    temp_dir tmp;
    REQUIRE_FALSE(tmp.path.empty());

    instance_registry reg(tmp.path / "instances", {});
    REQUIRE(reg.init());

    auto rec = forward_on("office", 3128);
    REQUIRE(reg.create(rec));
    CHECK_FALSE(rec.created_at.empty());

    SUBCASE("layout on disk")
    {
        instance_layout layout(reg.instances_dir(), "office");
        CHECK(fs::is_regular_file(layout.record()));
        CHECK(fs::is_directory(layout.logs_dir()));
        CHECK(fs::is_directory(layout.run_dir()));

        struct stat st{};
        REQUIRE(stat(layout.record().c_str(), &st) == 0);
        CHECK((st.st_mode & 0777) == 0640);
    }

    SUBCASE("get returns the stored values")
    {
        instance_record back;
        REQUIRE(reg.get("office", back));
        CHECK(back.port == 3128);
        CHECK(back.kind() == proxy_forward);
        CHECK(back.desired == desired_stopped);
        CHECK(back.created_at == rec.created_at);
    }

    SUBCASE("duplicate name")
    {
        auto again = forward_on("office", 3129);
        CHECK(reg.create(again).code == err_name_conflict);
    }

    SUBCASE("duplicate port leaves no trace")
    {
        auto other = forward_on("branch", 3128);
        CHECK(reg.create(other).code == err_port_conflict);
        CHECK_FALSE(reg.exists("branch"));
        CHECK(reg.list().size() == 1);
    }

    SUBCASE("missing record")
    {
        instance_record out;
        CHECK(reg.get("nope", out).code == err_not_found);
        CHECK(reg.remove("nope").code == err_not_found);
    }

    SUBCASE("update keeps created_at and stamps updated_at")
    {
        rec.desired = desired_running;
        REQUIRE(reg.update(rec));

        instance_record back;
        REQUIRE(reg.get("office", back));
        CHECK(back.desired == desired_running);
        CHECK(back.created_at == rec.created_at);
        CHECK_FALSE(back.updated_at.empty());
    }

    SUBCASE("update to a claimed port fails")
    {
        auto other = forward_on("branch", 3130);
        REQUIRE(reg.create(other));

        other.port = 3128;
        CHECK(reg.update(other).code == err_port_conflict);

        instance_record back;
        REQUIRE(reg.get("branch", back));
        CHECK(back.port == 3130);
    }

    SUBCASE("remove deletes the directory")
    {
        REQUIRE(reg.remove("office"));
        CHECK_FALSE(reg.exists("office"));
        CHECK(fs::is_empty(reg.instances_dir()));
    }
}

TEST_CASE("registry assigns tunnel cover ports")
{
    temp_dir tmp;
    instance_registry reg(tmp.path / "instances", {});
    REQUIRE(reg.init());

    instance_record rec;
    rec.name = "vpn-front";
    rec.port = 8443;
    rec.params = tls_tunnel_params{ "10.0.0.5:443", "www.example.com", 0 };
    REQUIRE(reg.create(rec));
    CHECK(rec.tunnel()->cover_site_port == 18443);

    // The cover port is now claimed
    auto squid = forward_on("office", 18443);
    CHECK(reg.create(squid).code == err_port_conflict);

    // Moving the listener onto its own cover port picks a new cover port
    rec.port = 18443;
    rec.tunnel()->cover_site_port = 0;
    REQUIRE(reg.update(rec));
    CHECK(rec.tunnel()->cover_site_port != 0);
    CHECK(rec.tunnel()->cover_site_port != 18443);
}

TEST_CASE("registry list")
{
    temp_dir tmp;
    instance_registry reg(tmp.path / "instances", {});
    REQUIRE(reg.init());

    auto b = forward_on("bravo", 4001);
    auto a = forward_on("alpha", 4002);
    REQUIRE(reg.create(b));
    REQUIRE(reg.create(a));

    SUBCASE("sorted by name")
    {
        auto all = reg.list();
        REQUIRE(all.size() == 2);
        CHECK(all[0].name == "alpha");
        CHECK(all[1].name == "bravo");
    }

    SUBCASE("malformed records are skipped")
    {
        fs::create_directories(reg.instances_dir() / "broken");
        std::ofstream(reg.instances_dir() / "broken" / "instance.json") << "{ garbage";

        fs::create_directories(reg.instances_dir() / "renamed");
        std::ofstream(reg.instances_dir() / "renamed" / "instance.json")
            << instance_registry::format_json(forward_on("other-name", 4003));

        auto all = reg.list();
        CHECK(all.size() == 2);

        instance_record out;
        CHECK(reg.get("broken", out).code == err_io);
    }

    SUBCASE("init sweeps interrupted creates and removes")
    {
        fs::create_directories(reg.instances_dir() / ".staging-zulu-1234");
        fs::create_directories(reg.instances_dir() / ".removing-alpha-5678");
        REQUIRE(reg.init());
        CHECK_FALSE(fs::exists(reg.instances_dir() / ".staging-zulu-1234"));
        CHECK_FALSE(fs::exists(reg.instances_dir() / ".removing-alpha-5678"));
        CHECK(reg.list().size() == 2);
    }
}

TEST_CASE("concurrent creates on one port admit exactly one")
{
    temp_dir tmp;
    instance_registry reg(tmp.path / "instances", {});
    REQUIRE(reg.init());

    constexpr int n = 8;
    std::atomic<int> ok{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < n; ++i)
    {
        threads.emplace_back([&, i] {
            auto rec = forward_on("racer" + std::to_string(i), 5000);
            op_result r = reg.create(rec);
            if (r)
                ++ok;
            else if (r.code == err_port_conflict)
                ++conflicts;
        });
    }
    for (auto& t : threads)
        t.join();

    CHECK(ok == 1);
    CHECK(conflicts == n - 1);
    CHECK(reg.list().size() == 1);
}

TEST_CASE("atomic writes")
{
    temp_dir tmp;
    fs::path file = tmp.path / "data.txt";

    REQUIRE(write_file_atomic(file, "first", 0640));
    REQUIRE(write_file_atomic(file, "second", 0640));

    std::string content;
    REQUIRE(read_file(file, content));
    CHECK(content == "second");

    // No temp files left beside the target
    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(tmp.path))
    {
        (void)e;
        ++entries;
    }
    CHECK(entries == 1);

    CHECK(read_file(tmp.path / "missing", content).code == err_not_found);
}
