#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "test_support.h"
#include "manager/auth_store.h"
#include "manager/certificate_manager.h"
#include "manager/config_generator.h"
#include "manager/instance_registry.h"
#include "manager/process_supervisor.h"
#include "manager/reconciler.h"
#include "shared/file_util.h"

#include <csignal>
#include <filesystem>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct supervisor_fixture
{
    temp_dir tmp;
    manager_config cfg = test_config(tmp.path);
    config_generator generator{ cfg };
    certificate_manager certs{ cfg.instances_dir(), {} };
    auth_store auth{ cfg.instances_dir(), {} };
    instance_registry registry{ cfg.instances_dir(), {} };
    process_supervisor supervisor{ cfg, generator, certs, auth, {} };

    supervisor_fixture()
    {
        REQUIRE(registry.init());
    }

    ~supervisor_fixture()
    {
        supervisor.stop_all();
    }

    instance_record add_forward(const std::string& name, uint16_t port, bool https = false)
    {
        instance_record rec;
        rec.name = name;
        rec.port = port;
        rec.params = forward_proxy_params{ https, false };
        REQUIRE(registry.create(rec));
        return rec;
    }
};

bool accepts_connections(uint16_t port)
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return false;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    bool ok = connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return ok;
}

} // namespace

TEST_CASE("prepare writes the instance artifacts")
{
    supervisor_fixture f;
    uint16_t port = free_port();
    REQUIRE(port >= 1024);

    SUBCASE("forward proxy")
    {
        auto rec = f.add_forward("office", port, true);
        REQUIRE(f.supervisor.prepare(rec));

        instance_layout layout(f.cfg.instances_dir(), "office");
        CHECK(fs::exists(layout.squid_conf()));
        CHECK(fs::exists(layout.passwd()));
        CHECK(fs::exists(layout.cert()));
        CHECK(fs::exists(layout.key()));

        std::string conf;
        REQUIRE(read_file(layout.squid_conf(), conf));
        CHECK(conf.find("https_port " + std::to_string(port)) != std::string::npos);

        cert_info info;
        REQUIRE(f.certs.info("office", info));
        CHECK(info.common_name == "office");
    }

    SUBCASE("tunnel with cover site")
    {
        instance_record rec;
        rec.name = "vpn-front";
        rec.port = port;
        rec.params = tls_tunnel_params{ "10.0.0.5:443", "www.example.com", 0 };
        REQUIRE(f.registry.create(rec));
        REQUIRE(f.supervisor.prepare(rec));

        instance_layout layout(f.cfg.instances_dir(), "vpn-front");
        CHECK(fs::exists(layout.nginx_conf()));
        CHECK(fs::exists(layout.cover_page()));
        CHECK_FALSE(fs::exists(layout.passwd()));

        cert_info info;
        REQUIRE(f.certs.info("vpn-front", info));
        CHECK(info.common_name == "www.example.com");

        // A customised cover page survives the next prepare
        REQUIRE(write_file_atomic(layout.cover_page(), "custom", 0644));
        REQUIRE(f.supervisor.prepare(rec));
        std::string page;
        REQUIRE(read_file(layout.cover_page(), page));
        CHECK(page == "custom");
    }
}

TEST_CASE("prepare applies the owner given at construction")
{
    temp_dir tmp;
    manager_config cfg = test_config(tmp.path);
    config_generator generator{ cfg };
    file_owner self{ getuid(), getgid() };
    certificate_manager certs{ cfg.instances_dir(), self };
    auth_store auth{ cfg.instances_dir(), self };
    instance_registry registry{ cfg.instances_dir(), self };
    process_supervisor supervisor{ cfg, generator, certs, auth, self };
    REQUIRE(registry.init());

    instance_record rec;
    rec.name = "office";
    rec.port = free_port();
    rec.params = forward_proxy_params{};
    REQUIRE(registry.create(rec));

    REQUIRE(supervisor.prepare(rec));

    instance_layout layout(cfg.instances_dir(), "office");
    struct stat st{};
    REQUIRE(stat(layout.squid_conf().c_str(), &st) == 0);
    CHECK(st.st_uid == getuid());
    CHECK(st.st_gid == getgid());
    CHECK((st.st_mode & 0777) == 0640);
}

TEST_CASE("start and stop a daemon")
{
    supervisor_fixture f;
    uint16_t port = free_port();
    auto rec = f.add_forward("office", port);

    REQUIRE(f.supervisor.start(rec));

    auto snap = f.supervisor.snapshot("office");
    CHECK(snap.status == status_running);
    CHECK(snap.pid > 0);
    CHECK(f.supervisor.is_running("office"));
    CHECK(f.supervisor.running_count() == 1);
    CHECK(accepts_connections(port));

    SUBCASE("start is idempotent")
    {
        REQUIRE(f.supervisor.start(rec));
        CHECK(f.supervisor.snapshot("office").pid == snap.pid);
    }

    SUBCASE("stop is idempotent")
    {
        REQUIRE(f.supervisor.stop("office"));
        CHECK(f.supervisor.snapshot("office").status == status_stopped);
        CHECK(f.supervisor.snapshot("office").pid == 0);
        CHECK_FALSE(accepts_connections(port));
        CHECK(kill(snap.pid, 0) != 0);

        REQUIRE(f.supervisor.stop("office"));
    }

    SUBCASE("restart replaces the process")
    {
        REQUIRE(f.supervisor.restart(rec));
        auto after = f.supervisor.snapshot("office");
        CHECK(after.status == status_running);
        CHECK(after.pid != snap.pid);
        CHECK(accepts_connections(port));
    }

    SUBCASE("a daemon that dies is reported, not restarted")
    {
        REQUIRE(kill(snap.pid, SIGKILL) == 0);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        f.supervisor.check_processes();
        auto after = f.supervisor.snapshot("office");
        CHECK(after.status == status_error);
        CHECK(after.pid == 0);
        CHECK(after.last_error.find("signal 9") != std::string::npos);
    }
}

TEST_CASE("start failures")
{
    supervisor_fixture f;
    uint16_t port = free_port();

    SUBCASE("port held by a foreign process")
    {
        int holder = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(holder >= 0);
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);
        REQUIRE(bind(holder, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(holder, 1) == 0);

        auto rec = f.add_forward("office", port);
        op_result r = f.supervisor.start(rec);
        CHECK(r.code == err_process);

        auto snap = f.supervisor.snapshot("office");
        CHECK(snap.status == status_error);
        CHECK(snap.last_error.find("in use") != std::string::npos);
        close(holder);
    }

    SUBCASE("daemon exits during startup")
    {
        f.cfg.squid_binary = "/bin/false";
        auto rec = f.add_forward("office", port);
        op_result r = f.supervisor.start(rec);
        CHECK(r.code == err_process);
        CHECK(f.supervisor.snapshot("office").status == status_error);
        CHECK(f.supervisor.snapshot("office").last_error.find("exited with code 1") != std::string::npos);
    }

    SUBCASE("binary missing")
    {
        f.cfg.squid_binary = (f.tmp.path / "no-such-squid").string();
        auto rec = f.add_forward("office", port);
        op_result r = f.supervisor.start(rec);
        CHECK(r.code == err_process);
        CHECK_FALSE(f.supervisor.is_running("office"));
    }
}

TEST_CASE("wait status descriptions")
{
    CHECK(describe_wait_status(1 << 8) == "exited with code 1");
    CHECK(describe_wait_status(SIGKILL).find("killed by signal 9") == 0);
}

TEST_CASE("reconcile plan")
{
    std::vector<instance_record> records(3);
    records[0].name = "a";
    records[0].desired = desired_running;
    records[1].name = "b";
    records[1].desired = desired_stopped;
    records[2].name = "c";
    records[2].desired = desired_running;

    auto plan = reconciler::plan(records);
    REQUIRE(plan.size() == 3);
    CHECK(plan[0].type == action_start);
    CHECK(plan[1].type == action_none);
    CHECK(plan[2].type == action_start);
    CHECK(std::string(action_to_string(plan[0].type)) == "start");
}

TEST_CASE("reconcile starts desired instances and reports failures")
{
    supervisor_fixture f;
    reconciler rec(f.supervisor);

    auto up = f.add_forward("up", free_port());
    up.desired = desired_running;
    REQUIRE(f.registry.update(up));

    auto down = f.add_forward("down", free_port());

    // Occupied port: reported as a failed start, the rest still comes up
    int holder = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(holder >= 0);
    uint16_t busy_port = free_port();
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(busy_port);
    REQUIRE(bind(holder, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
    REQUIRE(listen(holder, 1) == 0);

    auto blocked = f.add_forward("blocked", busy_port);
    blocked.desired = desired_running;
    REQUIRE(f.registry.update(blocked));

    auto outcomes = rec.run(f.registry.list());
    REQUIRE(outcomes.size() == 2);

    CHECK(outcomes[0].name == "blocked");
    CHECK(outcomes[0].result.code == err_process);
    CHECK(outcomes[1].name == "up");
    CHECK(outcomes[1].result);

    CHECK(f.supervisor.is_running("up"));
    CHECK_FALSE(f.supervisor.is_running("down"));
    CHECK(f.supervisor.snapshot("blocked").status == status_error);

    close(holder);
}
