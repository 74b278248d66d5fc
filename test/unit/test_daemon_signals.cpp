#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "daemon/daemon.h"
#include "shared/event_loop.h"

#include <csignal>
#include <fcntl.h>
#include <unistd.h>

namespace {

void reset_handlers()
{
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGHUP, SIG_DFL);
}

} // namespace

TEST_CASE("termination signals become a byte on the pipe")
{
    int fds[2];
    REQUIRE(pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0);

    install_signal_handlers(fds[1]);

    for (int sig : { SIGTERM, SIGINT, SIGHUP })
    {
        CAPTURE(sig);
        REQUIRE(raise(sig) == 0);

        // Still alive; the handler only wrote the wake byte
        char c = 0;
        CHECK(read(fds[0], &c, 1) == 1);
        CHECK(c == 1);
    }

    // SIGPIPE is ignored, so a write to a closed pipe fails instead of killing us
    close(fds[0]);
    char c = 0;
    CHECK(write(fds[1], &c, 1) == -1);

    install_signal_handlers(-1);
    close(fds[1]);
    reset_handlers();
}

TEST_CASE("a signal before the loop runs stops it on the first pass")
{
    event_loop loop;
    REQUIRE(loop.init());

    // Same order as daemon startup: handlers, then slow restore work, then run()
    install_signal_handlers(loop.get_signal_write_fd());
    REQUIRE(raise(SIGTERM) == 0);

    // Returns instead of blocking on an empty ring
    loop.run();

    install_signal_handlers(-1);
    reset_handlers();
}
