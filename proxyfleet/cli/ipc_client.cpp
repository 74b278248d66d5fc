#include "ipc_client.h"
#include "../shared/scoped_fd.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

int ipc_send(const std::string& socket_path, std::string_view command, std::string& data)
{
    data.clear();

    struct sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path))
        return -1;

    scoped_fd fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd)
        return -1;

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
        return -1;

    std::string msg(command);
    msg += '\n';

    size_t total = 0;
    while (total < msg.size())
    {
        ssize_t w = send(fd.get(), msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return -1;
        }
        total += static_cast<size_t>(w);
    }

    // Starts and stops wait for the daemons, so no receive timeout here:
    // the daemon bounds every operation itself.
    // Reply: first byte = exit code, then text until the NUL terminator
    char buf[4096];
    int exit_code = -1;

    while (true)
    {
        ssize_t n = read(fd.get(), buf, sizeof(buf));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return -1;

        const char* p = buf;
        size_t len = static_cast<size_t>(n);

        if (exit_code < 0)
        {
            exit_code = static_cast<unsigned char>(buf[0]);
            ++p;
            --len;
        }

        auto* nul = static_cast<const char*>(std::memchr(p, '\0', len));
        if (nul)
        {
            data.append(p, nul - p);
            return exit_code;
        }
        data.append(p, len);
    }
}
