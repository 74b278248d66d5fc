// Stand-in for squid and nginx in tests. Reads the listening port from the
// generated config (-f for squid, -c for nginx), listens on it and runs
// until SIGTERM or SIGQUIT.
//
// Each connection gets one HTTP answer to its first request: 200 when it
// carries a Proxy-Authorization header, 407 otherwise. CONNECT is answered
// the same way and then closed, so only plain-http checks get through.

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <netinet/in.h>
#include <poll.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <unistd.h>

static volatile sig_atomic_t g_stop = 0;

static void on_signal(int)
{
    g_stop = 1;
}

static void answer(int listen_fd)
{
    int fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0)
        return;

    struct timeval tv{ 1, 0 };
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string head;
    char buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos && head.size() < 16384)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0)
            break;
        head.append(buf, static_cast<size_t>(n));
    }

    if (!head.empty())
    {
        const char* reply = head.find("\r\nProxy-Authorization: Basic ") != std::string::npos
            ? "HTTP/1.1 200 OK\r\nContent-Length: 0\r\nConnection: close\r\n\r\n"
            : "HTTP/1.1 407 Proxy Authentication Required\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        send(fd, reply, std::strlen(reply), MSG_NOSIGNAL);
    }
    close(fd);
}

static int port_from_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        return -1;

    std::string line;
    while (std::getline(in, line))
    {
        std::istringstream words(line);
        std::string key;
        words >> key;

        if (key == "http_port" || key == "https_port")
        {
            int port = -1;
            words >> port;
            return port;
        }

        // nginx: the first bare "listen N;" is the stream listener
        if (key == "listen")
        {
            std::string value;
            words >> value;
            if (!value.empty() && value.back() == ';')
                value.pop_back();
            if (value.find(':') != std::string::npos)
                continue;
            return std::atoi(value.c_str());
        }
    }
    return -1;
}

int main(int argc, char** argv)
{
    std::string config;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if ((arg == "-f" || arg == "-c") && i + 1 < argc)
            config = argv[++i];
        else if (arg == "-p" && i + 1 < argc)
            ++i;
    }

    if (config.empty())
    {
        std::fprintf(stderr, "fake_daemon: no config given\n");
        return 2;
    }

    int port = port_from_config(config);
    if (port <= 0 || port > 65535)
    {
        std::fprintf(stderr, "fake_daemon: no listening port in %s\n", config.c_str());
        return 2;
    }

    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGQUIT, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return 3;

    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        std::fprintf(stderr, "fake_daemon: bind %d: %s\n", port, std::strerror(errno));
        return 3;
    }
    if (listen(fd, 16) < 0)
    {
        std::fprintf(stderr, "fake_daemon: listen: %s\n", std::strerror(errno));
        return 3;
    }

    std::fprintf(stderr, "fake_daemon: listening on %d\n", port);

    sigset_t block, old;
    sigemptyset(&block);
    sigaddset(&block, SIGTERM);
    sigaddset(&block, SIGQUIT);
    sigaddset(&block, SIGINT);
    sigprocmask(SIG_BLOCK, &block, &old);
    struct pollfd pfd{ fd, POLLIN, 0 };
    while (!g_stop)
    {
        // Signals are only delivered inside ppoll, so g_stop cannot be missed
        int n = ppoll(&pfd, 1, nullptr, &old);
        if (n > 0 && (pfd.revents & POLLIN))
            answer(fd);
    }

    close(fd);
    return 0;
}
