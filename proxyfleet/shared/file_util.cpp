#include "file_util.h"
#include "scoped_fd.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <chrono>
#include <random>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string errno_message(const char* what, int err)
{
    std::string msg(what);
    msg += ": ";
    msg += std::strerror(err);
    return msg;
}

file_owner file_owner::resolve(std::string_view user_name)
{
    file_owner owner;
    if (user_name.empty() || geteuid() != 0)
        return owner;

    std::string name(user_name);
    struct passwd* pw = getpwnam(name.c_str());
    if (pw)
    {
        owner.uid = pw->pw_uid;
        owner.gid = pw->pw_gid;
    }
    return owner;
}

namespace {

std::string temp_suffix()
{
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    char buf[16];
    std::snprintf(buf, sizeof(buf), ".tmp-%06x", dist(gen));
    return buf;
}

op_result apply_owner(int fd, const fs::path& path, const file_owner& owner)
{
    if (!owner.is_set())
        return op_result::ok();
    if (fchown(fd, owner.uid, owner.gid) < 0)
        return op_result::fail(err_io, errno_message(("chown " + path.string()).c_str(), errno));
    return op_result::ok();
}

} // namespace

op_result write_file_atomic(const fs::path& path, std::string_view content,
                            mode_t mode, const file_owner& owner)
{
    fs::path tmp_path = path;
    tmp_path += temp_suffix();

    scoped_fd fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode));
    if (!fd)
        return op_result::fail(err_io, errno_message(("create " + tmp_path.string()).c_str(), errno));

    auto discard = [&tmp_path](op_result r) {
        ::unlink(tmp_path.c_str());
        return r;
    };

    // umask may have masked bits off at open()
    if (fchmod(fd.get(), mode) < 0)
        return discard(op_result::fail(err_io, errno_message("chmod", errno)));

    if (auto r = apply_owner(fd.get(), path, owner); !r)
        return discard(std::move(r));

    size_t total = 0;
    while (total < content.size())
    {
        ssize_t w = ::write(fd.get(), content.data() + total, content.size() - total);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return discard(op_result::fail(err_io,
                errno_message(("write " + tmp_path.string()).c_str(), errno)));
        }
        total += static_cast<size_t>(w);
    }

    if (fsync(fd.get()) < 0)
        return discard(op_result::fail(err_io, errno_message("fsync", errno)));

    if (!fd.close_checked())
        return discard(op_result::fail(err_io, errno_message("close", errno)));

    if (::rename(tmp_path.c_str(), path.c_str()) < 0)
        return discard(op_result::fail(err_io,
            errno_message(("rename to " + path.string()).c_str(), errno)));

    return op_result::ok();
}

op_result read_file(const fs::path& path, std::string& out)
{
    scoped_fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd)
    {
        int err = errno;
        return op_result::fail(err == ENOENT ? err_not_found : err_io,
                               errno_message(("open " + path.string()).c_str(), err));
    }

    out.clear();
    char buf[8192];
    while (true)
    {
        ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return op_result::fail(err_io, errno_message(("read " + path.string()).c_str(), errno));
        }
        if (n == 0)
            break;
        out.append(buf, static_cast<size_t>(n));
    }
    return op_result::ok();
}

op_result ensure_directory(const fs::path& path, mode_t mode, const file_owner& owner)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        return op_result::fail(err_io, "mkdir " + path.string() + ": " + ec.message());

    if (::chmod(path.c_str(), mode) < 0)
        return op_result::fail(err_io, errno_message(("chmod " + path.string()).c_str(), errno));

    if (owner.is_set() && ::chown(path.c_str(), owner.uid, owner.gid) < 0)
        return op_result::fail(err_io, errno_message(("chown " + path.string()).c_str(), errno));

    return op_result::ok();
}

op_result check_not_world_writable(const fs::path& dir)
{
    struct stat st{};
    if (::stat(dir.c_str(), &st) < 0)
        return op_result::fail(err_io, errno_message(("stat " + dir.string()).c_str(), errno));

    if (!S_ISDIR(st.st_mode))
        return op_result::fail(err_io, dir.string() + " is not a directory");

    if (st.st_mode & S_IWOTH)
        return op_result::fail(err_io, dir.string() + " is world-writable");

    return op_result::ok();
}

op_result touch_file(const fs::path& path, mode_t mode, const file_owner& owner)
{
    scoped_fd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, mode));
    if (!fd)
        return op_result::fail(err_io, errno_message(("create " + path.string()).c_str(), errno));

    if (fchmod(fd.get(), mode) < 0)
        return op_result::fail(err_io, errno_message(("chmod " + path.string()).c_str(), errno));

    return apply_owner(fd.get(), path, owner);
}

std::string iso8601_now()
{
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}
