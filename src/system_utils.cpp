#include "system_utils.hpp"
#include <cerrno>
#include <fcntl.h>

namespace procutil {

bool make_pipe(Pipe& out) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
    out.read_end.reset(fds[0]);
    out.write_end.reset(fds[1]);
    return true;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool drain_fd(int fd, std::string& out) {
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return true;
        return false;
    }
}

} // namespace procutil
