#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by pipe and similar system calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Pair of descriptors created by @ref make_pipe.
 */
struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

/**
 * @brief Create a pipe whose ends are closed on exec.
 *
 * @param out Receives both ends on success.
 * @return `false` and leaves @p out untouched when `pipe2` fails.
 */
bool make_pipe(Pipe& out);

/**
 * @brief Switch a descriptor to non-blocking mode.
 */
bool set_nonblocking(int fd);

/**
 * @brief Append everything currently readable from @p fd to @p out.
 *
 * @return `false` once the writer has closed its end (EOF) or on a hard read
 *         error; `true` while more data may arrive.
 */
bool drain_fd(int fd, std::string& out);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
