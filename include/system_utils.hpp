#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
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
 * @brief Create a pipe whose ends are closed on exec.
 *
 * Children forked by other threads never inherit either end, so a reader
 * sees EOF as soon as its own child exits.
 *
 * @return `false` when the pipe could not be created.
 */
bool make_pipe(UniqueFd& read_end, UniqueFd& write_end);

/// Exit status reported when the child could not exec the program.
constexpr int EXEC_FAILED = 127;

/**
 * @brief Run an executable found on `PATH` and wait for it.
 *
 * @param args   Program name followed by its arguments. Must not be empty.
 * @param output When non-null, receives the child's standard output and the
 *               child's standard error is discarded. When null, the child
 *               inherits both streams.
 * @param cwd    Working directory for the child; empty keeps the current one.
 * @return The child's exit status, `128 + signal` when it was killed,
 *         @ref EXEC_FAILED when the program could not be started and `-1`
 *         when the process could not be created or waited for.
 */
int run_process(const std::vector<std::string>& args, std::string* output = nullptr,
                const std::filesystem::path& cwd = {});

/**
 * @brief Check whether @p program can be found on `PATH`.
 */
bool program_available(const std::string& program);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
