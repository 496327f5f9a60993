#include "system_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <sys/wait.h>

namespace procutil {

bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

static void redirect_to_null(int target) {
    int fd = open("/dev/null", O_WRONLY);
    if (fd >= 0) {
        dup2(fd, target);
        close(fd);
    }
}

int run_process(const std::vector<std::string>& args, std::string* output,
                const std::filesystem::path& cwd) {
    if (args.empty())
        return -1;
    UniqueFd read_end;
    UniqueFd write_end;
    if (output && !make_pipe(read_end, write_end))
        return -1;
    // argv is built before fork so the child only makes exec-safe calls.
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    pid_t pid = fork();
    if (pid < 0)
        return -1;
    if (pid == 0) {
        if (output) {
            // dup2 clears close-on-exec on the new stdout.
            dup2(write_end.get(), STDOUT_FILENO);
            redirect_to_null(STDERR_FILENO);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            _exit(EXEC_FAILED);
        execvp(argv[0], argv.data());
        _exit(EXEC_FAILED);
    }
    if (output) {
        write_end.reset();
        output->clear();
        char buf[4096];
        for (;;) {
            ssize_t n = read(read_end.get(), buf, sizeof(buf));
            if (n > 0) {
                output->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            break;
        }
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

bool program_available(const std::string& program) {
    const char* path_env = std::getenv("PATH");
    if (!path_env || program.empty())
        return false;
    if (program.find('/') != std::string::npos)
        return access(program.c_str(), X_OK) == 0;
    std::string paths = path_env;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos)
            end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0)
            return true;
        start = end + 1;
    }
    return false;
}

} // namespace procutil
