#include "polyp/process.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Child side: never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& argv, const std::string& working_dir,
                             int out_fd, int err_fd) {
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    close(out_fd);
    close(err_fd);

    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
        _exit(127);
    }

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execvp(c_args[0], c_args.data());
    _exit(127);
}

int wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void drain_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            for (auto& entry : fds) {
                if (entry.fd >= 0) close(entry.fd);
            }
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(saved));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

}

ProcessResult run_process(const std::vector<std::string>& argv, const std::string& working_dir) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty argument vector");
    }

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        int saved = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        throw std::runtime_error("Failed to fork '" + argv[0] + "': " + std::strerror(saved));
    }
    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        exec_child(argv, working_dir, out_pipe[1], err_pipe[1]);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    ProcessResult result;
    try {
        drain_pipes(out_pipe[0], err_pipe[0], result.out, result.err);
    } catch (...) {
        waitpid(pid, nullptr, 0);
        throw;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("Failed to wait for '" + argv[0] + "': " + std::strerror(errno));
        }
    }
    result.exit_code = wait_status_to_exit_code(status);
    if (result.exit_code == 127 && result.out.empty() && result.err.empty()) {
        throw std::runtime_error("Failed to run '" + argv[0] + "' (not found or not executable)");
    }
    return result;
}
