#include "Process.h"
#include <iostream>
#include <vector>
#include <cerrno>       // For errno
#include <cstring>      // For strerror()
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>   // For waitpid()

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Appends whatever is currently readable; closes the fd on EOF or error.
void drain(int& fd, std::string& sink) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        close_fd(fd);
    }
}

} // namespace

Process::Process(const std::string& command, const std::vector<std::string>& args)
    : command_(command), args_(args) {}

std::string Process::describe() const {
    std::string line = command_;
    for (const auto& arg : args_) {
        line += " " + arg;
    }
    return line;
}

void Process::child_entry_point(const std::string& command, const std::vector<std::string>& args,
                                int out_fd, int err_fd) {
    // Own process group so a timeout can kill everything the command spawned.
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }
    dup2(out_fd, STDOUT_FILENO);
    dup2(err_fd, STDERR_FILENO);
    close(out_fd);
    close(err_fd);

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execvp(command.c_str(), c_args.data());

    // Only reached if execvp failed. 127 mirrors the shell's "command not found".
    const char* msg = strerror(errno);
    ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
    (void)ignored;
    _exit(127);
}

ProcessResult Process::run(std::chrono::milliseconds timeout) {
    ProcessResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe: ") + strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.stderr_data = std::string("fork: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        child_entry_point(command_, args_, out_pipe[1], err_pipe[1]);
    }

    // Parent process
    setpgid(pid, pid);
    result.started = true;
    close(out_pipe[1]);
    close(err_pipe[1]);
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (out_fd >= 0 || err_fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.stderr_data += std::string("poll: ") + strerror(errno);
            result.timed_out = true;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (fds[i].fd == out_fd) {
                drain(out_fd, result.stdout_data);
            } else if (fds[i].fd == err_fd) {
                drain(err_fd, result.stderr_data);
            }
        }
    }

    // Both pipes closed: the child is exiting. Give it the rest of the budget to be reaped.
    int status = 0;
    while (!result.timed_out) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) break;
        if (waited == -1 && errno != EINTR) {
            result.stderr_data += std::string("waitpid: ") + strerror(errno);
            close_fd(out_fd);
            close_fd(err_fd);
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        usleep(10000);
    }

    if (result.timed_out) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0); // Reap to avoid a zombie
        close_fd(out_fd);
        close_fd(err_fd);
        return result;
    }

    close_fd(out_fd);
    close_fd(err_fd);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}
