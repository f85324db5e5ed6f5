#ifndef PROCESS_H
#define PROCESS_H

#include <chrono>
#include <string>
#include <vector>
#include <unistd.h> // For pid_t

/**
 * @struct ProcessResult
 * @brief Outcome of one bounded child process execution.
 */
struct ProcessResult {
    bool started = false;     // fork/exec succeeded
    bool timed_out = false;   // killed after the ceiling elapsed
    int exit_code = -1;       // valid only when the child exited normally
    std::string stdout_data;
    std::string stderr_data;

    bool succeeded() const { return started && !timed_out && exit_code == 0; }
};

/**
 * @class Process
 * @brief Runs an external program with an argument vector and a hard time ceiling.
 *
 * No shell is involved: arguments are handed to execvp() as-is, so values
 * coming from callers cannot be interpreted as shell syntax.
 */
class Process {
public:
    /**
     * @brief Constructs a Process object.
     * @param command The executable to run, resolved through PATH.
     * @param args A vector of string arguments for the command.
     */
    Process(const std::string& command, const std::vector<std::string>& args = {});

    /**
     * @brief Runs the child, capturing stdout and stderr.
     * @param timeout Ceiling after which the child's process group is killed.
     * @return The captured result; never blocks longer than the timeout.
     */
    ProcessResult run(std::chrono::milliseconds timeout);

    // Human-readable command line for logs.
    std::string describe() const;

private:
    static void child_entry_point(const std::string& command, const std::vector<std::string>& args,
                                  int out_fd, int err_fd);

    std::string command_;
    std::vector<std::string> args_;
};

#endif // PROCESS_H
