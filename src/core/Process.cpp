#include "Process.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sf_boost {

namespace {

std::string errno_message() {
    return std::strerror(errno);
}

class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            throw ProcessError("pipe failed: " + errno_message());
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::filesystem::path& working_directory) {
    if (argv.empty()) {
        throw ProcessError("No program given");
    }

    spdlog::debug("Running {} with {} args in {}", argv.front(), argv.size() - 1,
                  working_directory.empty() ? "." : working_directory.string());

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    Pipe output;
    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError("fork failed: " + errno_message());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::dup2(output.write_fd(), STDOUT_FILENO);
        ::dup2(output.write_fd(), STDERR_FILENO);
        ::close(output.read_fd());
        ::close(output.write_fd());

        if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
            ::_exit(126);
        }
        ::execvp(c_args[0], c_args.data());
        ::_exit(127);
    }

    output.close_write();

    ProcessResult result;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(output.read_fd(), buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            spdlog::error("Reading output of {} failed: {}", argv.front(), errno_message());
            break;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessError("waitpid failed: " + errno_message());
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    spdlog::debug("{} exited with {} ({} bytes of output)", argv.front(), result.exit_code,
                  result.output.size());
    return result;
}

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace sf_boost
