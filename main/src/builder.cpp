#include "builder.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
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
    void close_read() { close_fd(fds_[0]); }
    void close_write() { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) {
        if (fd != -1) {
            close(fd);
            fd = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

// Copies everything from fd to out until EOF. Returns the number of lines seen.
size_t relay_output(int fd, std::ostream& out) {
    char buffer[4096];
    size_t lines = 0;
    bool pending = false;
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        for (ssize_t i = 0; i < n; ++i) {
            if (buffer[i] == '\n') {
                ++lines;
                pending = false;
            } else {
                pending = true;
            }
        }
        out.write(buffer, n);
        out.flush();
    }
    if (pending) {
        out << std::endl;
        ++lines;
    }
    return lines;
}

int wait_for_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

BuildResult run_with_relay(const std::vector<std::string>& command, std::ostream& out) {
    BuildResult result;

    Pipe output;
    // Closed by a successful exec; carries errno back if exec fails.
    Pipe exec_status;

    std::vector<char*> argv;
    for (const auto& arg : command) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    char* empty_env[] = {nullptr};

    pid_t pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        if (dup2(output.write_fd(), STDOUT_FILENO) < 0 || dup2(output.write_fd(), STDERR_FILENO) < 0) {
            int err = errno;
            (void)!write(exec_status.write_fd(), &err, sizeof(err));
            _exit(127);
        }
        execvpe(argv[0], argv.data(), empty_env);
        int err = errno;
        (void)!write(exec_status.write_fd(), &err, sizeof(err));
        _exit(127);
    }

    output.close_write();
    exec_status.close_write();

    size_t relayed = 0;
    std::thread relay;
    try {
        relay = std::thread([&relayed, &out, fd = output.read_fd()]() { relayed = relay_output(fd, out); });
    } catch (const std::system_error& e) {
        log_warning(string_format("warning.relay_thread_failed", e.what()));
        relayed = relay_output(output.read_fd(), out);
    }

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_status.read_fd(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    int exit_code;
    try {
        exit_code = wait_for_child(pid);
    } catch (...) {
        if (relay.joinable()) relay.join();
        throw;
    }
    if (relay.joinable()) relay.join();

    result.relayed_lines = relayed;
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.success = false;
        result.exit_code = exit_code;
        result.message = string_format("error.launch_failed", command.front(), std::strerror(exec_errno));
        return result;
    }
    result.exit_code = exit_code;
    result.success = (exit_code == 0);
    return result;
}

} // anonymous namespace

std::vector<std::string> make_install_command(const fs::path& dir, const RBuildConfig& config) {
    const fs::path& spark_home = require_spark_home(config);
    const fs::path path_to_spark_r = spark_home / "R" / "lib";
    const fs::path path_to_pkg = dir / "R" / "pkg";

    std::vector<std::string> command = config.install_command;
    command.push_back(path_to_spark_r.string());
    command.push_back(path_to_pkg.string());
    return command;
}

BuildResult build_r_package(const fs::path& dir, const RBuildConfig& config, std::ostream& out, bool verbose) {
    const std::vector<std::string> command = make_install_command(dir, config);
    if (verbose) {
        out << string_format("info.build_command", join(command, " ")) << std::endl;
    }

    BuildResult result;
    try {
        result = run_with_relay(command, out);
    } catch (const std::system_error& e) {
        result.success = false;
        result.message = string_format("error.launch_failed", command.front(), e.what());
    }
    if (!result.message.empty()) {
        out << result.message << std::endl;
    }
    return result;
}
