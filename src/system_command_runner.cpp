#include "netwatch/system.hpp"

#include "netwatch/log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace netwatch {

namespace {

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const noexcept { return fd_; }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

std::vector<std::string> child_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        if (std::strncmp(*entry, "LC_ALL=", 7) != 0) {
            env.emplace_back(*entry);
        }
    }
    env.emplace_back("LC_ALL=C");
    return env;
}

std::vector<char*> as_argv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    for (auto& s : strings) {
        pointers.push_back(&s[0]);
    }
    pointers.push_back(nullptr);
    return pointers;
}

} // namespace

CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        NETWATCH_LOG_ERROR("command", "pipe2 failed: " << std::strerror(errno));
        return result;
    }
    FileDescriptor read_end(fds[0]);
    FileDescriptor write_end(fds[1]);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    std::vector<std::string> args(argv);
    std::vector<std::string> env = child_environment();
    std::vector<char*> c_args = as_argv(args);
    std::vector<char*> c_env = as_argv(env);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, c_args[0], &actions, nullptr, c_args.data(), c_env.data());
    posix_spawn_file_actions_destroy(&actions);
    write_end.reset();

    if (rc != 0) {
        NETWATCH_LOG_DEBUG("command", "could not start " << argv[0] << ": " << std::strerror(rc));
        return result;
    }
    result.launched = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd = {read_end.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            NETWATCH_LOG_ERROR("command", "poll failed: " << std::strerror(errno));
            break;
        }
        if (ready == 0) {
            result.timedOut = true;
            break;
        }

        ssize_t n = read(read_end.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            NETWATCH_LOG_ERROR("command", "read failed: " << std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }

    if (result.timedOut) {
        NETWATCH_LOG_WARN("command", argv[0] << " timed out after " << timeout.count() << " ms");
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            NETWATCH_LOG_ERROR("command", "waitpid failed: " << std::strerror(errno));
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    // posix_spawnp may report a missing executable through exit status 127.
    if (result.exitCode == 127 && result.output.empty()) {
        result.launched = false;
    }
    return result;
}

} // namespace netwatch
