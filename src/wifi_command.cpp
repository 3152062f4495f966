#include "wifi_command.hpp"
#include "wifi_logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace wifiprov {

namespace {

constexpr std::chrono::milliseconds REAP_INTERVAL{10};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Reads what is available; closes fd at end of stream or on error
void drain(int& fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        closeFd(fd);
    }
}

// Reaps the child. A child still running at the deadline is killed and
// timedOut set; after that the wait blocks until the kill takes effect.
int waitForChild(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timedOut) {
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, timedOut ? 0 : WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            ::kill(pid, SIGKILL);
        } else {
            std::this_thread::sleep_for(REAP_INTERVAL);
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // namespace

CommandResult ProcessCommandRunner::run(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.err = "empty command";
        return result;
    }

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == 0) {
        // Child process
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        _exit(127); // Exit if exec fails
    } else if (pid < 0) {
        result.err = std::string("fork failed: ") + std::strerror(errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return result;
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    int outFd = outPipe[0];
    int errFd = errPipe[0];

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (outFd >= 0 || errFd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) fds[count++] = {outFd, POLLIN, 0};
        if (errFd >= 0) fds[count++] = {errFd, POLLIN, 0};

        int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == outFd) {
                drain(outFd, result.out);
            } else if (fds[i].fd == errFd) {
                drain(errFd, result.err);
            }
        }
    }

    closeFd(outFd);
    closeFd(errFd);

    if (result.timedOut) {
        ::kill(pid, SIGKILL);
    }
    // The child may close its output and keep running
    result.exitCode = waitForChild(pid, deadline, result.timedOut);
    if (result.timedOut) {
        Logger::getInstance().warning("Command timed out after ", timeout.count(),
                                      " ms, killed: ", argv[0]);
    }
    return result;
}

} // namespace wifiprov
