#include "ProcessRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool MakePipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

void SetNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

bool ReadAvailable(int& fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        const ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            sink.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (count == 0) {
            CloseFd(fd);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        CloseFd(fd);
        return false;
    }
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}
} // namespace

ProcessResult RunProcess(
    const std::vector<std::string>& argv,
    const std::string* input,
    std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty() || argv.front().empty()) {
        result.err = "empty command";
        return result;
    }

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (!MakePipe(inPipe) || !MakePipe(outPipe) || !MakePipe(errPipe) || !MakePipe(execPipe)) {
        result.err = std::strerror(errno);
        for (int* fds : {inPipe, outPipe, errPipe, execPipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }

    std::vector<char*> cArgs;
    cArgs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    cArgs.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1) {
        result.err = std::strerror(errno);
        for (int* fds : {inPipe, outPipe, errPipe, execPipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvp(cArgs[0], cArgs.data());
        const int execErrno = errno;
        ssize_t ignored = ::write(execPipe[1], &execErrno, sizeof(execErrno));
        (void)ignored;
        ::_exit(127);
    }

    CloseFd(inPipe[0]);
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    CloseFd(execPipe[1]);

    int execErrno = 0;
    ssize_t execRead = 0;
    do {
        execRead = ::read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (execRead < 0 && errno == EINTR);
    CloseFd(execPipe[0]);

    if (execRead == static_cast<ssize_t>(sizeof(execErrno))) {
        CloseFd(inPipe[1]);
        CloseFd(outPipe[0]);
        CloseFd(errPipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        result.err = std::strerror(execErrno);
        return result;
    }

    result.launched = true;

    size_t written = 0;
    if (input == nullptr || input->empty()) {
        CloseFd(inPipe[1]);
    } else {
        SetNonBlocking(inPipe[1]);
    }
    SetNonBlocking(outPipe[0]);
    SetNonBlocking(errPipe[0]);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            break;
        }

        pollfd fds[3];
        nfds_t count = 0;
        int* owners[3] = {nullptr, nullptr, nullptr};
        for (int* fd : {&outPipe[0], &errPipe[0]}) {
            if (*fd >= 0) {
                fds[count] = pollfd{*fd, POLLIN, 0};
                owners[count] = fd;
                ++count;
            }
        }
        if (inPipe[1] >= 0) {
            fds[count] = pollfd{inPipe[1], POLLOUT, 0};
            owners[count] = &inPipe[1];
            ++count;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int ready = ::poll(fds, count, static_cast<int>(remaining.count()) + 1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.err = std::strerror(errno);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            int& fd = *owners[i];
            if (&fd == &inPipe[1]) {
                if (fds[i].revents & (POLLERR | POLLHUP)) {
                    CloseFd(fd);
                    continue;
                }
                const ssize_t n = ::write(fd, input->data() + written, input->size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    CloseFd(fd);
                    continue;
                }
                if (written >= input->size()) {
                    CloseFd(fd);
                }
            } else {
                ReadAvailable(fd, &fd == &outPipe[0] ? result.out : result.err);
            }
        }
    }

    CloseFd(inPipe[1]);
    CloseFd(outPipe[0]);
    CloseFd(errPipe[0]);

    int status = 0;
    if (result.timedOut) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        return result;
    }

    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return result;
        }
    }
    result.exitCode = DecodeExitStatus(status);
    return result;
}

std::string FindExecutableOnPath(const std::string& name) {
    if (name.empty()) {
        return {};
    }

    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }

    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return {};
    }

    std::istringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return {};
}
