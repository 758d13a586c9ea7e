#include "CommandExecutor.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
std::string ErrnoMessage(const std::string& what, int error) {
    return what + ": " + std::strerror(error);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<char*> BuildArgv(const std::vector<std::string>& argv) {
    std::vector<char*> result;
    result.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        result.push_back(const_cast<char*>(arg.c_str()));
    }
    result.push_back(nullptr);
    return result;
}

// Launches argv with the given stdout/stderr descriptors (-1 keeps the
// parent's). Exec failures are reported back through a close-on-exec pipe.
pid_t Spawn(const std::vector<std::string>& argv, int stdoutFd, int stderrFd, std::string& outError) {
    if (argv.empty()) {
        outError = "empty command";
        return -1;
    }

    int statusPipe[2];
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        outError = ErrnoMessage("pipe", errno);
        return -1;
    }

    std::vector<char*> args = BuildArgv(argv);

    const pid_t pid = ::fork();
    if (pid == -1) {
        outError = ErrnoMessage("fork", errno);
        ::close(statusPipe[0]);
        ::close(statusPipe[1]);
        return -1;
    }

    if (pid == 0) {
        ::close(statusPipe[0]);
        if (stdoutFd >= 0) {
            ::dup2(stdoutFd, STDOUT_FILENO);
        }
        if (stderrFd >= 0) {
            ::dup2(stderrFd, STDERR_FILENO);
        }
        ::execvp(args[0], args.data());
        const int error = errno;
        ssize_t written = ::write(statusPipe[1], &error, sizeof(error));
        (void)written;
        ::_exit(127);
    }

    ::close(statusPipe[1]);
    int childErrno = 0;
    ssize_t bytes = 0;
    do {
        bytes = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (bytes == -1 && errno == EINTR);
    ::close(statusPipe[0]);

    if (bytes == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        outError = ErrnoMessage("exec " + argv.front(), childErrno);
        return -1;
    }

    return pid;
}

void DecodeStatus(int status, CommandResult& result) {
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        return;
    }

    if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
        result.error = "terminated by signal " + std::to_string(WTERMSIG(status));
        return;
    }

    result.error = "unexpected wait status " + std::to_string(status);
}

CommandResult WaitForPid(pid_t pid) {
    CommandResult result;
    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (waited == -1) {
        result.error = ErrnoMessage("waitpid", errno);
        return result;
    }

    DecodeStatus(status, result);
    return result;
}

// Drains both pipes until EOF so a chatty child cannot block on a full pipe.
void DrainPipes(int& outFd, int& errFd, std::string& out, std::string& err) {
    char buffer[4096];
    while (outFd >= 0 || errFd >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (outFd >= 0) {
            fds[count++] = pollfd{outFd, POLLIN, 0};
        }
        if (errFd >= 0) {
            fds[count++] = pollfd{errFd, POLLIN, 0};
        }

        if (::poll(fds, count, -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t bytes = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes > 0) {
                (fds[i].fd == outFd ? out : err).append(buffer, static_cast<size_t>(bytes));
            } else if (bytes == 0 || errno != EINTR) {
                CloseFd(fds[i].fd == outFd ? outFd : errFd);
            }
        }
    }

    CloseFd(outFd);
    CloseFd(errFd);
}

class ChildProcessHandle : public ProcessHandle {
public:
    explicit ChildProcessHandle(pid_t pid)
        : pid_(pid) {}

    CommandResult Wait() override {
        return WaitForPid(pid_);
    }

private:
    pid_t pid_;
};
} // namespace

std::string CommandResult::Describe() const {
    std::ostringstream text;
    if (!error.empty()) {
        text << error;
    } else {
        text << "exit status " << exitCode;
    }

    std::string detail = err.empty() ? out : err;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    if (!detail.empty()) {
        text << " (" << detail << ")";
    }
    return text.str();
}

std::string ResourceLocator::ToString() const {
    if (IsLocal()) {
        return path;
    }

    std::string text;
    if (!user.empty()) {
        text += user + "@";
    }
    text += host + ":" + path;
    return text;
}

CommandResult LocalExecutor::Run(const std::vector<std::string>& argv) {
    CommandResult result;

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.error = ErrnoMessage("pipe", errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.error = ErrnoMessage("pipe", errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return result;
    }

    const pid_t pid = Spawn(argv, outPipe[1], errPipe[1], result.error);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    int outFd = outPipe[0];
    int errFd = errPipe[0];
    if (pid == -1) {
        CloseFd(outFd);
        CloseFd(errFd);
        return result;
    }

    DrainPipes(outFd, errFd, result.out, result.err);

    CommandResult waited = WaitForPid(pid);
    result.exitCode = waited.exitCode;
    result.error = waited.error;
    return result;
}

std::unique_ptr<ProcessHandle> LocalExecutor::Start(const std::vector<std::string>& argv, std::string& outError) {
    const pid_t pid = Spawn(argv, -1, -1, outError);
    if (pid == -1) {
        return nullptr;
    }

    return std::make_unique<ChildProcessHandle>(pid);
}

ResourceLocator LocalExecutor::Locator(const std::string& path) const {
    ResourceLocator locator;
    locator.path = path;
    return locator;
}

std::string LocalExecutor::Describe() const {
    return "localhost";
}

SshExecutor::SshExecutor(std::string host, std::string user, int port)
    : host_(std::move(host)),
      user_(std::move(user)),
      port_(port) {}

CommandResult SshExecutor::Run(const std::vector<std::string>& argv) {
    return local_.Run(BuildSshCommand(argv));
}

std::unique_ptr<ProcessHandle> SshExecutor::Start(const std::vector<std::string>& argv, std::string& outError) {
    return local_.Start(BuildSshCommand(argv), outError);
}

ResourceLocator SshExecutor::Locator(const std::string& path) const {
    ResourceLocator locator;
    locator.user = user_;
    locator.host = host_;
    locator.port = port_;
    locator.path = path;
    return locator;
}

std::string SshExecutor::Describe() const {
    std::string text = user_.empty() ? host_ : user_ + "@" + host_;
    if (port_ > 0) {
        text += ":" + std::to_string(port_);
    }
    return text;
}

std::vector<std::string> SshExecutor::BuildSshCommand(const std::vector<std::string>& argv) const {
    std::vector<std::string> command = {"ssh"};
    const std::vector<std::string> options = ClientOptions();
    command.insert(command.end(), options.begin(), options.end());
    if (port_ > 0) {
        command.push_back("-p");
        command.push_back(std::to_string(port_));
    }
    command.push_back(user_.empty() ? host_ : user_ + "@" + host_);
    command.push_back("--");
    command.push_back(JoinQuoted(argv));
    return command;
}

std::vector<std::string> SshExecutor::ClientOptions() {
    return {
        "-o", "BatchMode=yes",
        "-o", "ConnectTimeout=10",
        "-o", "ServerAliveInterval=5",
        "-o", "ServerAliveCountMax=3",
    };
}

std::string SshExecutor::QuoteArgument(const std::string& argument) {
    if (argument.empty()) {
        return "''";
    }

    bool safe = true;
    for (const char ch : argument) {
        const bool plain = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')
            || ch == '/' || ch == '.' || ch == '-' || ch == '_' || ch == '=' || ch == ':' || ch == '@' || ch == ',';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return argument;
    }

    std::string quoted = "'";
    for (const char ch : argument) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted += ch;
        }
    }
    quoted += "'";
    return quoted;
}

std::string SshExecutor::JoinQuoted(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += QuoteArgument(arg);
    }
    return joined;
}
