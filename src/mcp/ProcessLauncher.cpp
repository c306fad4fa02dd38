#include "mcp/ProcessLauncher.h"
#include <cerrno>
#include <cstring>
#include <mutex>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace {
void closePair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// 写已退出子进程的 stdin 时返回 EPIPE，而不是让宿主被 SIGPIPE 杀掉
void ignoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}
} // namespace

const std::vector<std::string>& ProcessLauncher::defaultDiscoveryArgs() {
    static const std::vector<std::string> args = {"--list-functions", "--discovery"};
    return args;
}

const std::vector<std::pair<std::string, std::string>>& ProcessLauncher::discoveryEnvironment() {
    static const std::vector<std::pair<std::string, std::string>> vars = {
        {"MCP_LIST_FUNCTIONS", "true"},
        {"MCP_DISCOVERY_MODE", "true"},
        {"MCP_REQUIRE_DESCRIPTIONS", "true"},
        {"MCP_LIST_TOOLS", "true"},
        {"FUNCTIONS_DISCOVERY", "true"},
        {"NODE_ENV", "discovery"}
    };
    return vars;
}

std::vector<std::string> ProcessLauncher::effectiveArgs(const std::vector<std::string>& args) {
    if (args.empty()) return defaultDiscoveryArgs();
    return args;
}

std::map<std::string, std::string> ProcessLauncher::buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }
    for (const auto& [key, value] : discoveryEnvironment()) {
        env[key] = value;
    }
    return env;
}

std::string ProcessLauncher::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string ProcessLauncher::buildCommandLine(const std::string& command, const std::vector<std::string>& args) {
    std::string line = command;
    for (const auto& arg : args) {
        line += " ";
        line += shellQuote(arg);
    }
    return line;
}

std::unique_ptr<ProcessSession> ProcessLauncher::launch(const LaunchRequest& request) {
    if (request.command.empty()) {
        throw SpawnFailure("Empty command");
    }
    ignoreSigpipeOnce();

    // Everything the child needs is prepared before fork
    const std::string commandLine = buildCommandLine(request.command, effectiveArgs(request.args));
    std::vector<std::string> envStrings;
    for (const auto& [key, value] : buildEnvironment(request.env)) {
        envStrings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& s : envStrings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    // O_CLOEXEC 原子设置：并发 launch 的其他子进程不会继承这些管道
    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(statusPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        throw SpawnFailure(std::string("Failed to create pipes: ") + std::strerror(err));
    }
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(statusPipe);
        throw SpawnFailure(std::string("Failed to fork: ") + std::strerror(err));
    }

    if (pid == 0) { // Child
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        const char* argv[] = {"/bin/sh", "-c", commandLine.c_str(), nullptr};
        execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
        // exec 失败：通过 status pipe 把 errno 交给父进程
        int err = errno;
        ssize_t ignored = write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);
    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);
    close(statusPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(inPipe[1]);
        close(outPipe[0]);
        close(errPipe[0]);
        throw SpawnFailure(std::string("Failed to execute /bin/sh: ") + std::strerror(childErr));
    }

    setNonBlocking(inPipe[1]);
    setNonBlocking(outPipe[0]);
    setNonBlocking(errPipe[0]);
    return std::make_unique<ProcessSession>(pid, inPipe[1], outPipe[0], errPipe[0]);
}
