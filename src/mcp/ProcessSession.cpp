#include "mcp/ProcessSession.h"
#include <cerrno>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>

const char* terminationReasonName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::NONE: return "none";
        case TerminationReason::EXITED: return "exited";
        case TerminationReason::TIMED_OUT: return "timed-out";
        case TerminationReason::SPAWN_FAILED: return "spawn-failed";
    }
    return "none";
}

ProcessSession::ProcessSession(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid(pid), inFd(stdinFd), outFd(stdoutFd), errFd(stderrFd) {}

ProcessSession::~ProcessSession() {
    release();
}

void ProcessSession::closeStdin() {
    if (inFd >= 0) {
        close(inFd);
        inFd = -1;
    }
}

void ProcessSession::closeStdout() {
    if (outFd >= 0) {
        close(outFd);
        outFd = -1;
    }
}

void ProcessSession::closeStderr() {
    if (errFd >= 0) {
        close(errFd);
        errFd = -1;
    }
}

void ProcessSession::recordStatus(int status) {
    reaped = true;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        signalNo = WTERMSIG(status);
    }
}

bool ProcessSession::pollExit() {
    if (reaped || pid <= 0) return reaped;
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == ECHILD) reaped = true; // 已被别处回收
        return reaped;
    }
    if (info.si_pid != pid) return false;

    // 组长尚未回收时 pgid 不会被复用；此时清掉组内残留的孙进程再回收
    ::kill(-pid, SIGKILL);
    reap();
    return reaped;
}

void ProcessSession::reap() {
    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited == pid) {
        recordStatus(status);
    } else {
        reaped = true;
    }
}

void ProcessSession::kill() {
    // 回收之后 pid/pgid 可能已被复用，不再发送信号
    if (pid <= 0 || reaped) return;
    // 子进程是进程组组长；组内的孙进程一并结束
    if (::kill(-pid, SIGKILL) != 0) {
        ::kill(pid, SIGKILL);
    }
}

bool ProcessSession::resolve(TerminationReason why) {
    if (termination != TerminationReason::NONE) return false;
    termination = why;
    return true;
}

void ProcessSession::release() {
    closeStdin();
    if (pid > 0) {
        kill();
        if (!reaped) reap();
    }
    closeStdout();
    closeStderr();
}
