#pragma once
#include <string>
#include <sys/types.h>

enum class TerminationReason {
    NONE,
    EXITED,
    TIMED_OUT,
    SPAWN_FAILED
};

const char* terminationReasonName(TerminationReason reason);

/**
 * @brief 一次发现调用独占的子进程会话
 *
 * 持有子进程 pid、stdin/stdout/stderr 管道以及累积的输出文本。
 * 析构时保证整个进程组被杀死并回收、所有句柄关闭，子进程不会活过调用本身。
 */
class ProcessSession {
public:
    ProcessSession(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    ~ProcessSession();

    ProcessSession(const ProcessSession&) = delete;
    ProcessSession& operator=(const ProcessSession&) = delete;

    pid_t getPid() const { return pid; }
    int stdinFd() const { return inFd; }
    int stdoutFd() const { return outFd; }
    int stderrFd() const { return errFd; }

    bool stdinOpen() const { return inFd >= 0; }
    bool stdoutOpen() const { return outFd >= 0; }
    bool stderrOpen() const { return errFd >= 0; }

    void closeStdin();
    void closeStdout();
    void closeStderr();

    std::string stdoutText;
    std::string stderrText;

    // 非阻塞检查子进程是否已退出；退出时先杀掉同组残留进程，再回收并记录状态
    bool pollExit();
    bool hasExited() const { return reaped; }
    // -1 when the process was killed by a signal or has not exited
    int exitCode() const { return code; }
    int termSignal() const { return signalNo; }

    // SIGKILL the process group while the leader is unreaped. Safe to call any number of times.
    void kill();

    // First caller wins; later calls return false and leave the reason unchanged
    bool resolve(TerminationReason why);
    TerminationReason reason() const { return termination; }

    // Kill, reap and close everything. Idempotent.
    void release();

private:
    pid_t pid;
    int inFd;
    int outFd;
    int errFd;
    bool reaped = false;
    int code = -1;
    int signalNo = 0;
    TerminationReason termination = TerminationReason::NONE;

    void recordStatus(int status);
    // Blocking waitpid with EINTR retry
    void reap();
};
