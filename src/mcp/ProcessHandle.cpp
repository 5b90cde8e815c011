#include "mcp/ProcessHandle.h"
#include "utils/Logger.h"
#include <map>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <csignal>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <poll.h>

extern char** environ;

namespace {
std::once_flag sigpipeOnce;

// 向已退出的子进程写入时返回 EPIPE，而不是让宿主进程收到 SIGPIPE
void ignoreSigpipe() {
    std::call_once(sigpipeOnce, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

int remainingMs(ProcessHandle::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - ProcessHandle::Clock::now());
    if (left.count() <= 0) return 0;
    return static_cast<int>(std::min<long long>(left.count(), 1000 * 60 * 60));
}
} // namespace

std::shared_ptr<ProcessHandle> ProcessHandle::spawn(const ServerConfig& config) {
    if (config.command.empty()) {
        throw SpawnError("empty command");
    }
    ignoreSigpipe();

    // argv/envp 在 fork 之前准备好，子进程里只做 dup2/exec
    std::vector<std::string> args;
    args.push_back(config.command);
    args.insert(args.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = buildEnvironment(config.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto& e : envStrings) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};  // exec 失败时子进程写回 errno
    auto closeAll = [&] {
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw SpawnError(std::string("pipe failed: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw SpawnError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        signal(SIGPIPE, SIG_DFL);

        environ = envp.data();
        execvp(argv[0], argv.data());

        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErr = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeAll();
        throw SpawnError("failed to spawn '" + config.command + "': " + std::strerror(childErr));
    }

    // 写端设为非阻塞，写超时由 poll 控制
    int flags = fcntl(inPipe[1], F_GETFL);
    if (flags >= 0) fcntl(inPipe[1], F_SETFL, flags | O_NONBLOCK);

    Logger::getInstance().debug("Spawned MCP server '" + config.id + "' (pid " + std::to_string(pid) + "): " +
                                config.command);
    return std::shared_ptr<ProcessHandle>(new ProcessHandle(config.id, pid, inPipe[1], outPipe[0], errPipe[0]));
}

ProcessHandle::ProcessHandle(std::string serverId, pid_t pid, int inFd, int outFd, int errFd)
    : id(std::move(serverId)),
      childPid(pid),
      writeFd(inFd),
      readFd(outFd),
      source(outFd),
      frameReader(source),
      stderrFd(errFd) {
    stderrThread = std::thread(&ProcessHandle::stderrLoop, this);
}

ProcessHandle::~ProcessHandle() {
    shutdown(std::chrono::milliseconds(0));
    stopStderr = true;
    if (stderrThread.joinable()) stderrThread.join();
    closeFd(writeFd);
    closeFd(readFd);
    closeFd(stderrFd);
}

std::unique_lock<std::timed_mutex> ProcessHandle::lockInput(Clock::time_point deadline) {
    std::unique_lock<std::timed_mutex> lock(inputMtx, std::defer_lock);
    if (!lock.try_lock_until(deadline)) throw FrameTimeout();
    return lock;
}

std::unique_lock<std::timed_mutex> ProcessHandle::lockOutput(Clock::time_point deadline) {
    std::unique_lock<std::timed_mutex> lock(outputMtx, std::defer_lock);
    if (!lock.try_lock_until(deadline)) throw FrameTimeout();
    return lock;
}

void ProcessHandle::writeAll(const std::string& bytes, Clock::time_point deadline) {
    if (writeFd < 0) throw FrameError("stdin closed");

    if (!pendingWrite.empty()) {
        size_t offset = 0;
        try {
            drain(pendingWrite, offset, deadline);
        } catch (const FrameTimeout&) {
            pendingWrite.erase(0, offset);
            throw;
        }
        pendingWrite.clear();
        Logger::getInstance().debug("[" + id + "] finished writing an interrupted frame");
    }

    size_t offset = 0;
    try {
        drain(bytes, offset, deadline);
    } catch (const FrameTimeout&) {
        // 半帧已经在管道里，剩余部分必须排在下一帧之前
        if (offset > 0) pendingWrite = bytes.substr(offset);
        throw;
    }
}

void ProcessHandle::drain(const std::string& bytes, size_t& offset, Clock::time_point deadline) {
    while (offset < bytes.size()) {
        ssize_t n = write(writeFd, bytes.data() + offset, bytes.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw FrameError(std::string("write failed: ") + std::strerror(errno));
        }

        // 管道已满，等子进程读走
        pollfd pfd{};
        pfd.fd = writeFd;
        pfd.events = POLLOUT;
        int ms = remainingMs(deadline);
        if (ms == 0) throw FrameTimeout();
        int rc = poll(&pfd, 1, ms);
        if (rc < 0 && errno != EINTR) {
            throw FrameError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc == 0) throw FrameTimeout();
        if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP)) && !(pfd.revents & POLLOUT)) {
            throw FrameError("write failed: broken pipe");
        }
    }
}

bool ProcessHandle::closeInput(std::chrono::milliseconds wait) {
    std::unique_lock<std::timed_mutex> lock(inputMtx, std::defer_lock);
    if (!lock.try_lock_for(wait)) return false;
    closeFd(writeFd);
    return true;
}

bool ProcessHandle::tryReap(bool block) {
    std::lock_guard<std::mutex> lock(procMtx);
    if (reaped) return true;
    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(childPid, &status, block ? 0 : WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == childPid) {
        reaped = true;
        waitStatus = status;
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        // 已被其他地方回收
        reaped = true;
        return true;
    }
    return false;
}

bool ProcessHandle::isAlive() {
    return !tryReap(false);
}

bool ProcessHandle::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (true) {
        if (tryReap(false)) return true;
        if (Clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ProcessHandle::shutdown(std::chrono::milliseconds grace) {
    if (tryReap(false)) return;

    closeInput(grace);
    if (waitForExit(grace)) {
        Logger::getInstance().debug("MCP server '" + id + "' exited (pid " + std::to_string(childPid) + ")");
        return;
    }

    if (kill(childPid, SIGKILL) != 0 && errno != ESRCH) {
        Logger::getInstance().warn("kill(" + std::to_string(childPid) + ") failed: " + std::strerror(errno));
    }
    tryReap(true);
    Logger::getInstance().debug("MCP server '" + id + "' killed (pid " + std::to_string(childPid) + ")");
}

std::optional<int> ProcessHandle::exitStatus() {
    std::lock_guard<std::mutex> lock(procMtx);
    if (!reaped) return std::nullopt;
    return waitStatus;
}

std::vector<std::string> ProcessHandle::recentStderr() const {
    std::lock_guard<std::mutex> lock(stderrMtx);
    return std::vector<std::string>(stderrTail.begin(), stderrTail.end());
}

void ProcessHandle::stderrLoop() {
    std::string pending;
    char temp[1024];
    while (!stopStderr) {
        pollfd pfd{};
        pfd.fd = stderrFd;
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(stderrFd, temp, sizeof(temp));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        pending.append(temp, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            Logger::getInstance().debug("[" + id + " stderr] " + line);
            std::lock_guard<std::mutex> lock(stderrMtx);
            stderrTail.push_back(line);
            if (stderrTail.size() > kStderrTailLines) stderrTail.pop_front();
        }
        while (pending.size() >= kStderrMaxLine) {
            std::string line = pending.substr(0, kStderrMaxLine);
            pending.erase(0, kStderrMaxLine);
            Logger::getInstance().debug("[" + id + " stderr] " + line);
            std::lock_guard<std::mutex> lock(stderrMtx);
            stderrTail.push_back(line);
            if (stderrTail.size() > kStderrTailLines) stderrTail.pop_front();
        }
    }
    if (!pending.empty()) {
        std::lock_guard<std::mutex> lock(stderrMtx);
        stderrTail.push_back(pending);
        if (stderrTail.size() > kStderrTailLines) stderrTail.pop_front();
    }
}
