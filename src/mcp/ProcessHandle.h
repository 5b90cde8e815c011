#pragma once
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <sys/types.h>
#include "core/ConfigManager.h"
#include "mcp/FrameCodec.h"

/** 子进程无法启动 (可执行文件不存在、没有权限、fork/pipe 失败) */
class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 一个运行中的 MCP 子进程
 *
 * 持有子进程 pid、stdin 写端和 stdout 读端。两个管道各自有独立的锁，
 * 只能在持有对应锁时访问:
 *
 *   auto in = handle->lockInput(deadline);
 *   handle->writeAll(bytes, deadline);
 *   auto out = handle->lockOutput(deadline);
 *   in.unlock();
 *   auto msg = handle->reader().readFrame(deadline);
 *
 * stderr 不属于协议通道，由后台线程读出并写入日志。
 * 析构时若子进程仍在运行会强制结束并回收。
 */
class ProcessHandle {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr size_t kStderrTailLines = 50;
    // 没有换行的 stderr 输出超过这个长度时按一行截断
    static constexpr size_t kStderrMaxLine = 4096;

    /** Spawns config.command with config.args. Throws SpawnError. */
    static std::shared_ptr<ProcessHandle> spawn(const ServerConfig& config);

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    const std::string& serverId() const { return id; }
    pid_t pid() const { return childPid; }

    /** Throws FrameTimeout when the lock is not acquired before the deadline. */
    std::unique_lock<std::timed_mutex> lockInput(Clock::time_point deadline);
    std::unique_lock<std::timed_mutex> lockOutput(Clock::time_point deadline);

    /**
     * @brief 写入一整帧，需要持有输入锁。抛出 FrameError / FrameTimeout。
     *
     * 超时发生在帧中间时，未写出的部分保存在 pendingWrite 中，下一次 writeAll
     * 先把它写完再写新帧，子进程读到的始终是完整的帧序列。
     * 一个字节都没写出的帧直接丢弃。
     */
    void writeAll(const std::string& bytes, Clock::time_point deadline);

    /** Bytes of a partially written frame still owed to the child. Requires the input lock. */
    size_t pendingInput() const { return pendingWrite.size(); }

    /** Requires the output lock. */
    FrameReader& reader() { return frameReader; }

    /** Closes stdin so the child sees EOF. Gives up if a writer holds the lock past `wait`. */
    bool closeInput(std::chrono::milliseconds wait);

    bool isAlive();
    bool waitForExit(std::chrono::milliseconds timeout);

    /**
     * @brief 关闭 stdin，等待 grace，仍未退出则 SIGKILL，最后 waitpid 回收。
     * 可以重复调用。
     */
    void shutdown(std::chrono::milliseconds grace);

    /** Raw waitpid status once the child has been reaped. */
    std::optional<int> exitStatus();

    std::vector<std::string> recentStderr() const;

private:
    ProcessHandle(std::string serverId, pid_t pid, int inFd, int outFd, int errFd);

    std::string id;
    pid_t childPid = -1;

    std::timed_mutex inputMtx;
    int writeFd = -1;
    std::string pendingWrite;

    std::timed_mutex outputMtx;
    int readFd = -1;
    FdByteSource source;
    FrameReader frameReader;

    std::mutex procMtx;
    bool reaped = false;
    int waitStatus = 0;

    int stderrFd = -1;
    std::thread stderrThread;
    std::atomic<bool> stopStderr{false};
    mutable std::mutex stderrMtx;
    std::deque<std::string> stderrTail;

    void drain(const std::string& bytes, size_t& offset, Clock::time_point deadline);
    bool tryReap(bool block);
    void stderrLoop();
};
