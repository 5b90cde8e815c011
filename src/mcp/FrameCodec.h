#pragma once
#include <string>
#include <chrono>
#include <istream>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief 传输层错误 (断管、帧格式错误、JSON 解析失败)
 */
class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 在截止时间前没有收到完整的帧
 */
class FrameTimeout : public FrameError {
public:
    FrameTimeout() : FrameError("timeout") {}
};

/**
 * @brief 字节来源抽象
 *
 * readSome() 返回读到的字节数，0 表示对端已关闭 (EOF)。
 * 在 wait 时间内没有任何数据到达时抛出 FrameTimeout，wait 为负数表示无限等待。
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t readSome(char* buf, size_t len, std::chrono::milliseconds wait) = 0;
};

/** Reads from a pipe/file descriptor, waiting with poll(2). Does not own the fd. */
class FdByteSource : public ByteSource {
public:
    explicit FdByteSource(int fd) : fd(fd) {}
    size_t readSome(char* buf, size_t len, std::chrono::milliseconds wait) override;

private:
    int fd;
};

/** Adapter for std::istream. The wait argument is ignored. */
class StreamByteSource : public ByteSource {
public:
    explicit StreamByteSource(std::istream& in) : in(in) {}
    size_t readSome(char* buf, size_t len, std::chrono::milliseconds wait) override;

private:
    std::istream& in;
};

/**
 * @brief 带缓冲的帧读取器
 *
 * 只有完整读到一帧后才从缓冲区移除对应字节，超时时已到达的半帧保留在缓冲区，
 * 下一次 readFrame() 从同一帧边界继续。
 */
class FrameReader {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameReader(ByteSource& source) : source(source) {}

    /** Reads one frame, throwing FrameTimeout once the deadline passes. */
    nlohmann::json readFrame(Clock::time_point deadline);

    /** Reads one frame without a deadline. */
    nlohmann::json readFrame();

    /** Bytes received but not yet consumed as a frame. */
    size_t buffered() const { return buffer.size(); }

private:
    ByteSource& source;
    std::string buffer;

    // Returns true and sets body when a complete frame is buffered.
    bool tryExtract(std::string& body);
    bool fill(Clock::time_point deadline, bool bounded);
    nlohmann::json read(Clock::time_point deadline, bool bounded);
};

/**
 * @brief Content-Length 帧编解码
 *
 * 报文格式:
 *   Content-Length: <N>\r\n
 *   \r\n
 *   <N 字节 UTF-8 JSON>
 */
class FrameCodec {
public:
    static std::string encode(const nlohmann::json& payload);

    /** Decodes exactly one frame from the stream. Throws FrameError on failure. */
    static nlohmann::json decode(std::istream& in);
};
