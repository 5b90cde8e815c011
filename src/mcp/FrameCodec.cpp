#include "mcp/FrameCodec.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <limits>

#include <poll.h>
#include <unistd.h>

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

size_t parseContentLength(const std::string& value) {
    std::string digits = trim(value);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw FrameError("invalid Content-Length: '" + digits + "'");
    }
    try {
        unsigned long long n = std::stoull(digits);
        if (n > std::numeric_limits<size_t>::max()) {
            throw FrameError("Content-Length out of range: " + digits);
        }
        return static_cast<size_t>(n);
    } catch (const std::out_of_range&) {
        throw FrameError("Content-Length out of range: " + digits);
    }
}

// Returns true and sets length when the header line is Content-Length.
bool readContentLength(const std::string& line, size_t& length) {
    auto colon = line.find(':');
    if (colon == std::string::npos) return false;
    if (toLower(trim(line.substr(0, colon))) != "content-length") return false;
    length = parseContentLength(line.substr(colon + 1));
    return true;
}
} // namespace

size_t FdByteSource::readSome(char* buf, size_t len, std::chrono::milliseconds wait) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    bool unbounded = wait.count() < 0;
    auto deadline = std::chrono::steady_clock::now() + (unbounded ? std::chrono::milliseconds(0) : wait);
    while (true) {
        int timeoutMs = -1;
        if (!unbounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);
            timeoutMs = static_cast<int>(std::min<long long>(remaining.count(), std::numeric_limits<int>::max()));
        }

        int rc = poll(&pfd, 1, timeoutMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw FrameError(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc == 0) {
            throw FrameTimeout();
        }

        ssize_t n = read(fd, buf, len);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw FrameError(std::string("read failed: ") + std::strerror(errno));
        }
        return static_cast<size_t>(n);
    }
}

size_t StreamByteSource::readSome(char* buf, size_t len, std::chrono::milliseconds /*wait*/) {
    if (!in.good()) return 0;
    in.read(buf, static_cast<std::streamsize>(len));
    return static_cast<size_t>(in.gcount());
}

bool FrameReader::tryExtract(std::string& body) {
    size_t pos = 0;
    bool haveLength = false;
    size_t contentLength = 0;

    while (true) {
        size_t nl = buffer.find('\n', pos);
        if (nl == std::string::npos) return false;

        std::string line = buffer.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = nl + 1;

        if (line.empty()) break;

        try {
            if (readContentLength(line, contentLength)) haveLength = true;
        } catch (const FrameError&) {
            buffer.erase(0, pos);
            throw;
        }
    }

    if (!haveLength) {
        buffer.erase(0, pos);
        throw FrameError("missing Content-Length header");
    }
    if (buffer.size() - pos < contentLength) return false;

    body = buffer.substr(pos, contentLength);
    buffer.erase(0, pos + contentLength);
    return true;
}

bool FrameReader::fill(Clock::time_point deadline, bool bounded) {
    char temp[4096];
    std::chrono::milliseconds wait(-1);
    if (bounded) {
        auto now = Clock::now();
        if (now >= deadline) throw FrameTimeout();
        wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (wait.count() == 0) wait = std::chrono::milliseconds(1);
    }
    size_t n = source.readSome(temp, sizeof(temp), wait);
    if (n == 0) return false;
    buffer.append(temp, n);
    return true;
}

nlohmann::json FrameReader::readFrame(Clock::time_point deadline) {
    return read(deadline, true);
}

nlohmann::json FrameReader::readFrame() {
    return read(Clock::time_point::max(), false);
}

nlohmann::json FrameReader::read(Clock::time_point deadline, bool bounded) {
    std::string body;
    while (!tryExtract(body)) {
        if (!fill(deadline, bounded)) {
            bool headersDone = buffer.find("\n\n") != std::string::npos ||
                               buffer.find("\n\r\n") != std::string::npos;
            if (!headersDone) throw FrameError("stream closed before headers complete");
            throw FrameError("stream closed before body complete");
        }
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FrameError(std::string("invalid JSON body: ") + e.what());
    }
}

std::string FrameCodec::encode(const nlohmann::json& payload) {
    std::string body = payload.dump();
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

nlohmann::json FrameCodec::decode(std::istream& in) {
    bool haveLength = false;
    size_t contentLength = 0;
    bool headersDone = false;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            headersDone = true;
            break;
        }
        if (readContentLength(line, contentLength)) haveLength = true;
    }
    if (!headersDone) throw FrameError("stream closed before headers complete");
    if (!haveLength) throw FrameError("missing Content-Length header");

    std::string body(contentLength, '\0');
    in.read(&body[0], static_cast<std::streamsize>(contentLength));
    if (static_cast<size_t>(in.gcount()) != contentLength) {
        throw FrameError("stream closed before body complete (" + std::to_string(in.gcount()) + " of " +
                         std::to_string(contentLength) + " bytes)");
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FrameError(std::string("invalid JSON body: ") + e.what());
    }
}
