/**
 * @file output_sink.cpp
 * @brief OutputSink implementation.
 */

#include "executor/output_sink.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace runexec {

namespace {

constexpr size_t kDrainBufferSize = 64 * 1024;
constexpr int kPollTimeoutMs = 50;

}  // anonymous namespace

OutputSink::OutputSink(std::filesystem::path path, OutputFormat format, std::ofstream file)
    : path_(std::move(path)), format_(format), file_(std::move(file)) {}

OutputSink::~OutputSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

Result<OutputSink> OutputSink::open(const std::filesystem::path& path, OutputFormat format) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Error{std::format("Cannot open output file {}: {}", path.string(),
                                 std::strerror(errno)),
                     ErrorCode::Io};
    }
    return OutputSink(path, format, std::move(file));
}

Result<void> OutputSink::write_line(const std::string& line) {
    file_ << line << '\n';
    file_.flush();
    if (!file_) {
        return Error{"Write to " + path_.string() + " failed", ErrorCode::Io};
    }
    return {};
}

Result<void> OutputSink::write_header(const Command& command) {
    return write_line(join_command(command));
}

Result<void> OutputSink::write_separator() {
    return write_line(std::string(format_.separator_width, format_.separator_char));
}

Result<uint64_t> OutputSink::drain(int fd, std::stop_token stop,
                                   std::chrono::milliseconds linger) {
    std::array<char, kDrainBufferSize> buffer{};
    uint64_t recorded = 0;
    std::optional<Error> write_error;
    std::optional<SteadyTime> linger_deadline;

    while (true) {
        if (stop.stop_requested() && !linger_deadline) {
            linger_deadline = std::chrono::steady_clock::now() + linger;
        }
        if (linger_deadline && std::chrono::steady_clock::now() >= *linger_deadline) {
            break;
        }

        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{std::format("poll on child output failed: {}", std::strerror(errno)),
                         ErrorCode::Io};
        }
        if (ready == 0) {
            // Nothing buffered: after a stop request the pipe is drained.
            if (linger_deadline) break;
            continue;
        }

        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Error{std::format("read from child output failed: {}", std::strerror(errno)),
                         ErrorCode::Io};
        }
        if (n == 0) break;  // EOF

        if (write_error) continue;
        file_.write(buffer.data(), n);
        if (!file_) {
            write_error = Error{"Write to " + path_.string() + " failed", ErrorCode::Io};
            continue;
        }
        recorded += static_cast<uint64_t>(n);
        bytes_written_ += static_cast<uint64_t>(n);
    }

    file_.flush();
    if (write_error) return std::move(*write_error);
    if (!file_) {
        return Error{"Flush of " + path_.string() + " failed", ErrorCode::Io};
    }
    return recorded;
}

Result<void> OutputSink::close() {
    if (!file_.is_open()) return {};
    file_.flush();
    bool ok = static_cast<bool>(file_);
    file_.close();
    if (!ok || file_.fail()) {
        return Error{"Closing " + path_.string() + " failed", ErrorCode::Io};
    }
    return {};
}

}  // namespace runexec
