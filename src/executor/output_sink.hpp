/**
 * @file output_sink.hpp
 * @brief The run's output file: header, separator, raw child output.
 *
 * File layout:
 *   line 0   the space-joined command line
 *   line 1   separator_width copies of separator_char
 *   rest     the child's stdout/stderr bytes, unmodified
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>

namespace runexec {

struct OutputFormat {
    char separator_char = '-';
    uint32_t separator_width = 80;
};

class OutputSink {
public:
    /**
     * @brief Create or truncate the output file.
     */
    static Result<OutputSink> open(const std::filesystem::path& path,
                                   OutputFormat format = {});

    OutputSink(OutputSink&&) noexcept = default;
    OutputSink& operator=(OutputSink&&) noexcept = default;
    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;
    ~OutputSink();

    Result<void> write_header(const Command& command);
    Result<void> write_separator();

    /**
     * @brief Copy bytes from `fd` into the file until end-of-stream.
     *
     * Once `stop` is requested the remaining buffered bytes are still copied,
     * for at most `linger`, so a grandchild holding the pipe open cannot
     * block the run. A write failure stops recording but the pipe keeps
     * being read so the child never blocks on a full pipe.
     *
     * @return Number of bytes recorded.
     */
    Result<uint64_t> drain(int fd, std::stop_token stop,
                           std::chrono::milliseconds linger = std::chrono::milliseconds{200});

    /// Flush and close; reports a failed flush.
    Result<void> close();

    [[nodiscard]] bool is_open() const noexcept { return file_.is_open(); }
    [[nodiscard]] uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    OutputSink(std::filesystem::path path, OutputFormat format, std::ofstream file);

    Result<void> write_line(const std::string& line);

    std::filesystem::path path_;
    OutputFormat format_;
    std::ofstream file_;
    uint64_t bytes_written_{0};
};

}  // namespace runexec
