/**
 * @file procfs.cpp
 * @brief Pseudo-filesystem parsing for the resource limiters.
 */

#include "limiter/procfs.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace runexec::procfs {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

int write_file(const std::filesystem::path& path, std::string_view value) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) return errno;

    int result = 0;
    ssize_t written = ::write(fd, value.data(), value.size());
    if (written < 0) {
        result = errno;
    } else if (static_cast<size_t>(written) != value.size()) {
        result = EIO;
    }
    if (::close(fd) != 0 && result == 0) {
        result = errno;
    }
    return result;
}

std::optional<uint64_t> read_keyed_value(const std::filesystem::path& path,
                                         std::string_view key) {
    for (const auto& line : read_file_lines(path)) {
        if (line.size() > key.size() && line.starts_with(key) && line[key.size()] == ' ') {
            try {
                return std::stoull(line.substr(key.size() + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

std::optional<uint64_t> read_single_value(const std::filesystem::path& path) {
    auto line = read_file_line(path);
    if (line.empty() || line == "max") return std::nullopt;
    try {
        return std::stoull(line);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

namespace {

struct StatFields {
    pid_t pgrp{0};
    uint64_t ticks{0};   ///< utime + stime + cutime + cstime
};

std::optional<StatFields> read_stat(pid_t pid) {
    auto line = read_file_line("/proc/" + std::to_string(pid) + "/stat");
    // comm (field 2) may contain spaces and parentheses; fields resume after the last ')'
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) return std::nullopt;

    std::istringstream iss(line.substr(close_paren + 1));
    std::vector<std::string> fields;
    std::string token;
    while (iss >> token && fields.size() < 15) {
        fields.push_back(std::move(token));
    }
    if (fields.size() < 15) return std::nullopt;

    StatFields stat;
    try {
        // fields[0] is field 3 (state); pgrp is field 5, utime..cstime are fields 14..17
        stat.pgrp = static_cast<pid_t>(std::stol(fields[2]));
        for (size_t i = 11; i <= 14; ++i) {
            stat.ticks += std::stoull(fields[i]);
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return stat;
}

std::optional<Duration> ticks_to_duration(uint64_t ticks) {
    static const long ticks_per_second = ::sysconf(_SC_CLK_TCK);
    if (ticks_per_second <= 0) return std::nullopt;
    return Duration{static_cast<int64_t>(ticks * 1'000'000 / static_cast<uint64_t>(ticks_per_second))};
}

std::optional<uint64_t> status_kb(pid_t pid, std::string_view key) {
    for (const auto& line : read_file_lines("/proc/" + std::to_string(pid) + "/status")) {
        if (line.starts_with(key) && line.size() > key.size() && line[key.size()] == ':') {
            std::istringstream iss(line.substr(key.size() + 1));
            uint64_t kb = 0;
            if (iss >> kb) return kb * 1024;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

std::optional<Duration> process_cpu_time(pid_t pid) {
    auto stat = read_stat(pid);
    if (!stat) return std::nullopt;
    return ticks_to_duration(stat->ticks);
}

std::vector<pid_t> process_group_members(pid_t pgid) {
    std::vector<pid_t> members;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        const auto name = it->path().filename().string();
        pid_t pid = 0;
        auto [end, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (parse_ec != std::errc{} || end != name.data() + name.size()) continue;

        // Entries vanish while we iterate; a failed read just skips the process.
        if (auto stat = read_stat(pid); stat && (stat->pgrp == pgid || pid == pgid)) {
            members.push_back(pid);
        }
    }
    return members;
}

std::optional<Duration> process_group_cpu_time(pid_t pgid) {
    uint64_t ticks = 0;
    bool found = false;
    for (pid_t pid : process_group_members(pgid)) {
        if (auto stat = read_stat(pid)) {
            ticks += stat->ticks;
            found = true;
        }
    }
    if (!found) return std::nullopt;
    return ticks_to_duration(ticks);
}

std::optional<uint64_t> process_peak_rss(pid_t pid) {
    return status_kb(pid, "VmHWM");
}

std::optional<uint64_t> process_peak_vm(pid_t pid) {
    return status_kb(pid, "VmPeak");
}

}  // namespace runexec::procfs
