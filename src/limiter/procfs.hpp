/**
 * @file procfs.hpp
 * @brief Helpers for reading Linux pseudo-filesystems (/proc, /sys/fs/cgroup).
 */

#pragma once

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace runexec::procfs {

/// First line of a file, or an empty string if it cannot be read.
std::string read_file_line(const std::filesystem::path& path);

/// All lines of a file; empty if it cannot be read.
std::vector<std::string> read_file_lines(const std::filesystem::path& path);

/// Overwrite a pseudo-file with `value`. Returns errno on failure, 0 on success.
int write_file(const std::filesystem::path& path, std::string_view value);

/**
 * @brief Look up "<key> <number>" in a flat-keyed file such as cpu.stat or
 *        memory.events.
 */
std::optional<uint64_t> read_keyed_value(const std::filesystem::path& path,
                                         std::string_view key);

/// A file holding a single integer (memory.peak, memory.current).
std::optional<uint64_t> read_single_value(const std::filesystem::path& path);

/**
 * @brief utime + stime + cutime + cstime of a process from /proc/<pid>/stat.
 *
 * Works for zombies; returns nullopt once the process has been reaped.
 */
std::optional<Duration> process_cpu_time(pid_t pid);

/// Pids whose process group is `pgid` (the leader itself included).
std::vector<pid_t> process_group_members(pid_t pgid);

/**
 * @brief process_cpu_time() summed over every live or zombie member of a
 *        process group.
 *
 * Children that are running count through their own entry, reaped ones
 * through their parent's cutime/cstime. nullopt when no member is left.
 */
std::optional<Duration> process_group_cpu_time(pid_t pgid);

/// Peak resident set size (VmHWM) of a live process, in bytes.
std::optional<uint64_t> process_peak_rss(pid_t pid);

/// Peak address-space size (VmPeak) of a live process, in bytes.
std::optional<uint64_t> process_peak_vm(pid_t pid);

}  // namespace runexec::procfs
