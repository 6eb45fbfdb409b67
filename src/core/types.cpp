/**
 * @file types.cpp
 * @brief Command joining and RunResult rendering.
 */

#include "core/types.hpp"

#include <format>
#include <sstream>

namespace runexec {

std::string join_command(const Command& command) {
    std::string line;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) line += ' ';
        line += command[i];
    }
    return line;
}

std::vector<std::pair<std::string, std::string>> RunResult::fields() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(5);
    out.emplace_back("exitcode", std::to_string(exit_code));
    out.emplace_back("walltime", std::format("{:.6f}", wall_time));
    out.emplace_back("cputime", std::format("{:.6f}", cpu_time));
    if (memory) {
        out.emplace_back("memory", std::to_string(*memory));
    }
    if (termination_reason && *termination_reason != TerminationReason::None) {
        out.emplace_back("terminationreason", std::string{to_string(*termination_reason)});
    }
    return out;
}

std::string RunResult::to_json() const {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [key, value] : fields()) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << key << "\":";
        if (key == "terminationreason") {
            oss << '"' << value << '"';
        } else {
            oss << value;
        }
    }
    oss << '}';
    return oss.str();
}

}  // namespace runexec
