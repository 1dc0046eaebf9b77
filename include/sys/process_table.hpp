#ifndef PROCESS_TABLE_HPP
#define PROCESS_TABLE_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <string>
#include <system_error>
#include <vector>

#include "sys/file_descriptor.hpp"

namespace sys {

/// Command lines of the running processes, read from <procRoot>/<pid>/cmdline
/// with NUL separators turned into spaces. Processes that exit while the
/// table is scanned are skipped.
inline std::vector<std::string> processCommandLines(const std::string& procRoot = "/proc") {
    std::vector<std::string> commandLines;

    std::error_code ec;
    std::filesystem::directory_iterator it(procRoot, ec);
    if (ec) {
        throw std::system_error(ec, "Failed to list " + procRoot);
    }

    for (const auto& entry : it) {
        const std::string pid = entry.path().filename().string();
        if (pid.empty() || !std::all_of(pid.begin(), pid.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }

        std::string commandLine;
        try {
            FileDescriptor file(entry.path().string() + "/cmdline", O_RDONLY | O_CLOEXEC);
            commandLine = file.readAll();
        } catch (const std::system_error&) {
            continue;
        }
        if (commandLine.empty()) {
            continue;  // kernel thread
        }
        while (!commandLine.empty() && commandLine.back() == '\0') {
            commandLine.pop_back();
        }
        for (auto& c : commandLine) {
            if (c == '\0') {
                c = ' ';
            }
        }
        commandLines.push_back(std::move(commandLine));
    }
    return commandLines;
}

/// True while `pihole -up` (or any command line matching "pihole.*-up") runs
inline bool isPiholeUpdateRunning(const std::string& procRoot = "/proc") {
    static const std::regex pattern("pihole.*-up");
    for (const auto& commandLine : processCommandLines(procRoot)) {
        if (std::regex_search(commandLine, pattern)) {
            return true;
        }
    }
    return false;
}

}

#endif // PROCESS_TABLE_HPP
