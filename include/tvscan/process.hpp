#ifndef TVSCAN_PROCESS_HPP
#define TVSCAN_PROCESS_HPP

#include <string>
#include <string_view>

struct CommandResult {
    int exit_code{-1};
    std::string output;
};

CommandResult run_command(const std::string& command);

std::string escape_shell_arg(std::string_view arg);

// first word of a command line, e.g. "sudo" for "sudo arp-scan"
std::string command_name(std::string_view command);

bool is_command_available(const std::string& command_line);

#endif
