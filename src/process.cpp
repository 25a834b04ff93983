#include <tvscan/process.hpp>
#include <tvscan/utils.hpp>

#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>

struct PipeDeleter {
    void operator()(FILE* fp) const {
        if (fp != nullptr) {
            pclose(fp);
        }
    }
};

CommandResult run_command(const std::string& command) {
    std::array<char, 256> buffer;
    CommandResult result;

    std::unique_ptr<FILE, PipeDeleter> pipe(popen(command.c_str(), "r"));
    if (!pipe) {
        throw std::runtime_error("failed to execute command: " + command);
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    // release() so the deleter does not close the stream a second time
    auto status = pclose(pipe.release());
    if (status == -1) {
        throw std::runtime_error("failed to collect exit status of: " + command);
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

std::string escape_shell_arg(std::string_view arg) {
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += "'";
    return escaped;
}

std::string command_name(std::string_view command) {
    auto trimmed = trim(command);
    auto end = trimmed.find_first_of(" \t");
    return std::string(trimmed.substr(0, end));
}

bool is_command_available(const std::string& command_line) {
    auto command = command_name(command_line);
    if (command.empty()) {
        return false;
    }
    if (command.find('/') != std::string::npos) {
        return access(command.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::istringstream ss{std::string(path_env)};
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto full_path = dir + "/" + command;
        if (access(full_path.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}
