#include "lib/command_runner.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace {
    int decodeStatus(int status) {
        if (status == -1) {
            return -1;
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
}

std::string CommandRunner::runChecked(const std::string& command) {
    CommandResult result = run(command);
    if (!result.ok()) {
        throw CommandError(command, result.exitCode, result.output);
    }
    return result.output;
}

std::string CommandRunner::quote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string CommandRunner::join(const std::vector<std::string>& arguments) {
    std::string joined;
    for (const auto& argument : arguments) {
        if (!joined.empty()) {
            joined += " ";
        }
        joined += argument;
    }
    return joined;
}

CommandResult SystemCommandRunner::run(const std::string& command) {
    Logs::debug("Executing: " + command);
    
    CommandResult result;
    // Grouped so stderr of every stage in a pipeline or list is captured.
    std::string wrapped = "{ " + command + "\n} 2>&1";
    
    FILE* pipe = popen(wrapped.c_str(), "r");
    if (!pipe) {
        result.output = "popen failed";
        return result;
    }
    
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output += buffer;
    }
    
    result.exitCode = decodeStatus(pclose(pipe));
    return result;
}

int SystemCommandRunner::runInteractive(const std::string& command) {
    Logs::debug("Executing (interactive): " + command);
    return decodeStatus(std::system(command.c_str()));
}

bool SystemCommandRunner::exists(const std::string& binary) {
    return run("command -v " + quote(binary) + " >/dev/null").ok();
}
