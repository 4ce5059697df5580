#ifndef COMMANDRUNNERMOCK_HPP
#define COMMANDRUNNERMOCK_HPP

#include <gmock/gmock.h>

#include "lib/command_runner.hpp"

class MockCommandRunner : public CommandRunner {
public:
    MOCK_METHOD(CommandResult, run, (const std::string& command), (override));
    MOCK_METHOD(int, runInteractive, (const std::string& command), (override));
    MOCK_METHOD(bool, exists, (const std::string& binary), (override));
};

inline CommandResult commandOk(const std::string& output = "") {
    CommandResult result;
    result.exitCode = 0;
    result.output = output;
    return result;
}

inline CommandResult commandFailed(int exitCode = 1, const std::string& output = "") {
    CommandResult result;
    result.exitCode = exitCode;
    result.output = output;
    return result;
}

#endif // COMMANDRUNNERMOCK_HPP
