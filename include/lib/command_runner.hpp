#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <string>
#include <vector>

struct CommandResult {
    int exitCode = -1;
    std::string output;
    
    bool ok() const { return exitCode == 0; }
};

// Every external collaborator (partitioning tools, zpool/zfs, apt, tmux...)
// is reached through this interface.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    
    // Runs through /bin/sh with stdout and stderr captured together.
    virtual CommandResult run(const std::string& command) = 0;
    // Runs attached to the caller's terminal; returns the exit status.
    virtual int runInteractive(const std::string& command) = 0;
    // True when the binary resolves on PATH.
    virtual bool exists(const std::string& binary) = 0;
    
    // Throws CommandError on non-zero exit.
    std::string runChecked(const std::string& command);
    
    static std::string quote(const std::string& argument);
    static std::string join(const std::vector<std::string>& arguments);
};

class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
    int runInteractive(const std::string& command) override;
    bool exists(const std::string& binary) override;
};

#endif // COMMAND_RUNNER_HPP
