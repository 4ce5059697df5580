#include "lib/errors.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include <unistd.h>
#include <iostream>

PvestrapException::PvestrapException(const std::string& msg) : message(msg) {}

const char* PvestrapException::what() const noexcept {
    return message.c_str();
}

PermissionError::PermissionError(const std::string& msg) 
    : PvestrapException(msg) {}

DeviceError::DeviceError(const std::string& device, const std::string& cause)
    : PvestrapException("Device error on " + device + ": " + cause) {}

FileError::FileError(const std::string& file, const std::string& cause)
    : PvestrapException("File error with " + file + ": " + cause) {}

FilesystemError::FilesystemError(const std::string& msg)
    : PvestrapException("Filesystem error: " + msg) {}

ValidationError::ValidationError(const std::string& msg)
    : PvestrapException(msg) {}

CommandError::CommandError(const std::string& command, int exitCode, const std::string& output)
    : PvestrapException("Command failed (exit " + std::to_string(exitCode) + "): " + command),
      status(exitCode), captured(output) {}

TransferError::TransferError(Kind kind, const std::string& msg)
    : PvestrapException(msg), errorKind(kind) {}

namespace ErrorHandler {
    void handleFatalError(const std::string& device, const std::string& cause) {
        std::string devName = device;
        if (devName.find("/dev/") == 0) {
            devName = devName.substr(5);
        }
        
        Logs::fatal("Fatal Error: Fail writing at /dev/" + devName + ", cause: " + cause);
        std::cerr << Colors::yellow("  The contents of /dev/" + devName + " are now undefined.") << std::endl;
        std::cerr << Colors::yellow("  Do not reuse it without re-running the whole write.") << std::endl;
    }
    
    void checkPrivileges() {
        if (geteuid() != 0) {
            std::cerr << Colors::red("This is a privileged tool, to access this, use sudo.") << std::endl;
            throw PermissionError("Root privileges required");
        }
    }
}
