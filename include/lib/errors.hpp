#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <exception>

class PvestrapException : public std::exception {
private:
    std::string message;
    
public:
    explicit PvestrapException(const std::string& msg);
    const char* what() const noexcept override;
};

class PermissionError : public PvestrapException {
public:
    explicit PermissionError(const std::string& msg);
};

class DeviceError : public PvestrapException {
public:
    explicit DeviceError(const std::string& device, const std::string& cause);
};

class FileError : public PvestrapException {
public:
    explicit FileError(const std::string& file, const std::string& cause);
};

class FilesystemError : public PvestrapException {
public:
    explicit FilesystemError(const std::string& msg);
};

// Input rejected before any action was taken.
class ValidationError : public PvestrapException {
public:
    explicit ValidationError(const std::string& msg);
};

// An external tool exited non-zero.
class CommandError : public PvestrapException {
private:
    int status;
    std::string captured;
    
public:
    CommandError(const std::string& command, int exitCode, const std::string& output);
    int exitCode() const { return status; }
    const std::string& output() const { return captured; }
};

class TransferError : public PvestrapException {
public:
    enum class Kind {
        Exhausted,
        TooSmall
    };
    
private:
    Kind errorKind;
    
public:
    TransferError(Kind kind, const std::string& msg);
    Kind kind() const { return errorKind; }
};

namespace ErrorHandler {
    void handleFatalError(const std::string& device, const std::string& cause);
    void checkPrivileges();
}

#endif // ERRORS_HPP
