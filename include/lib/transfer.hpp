#ifndef TRANSFER_HPP
#define TRANSFER_HPP

#include "lib/command_runner.hpp"
#include "utils/progress_bar.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Transfer {
    
    struct TransferJob {
        std::string uri;
        std::string destination;
        // Sanity floor; smaller results are treated as error pages.
        uint64_t minimumBytes = 0;
        bool reuseExisting = false;
        
        // Strategies write here; the engine renames it into place on success.
        std::string partialPath() const { return destination + ".part"; }
    };
    
    struct AttemptResult {
        bool ok = false;
        std::string error;
        
        static AttemptResult success() { return {true, ""}; }
        static AttemptResult failure(const std::string& why) { return {false, why}; }
    };
    
    class Strategy {
    public:
        virtual ~Strategy() = default;
        virtual std::string name() const = 0;
        virtual AttemptResult attempt(const TransferJob& job, ProgressState& progress) = 0;
    };
    
    // libcurl multi transfer, polled for progress, resumes a partial file.
    class CurlManagedStrategy : public Strategy {
    public:
        std::string name() const override { return "managed"; }
        AttemptResult attempt(const TransferJob& job, ProgressState& progress) override;
    };
    
    // Hands the transfer to wget (or the curl binary) streaming into the partial file.
    class ExternalToolStrategy : public Strategy {
    private:
        CommandRunner& runner;
    
    public:
        explicit ExternalToolStrategy(CommandRunner& commandRunner) : runner(commandRunner) {}
        std::string name() const override { return "external"; }
        AttemptResult attempt(const TransferJob& job, ProgressState& progress) override;
    };
    
    // Single blocking libcurl request from offset zero, no progress reporting.
    class CurlSimpleStrategy : public Strategy {
    public:
        std::string name() const override { return "simple"; }
        AttemptResult attempt(const TransferJob& job, ProgressState& progress) override;
    };
    
    class Engine {
    private:
        std::vector<std::unique_ptr<Strategy>> ladder;
    
    public:
        explicit Engine(std::vector<std::unique_ptr<Strategy>> strategies);
        
        static Engine withDefaultLadder(CommandRunner& runner);
        
        // Returns the destination path. Throws TransferError (Exhausted or TooSmall).
        std::string fetch(const TransferJob& job);
    };
    
    uint64_t fileSize(const std::string& path);
}

#endif // TRANSFER_HPP
