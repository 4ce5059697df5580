#ifndef FIRST_BOOT_HPP
#define FIRST_BOOT_HPP

#include "lib/command_runner.hpp"
#include "lib/zfs_pool.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace FirstBoot {
    
    enum class Outcome {
        Success,
        Skipped,
        // Logged, the run carries on.
        SoftFailure,
        // Reported and fails the run, but later steps still execute.
        HardFailure
    };
    
    struct StepRecord {
        std::string name;
        Outcome outcome = Outcome::Success;
        std::string detail;
    };
    
    struct ProvisioningRun {
        std::vector<StepRecord> steps;
        
        size_t count(Outcome outcome) const;
        bool hasHardFailure() const;
        int exitCode() const;
    };
    
    struct Config {
        bool autoMode = false;
        std::string aptSourcesDir = "/etc/apt/sources.list.d";
        std::string shellProfile = "/root/.bashrc";
        std::string mountTable = "/proc/mounts";
        std::string sessionName = "claude";
        
        std::chrono::seconds networkTimeout = std::chrono::seconds(120);
        std::chrono::seconds networkInterval = std::chrono::seconds(5);
        std::chrono::seconds attachDelay = std::chrono::seconds(3);
        
        std::vector<std::string> packages = {"curl", "wget", "git", "tmux", "htop", "vim"};
        int minimumRuntimeMajor = 18;
        std::string runtimeSetupUrl = "https://deb.nodesource.com/setup_20.x";
        std::string cliPackage = "@anthropic-ai/claude-code";
        std::string cliBinary = "claude";
        
        bool deferredPool = false;
        StoragePool::PoolSpec pool;
    };
    
    extern const std::string SHELL_SENTINEL;
    extern const std::string COMMUNITY_REPO_LINE;
    
    // "v20.11.1" -> 20, "18" -> 18, anything without a leading number -> -1
    int parseMajorVersion(const std::string& version);
    // Gateway from `ip route`, source address from `ip route get 1`.
    std::string parseGateway(const std::string& routeTable);
    std::string parseSourceAddress(const std::string& routeGet);
    
    std::string shellBlock();
    // Appends the guarded block once. Returns false when it was already there.
    // Throws FileError.
    bool configureShellFile(const std::string& profilePath);
    
    struct RepoChanges {
        int disabledEntries = 0;
        bool communityAdded = false;
    };
    
    // Comments out enterprise entries and adds the community entry when no
    // list mentions it. Throws FileError.
    RepoChanges configureRepoDirectory(const std::string& sourcesDir);
    
    class StateMachine {
    public:
        using Sleeper = std::function<void(std::chrono::seconds)>;
    
    private:
        CommandRunner& runner;
        Config config;
        Sleeper sleeper;
    
    public:
        StateMachine(CommandRunner& commandRunner, const Config& runConfig, Sleeper sleep = Sleeper());
        
        // Runs every step in order; never stops early.
        ProvisioningRun run();
        
        StepRecord waitForNetwork();
        StepRecord testConnectivity();
        StepRecord configureRepositories();
        StepRecord installDependencies();
        StepRecord installRuntime();
        StepRecord installCli();
        StepRecord configureShell();
        StepRecord setupStorage();
        StepRecord startSession();
        StepRecord reportCompletion();
        
        static std::string outcomeName(Outcome outcome);
    
    private:
        bool ping(const std::string& host);
        void printSummary(const ProvisioningRun& run) const;
    };
}

#endif // FIRST_BOOT_HPP
