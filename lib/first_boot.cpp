#include "lib/first_boot.hpp"
#include "lib/errors.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace FirstBoot {
    
    const std::string SHELL_SENTINEL = "# PVE Installer additions";
    const std::string COMMUNITY_REPO_LINE = "deb http://download.proxmox.com/debian/pve bookworm pve-no-subscription";
    
    namespace {
        const std::vector<std::string> ENTERPRISE_LISTS = {"pve-enterprise.list", "ceph.list"};
        const std::string COMMUNITY_LIST = "pve-no-subscription.list";
        
        StepRecord make(const std::string& name, Outcome outcome, const std::string& detail = "") {
            StepRecord step;
            step.name = name;
            step.outcome = outcome;
            step.detail = detail;
            return step;
        }
        
        std::string readFile(const std::string& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw FileError(path, "Cannot open for reading");
            }
            std::ostringstream contents;
            contents << file.rdbuf();
            return contents.str();
        }
        
        std::string fieldAfter(const std::string& text, const std::string& keyword) {
            std::istringstream words(text);
            std::string word;
            while (words >> word) {
                if (word == keyword && (words >> word)) {
                    return word;
                }
            }
            return "";
        }
    }
    
    size_t ProvisioningRun::count(Outcome outcome) const {
        size_t n = 0;
        for (const auto& step : steps) {
            if (step.outcome == outcome) ++n;
        }
        return n;
    }
    
    bool ProvisioningRun::hasHardFailure() const {
        return count(Outcome::HardFailure) > 0;
    }
    
    int ProvisioningRun::exitCode() const {
        return hasHardFailure() ? 1 : 0;
    }
    
    int parseMajorVersion(const std::string& version) {
        size_t pos = 0;
        while (pos < version.size() && std::isspace(static_cast<unsigned char>(version[pos]))) ++pos;
        if (pos < version.size() && (version[pos] == 'v' || version[pos] == 'V')) ++pos;
        
        size_t start = pos;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) ++pos;
        
        if (pos == start || pos - start > 6) {
            return -1;
        }
        return std::stoi(version.substr(start, pos - start));
    }
    
    std::string parseGateway(const std::string& routeTable) {
        std::istringstream lines(routeTable);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.compare(0, 7, "default") == 0) {
                return fieldAfter(line, "via");
            }
        }
        return "";
    }
    
    std::string parseSourceAddress(const std::string& routeGet) {
        return fieldAfter(routeGet, "src");
    }
    
    std::string shellBlock() {
        return "\n" + SHELL_SENTINEL + "\n"
               "alias c='claude'\n"
               "alias tm='tmux attach -t claude || tmux new -s claude'\n"
               "alias vmlist='qm list'\n"
               "alias ctlist='pct list'\n"
               "alias logs='journalctl -f'\n"
               "\n"
               "# Show Claude session hint on login\n"
               "if [ -n \"$PS1\" ]; then\n"
               "    if tmux has-session -t claude 2>/dev/null; then\n"
               "        echo \"\"\n"
               "        echo \"  Claude Code is running. Attach with: tm\"\n"
               "        echo \"\"\n"
               "    fi\n"
               "fi\n";
    }
    
    bool configureShellFile(const std::string& profilePath) {
        if (fs::exists(profilePath) && readFile(profilePath).find(SHELL_SENTINEL) != std::string::npos) {
            return false;
        }
        
        std::ofstream profile(profilePath, std::ios::app);
        if (!profile.is_open()) {
            throw FileError(profilePath, "Cannot open for appending");
        }
        
        profile << shellBlock();
        profile.close();
        
        if (profile.fail()) {
            throw FileError(profilePath, "Write failed");
        }
        return true;
    }
    
    RepoChanges configureRepoDirectory(const std::string& sourcesDir) {
        RepoChanges changes;
        
        for (const auto& name : ENTERPRISE_LISTS) {
            std::string path = sourcesDir + "/" + name;
            if (!fs::exists(path)) {
                continue;
            }
            
            std::istringstream lines(readFile(path));
            std::string rewritten;
            std::string line;
            int disabled = 0;
            
            while (std::getline(lines, line)) {
                if (line.compare(0, 3, "deb") == 0) {
                    line = "#" + line;
                    ++disabled;
                }
                rewritten += line + "\n";
            }
            
            if (disabled == 0) {
                continue;
            }
            
            std::ofstream out(path, std::ios::trunc);
            out << rewritten;
            out.close();
            if (out.fail()) {
                throw FileError(path, "Write failed");
            }
            
            changes.disabledEntries += disabled;
        }
        
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(sourcesDir, ec)) {
            if (entry.path().extension() == ".list" &&
                readFile(entry.path().string()).find("pve-no-subscription") != std::string::npos) {
                return changes;
            }
        }
        if (ec) {
            throw FileError(sourcesDir, ec.message());
        }
        
        std::string path = sourcesDir + "/" + COMMUNITY_LIST;
        std::ofstream out(path, std::ios::trunc);
        out << COMMUNITY_REPO_LINE << "\n";
        out.close();
        if (out.fail()) {
            throw FileError(path, "Write failed");
        }
        
        changes.communityAdded = true;
        return changes;
    }
    
    StateMachine::StateMachine(CommandRunner& commandRunner, const Config& runConfig, Sleeper sleep)
        : runner(commandRunner), config(runConfig), sleeper(std::move(sleep)) {
        if (!sleeper) {
            sleeper = [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
        }
    }
    
    ProvisioningRun StateMachine::run() {
        ProvisioningRun result;
        
        result.steps.push_back(waitForNetwork());
        result.steps.push_back(testConnectivity());
        result.steps.push_back(configureRepositories());
        result.steps.push_back(installDependencies());
        result.steps.push_back(installRuntime());
        result.steps.push_back(installCli());
        result.steps.push_back(configureShell());
        result.steps.push_back(setupStorage());
        result.steps.push_back(startSession());
        
        printSummary(result);
        result.steps.push_back(reportCompletion());
        
        return result;
    }
    
    StepRecord StateMachine::waitForNetwork() {
        const std::string name = "network wait";
        if (!config.autoMode) {
            return make(name, Outcome::Skipped, "interactive mode");
        }
        
        Logs::step("Waiting for network");
        
        std::chrono::seconds waited(0);
        while (true) {
            if (ping("8.8.8.8")) {
                Logs::success("Network is up after " + std::to_string(waited.count()) + "s");
                return make(name, Outcome::Success);
            }
            if (waited >= config.networkTimeout) {
                break;
            }
            sleeper(config.networkInterval);
            waited += config.networkInterval;
        }
        
        Logs::warning("No network after " + std::to_string(config.networkTimeout.count()) + "s, continuing anyway");
        return make(name, Outcome::SoftFailure, "timed out");
    }
    
    StepRecord StateMachine::testConnectivity() {
        const std::string name = "connectivity";
        Logs::step("Testing Network Connectivity");
        
        std::string gateway = parseGateway(runner.run("ip route").output);
        std::string address = parseSourceAddress(runner.run("ip route get 1").output);
        
        Logs::info("IP Address: " + (address.empty() ? std::string("unknown") : address));
        Logs::info("Gateway: " + (gateway.empty() ? std::string("unknown") : gateway));
        
        struct Check {
            std::string label;
            bool passed;
        };
        
        std::vector<Check> checks = {
            {"Gateway ping", !gateway.empty() && ping(gateway)},
            {"Internet (8.8.8.8)", ping("8.8.8.8")},
            {"DNS resolution", ping("google.com")},
            {"HTTPS access", runner.run("curl -s --connect-timeout 3 https://www.proxmox.com -o /dev/null").ok()}
        };
        
        int passed = 0;
        for (const auto& check : checks) {
            if (check.passed) {
                Logs::success(check.label + ": ok");
                ++passed;
            } else {
                Logs::warning(check.label + ": failed");
            }
        }
        
        std::string detail = std::to_string(passed) + "/" + std::to_string(checks.size()) + " checks passed";
        if (passed < 2) {
            Logs::warning("Connectivity looks broken (" + detail + "); later steps may fail");
            return make(name, Outcome::SoftFailure, detail);
        }
        return make(name, Outcome::Success, detail);
    }
    
    StepRecord StateMachine::configureRepositories() {
        const std::string name = "repositories";
        Logs::step("Configuring Repositories");
        
        try {
            RepoChanges changes = configureRepoDirectory(config.aptSourcesDir);
            if (changes.disabledEntries > 0) {
                Logs::info("Disabled " + std::to_string(changes.disabledEntries) + " enterprise entries");
            }
            if (changes.communityAdded) {
                Logs::info("Added no-subscription repository");
            }
        } catch (const FileError& e) {
            Logs::warning(e.what());
            return make(name, Outcome::SoftFailure, e.what());
        }
        
        Logs::info("Updating package lists...");
        CommandResult update = runner.run("apt-get update -qq");
        if (!update.ok()) {
            Logs::warning("apt-get update failed: " + update.output);
            return make(name, Outcome::SoftFailure, "apt-get update failed");
        }
        
        Logs::success("Repositories configured");
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::installDependencies() {
        const std::string name = "dependencies";
        Logs::step("Installing Dependencies");
        
        CommandResult result = runner.run("apt-get install -y -qq " + CommandRunner::join(config.packages));
        if (!result.ok()) {
            Logs::warning("Package installation failed: " + result.output);
            return make(name, Outcome::SoftFailure, "apt-get install failed");
        }
        
        Logs::success("Dependencies installed");
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::installRuntime() {
        const std::string name = "runtime";
        Logs::step("Installing Node.js");
        
        if (runner.exists("node")) {
            std::string version = runner.run("node --version").output;
            int major = parseMajorVersion(version);
            if (major >= config.minimumRuntimeMajor) {
                Logs::success("Node.js already installed: v" + std::to_string(major));
                return make(name, Outcome::Success, "already present");
            }
            Logs::warning("Node.js version too old, upgrading...");
        }
        
        CommandResult setup = runner.run("curl -fsSL " + config.runtimeSetupUrl + " | bash -");
        CommandResult install = setup.ok() ? runner.run("apt-get install -y -qq nodejs") : setup;
        
        if (!install.ok()) {
            Logs::error("Node.js installation failed: " + install.output);
            return make(name, Outcome::HardFailure, "install failed");
        }
        
        Logs::success("Node.js installed: " + runner.run("node --version").output);
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::installCli() {
        const std::string name = "cli";
        Logs::step("Installing Claude Code");
        
        if (runner.exists(config.cliBinary)) {
            Logs::success("Claude Code already installed");
            return make(name, Outcome::Success, "already present");
        }
        
        CommandResult result = runner.run("npm install -g " + config.cliPackage);
        if (!result.ok()) {
            Logs::debug(result.output);
        }
        
        if (!runner.exists(config.cliBinary)) {
            Logs::error("Claude Code installation failed");
            return make(name, Outcome::HardFailure, "binary not on PATH after install");
        }
        
        Logs::success("Claude Code installed successfully");
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::configureShell() {
        const std::string name = "shell";
        Logs::step("Configuring Shell");
        
        try {
            if (configureShellFile(config.shellProfile)) {
                Logs::success("Shell aliases added");
            } else {
                Logs::info("Shell already configured");
            }
        } catch (const FileError& e) {
            Logs::warning(e.what());
            return make(name, Outcome::SoftFailure, e.what());
        }
        
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::setupStorage() {
        const std::string name = "storage";
        if (!config.deferredPool) {
            return make(name, Outcome::Skipped);
        }
        
        Logs::step("Creating ZFS Pool");
        
        StoragePool::SystemDiskProbe probe(config.mountTable);
        StoragePool::Provisioner provisioner(runner, probe, std::cin, std::cout);
        
        try {
            if (!provisioner.setupPool(config.pool, config.autoMode)) {
                return make(name, Outcome::Skipped, "declined");
            }
        } catch (const PvestrapException& e) {
            Logs::error(e.what());
            return make(name, Outcome::HardFailure, e.what());
        }
        
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::startSession() {
        const std::string name = "session";
        Logs::step("Starting Claude Code Session");
        
        const std::string target = CommandRunner::quote(config.sessionName);
        
        // Fails when there is no previous session.
        runner.run("tmux kill-session -t " + target);
        
        CommandResult created = runner.run("tmux new-session -d -s " + target + " -n main");
        if (!created.ok()) {
            Logs::warning("Could not start tmux session: " + created.output);
            return make(name, Outcome::SoftFailure, "tmux new-session failed");
        }
        
        const std::vector<std::string> banner = {
            "clear",
            "echo ''",
            "echo '  Welcome to Claude Code on Proxmox VE'",
            "echo '  ====================================='",
            "echo ''",
            "echo '  Claude will help you configure your server.'",
            "echo '  If not authenticated, run: claude auth login'",
            "echo ''",
            config.cliBinary
        };
        
        for (const auto& line : banner) {
            CommandResult sent = runner.run("tmux send-keys -t " + target + " " + CommandRunner::quote(line) + " Enter");
            if (!sent.ok()) {
                Logs::debug("send-keys failed: " + sent.output);
            }
        }
        
        Logs::success("Session '" + config.sessionName + "' started");
        return make(name, Outcome::Success);
    }
    
    StepRecord StateMachine::reportCompletion() {
        const std::string name = "completion";
        std::string address = parseSourceAddress(runner.run("ip route get 1").output);
        if (address.empty()) {
            address = "<server-ip>";
        }
        
        Logs::plain(std::cout, "\n" + Colors::green("  First Boot Setup Complete!") + "\n\n" +
                    "  " + Colors::cyan("Proxmox Web UI:") + "  https://" + address + ":8006\n" +
                    "  " + Colors::cyan("SSH:") + "             ssh root@" + address + "\n" +
                    "  " + Colors::cyan("Claude Session:") + "  tmux attach -t " + config.sessionName + "\n" +
                    "  " + Colors::cyan("Quick attach:") + "    tm\n");
        
        if (config.autoMode) {
            Logs::info("Automatic mode: session left detached");
            return make(name, Outcome::Success, "detached");
        }
        
        Logs::info("Attaching to session in " + std::to_string(config.attachDelay.count()) +
                   " seconds (Ctrl+B then D to detach)");
        sleeper(config.attachDelay);
        int status = runner.runInteractive("tmux attach -t " + CommandRunner::quote(config.sessionName));
        if (status != 0) {
            Logs::warning("Could not attach to session (exit " + std::to_string(status) + ")");
            return make(name, Outcome::SoftFailure, "attach failed");
        }
        
        return make(name, Outcome::Success, "attached");
    }
    
    std::string StateMachine::outcomeName(Outcome outcome) {
        switch (outcome) {
            case Outcome::Success: return "ok";
            case Outcome::Skipped: return "skipped";
            case Outcome::SoftFailure: return "warning";
            case Outcome::HardFailure: return "failed";
        }
        return "unknown";
    }
    
    bool StateMachine::ping(const std::string& host) {
        return runner.run("ping -c 1 -W 2 " + CommandRunner::quote(host)).ok();
    }
    
    void StateMachine::printSummary(const ProvisioningRun& run) const {
        Logs::step("Summary");
        for (const auto& step : run.steps) {
            std::string line = step.name + ": " + outcomeName(step.outcome);
            if (!step.detail.empty()) {
                line += " (" + step.detail + ")";
            }
            
            switch (step.outcome) {
                case Outcome::HardFailure: Logs::error(line); break;
                case Outcome::SoftFailure: Logs::warning(line); break;
                default: Logs::info(line);
            }
        }
    }
}
