#include "lib/command_runner.hpp"
#include "lib/errors.hpp"
#include "lib/first_boot.hpp"
#include "lib/zfs_pool.hpp"
#include "misc/defaults.hpp"
#include "misc/version.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include "utils/strings.hpp"
#include <iostream>
#include <string>
#include <getopt.h>

struct Options {
    FirstBoot::Config config;
    std::string logPath = Defaults::FIRSTBOOT_LOG;
    std::string zfsDisks;
    std::string zfsType = "single";
};

void printUsage() {
    std::cout << Colors::bold("Usage:") << " pvestrap-firstboot [OPTIONS]\n\n";
    std::cout << Colors::cyan("Options:") << "\n";
    std::cout << "  -a, --auto            Unattended run (waits for network, leaves the session detached)\n";
    std::cout << "  --log <path>          Log file (default " << Defaults::FIRSTBOOT_LOG << ")\n";
    std::cout << "  --zfs-disks <a,b>     Also create the " << Defaults::POOL_NAME << " pool on these disks\n";
    std::cout << "  --zfs-type <type>     single, mirror, raidz1 or raidz2 (default single)\n";
    std::cout << "  -D, --debug           Verbose output\n";
    std::cout << "  -v, --version         Show version information\n";
    std::cout << "  -h, --help            Show this help message\n\n";
    
    std::cout << Colors::yellow("Note: ") << "Normally started once by " << Defaults::FIRSTBOOT_UNIT << "\n";
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;
    
    static struct option long_options[] = {
        {"auto", no_argument, 0, 'a'},
        {"log", required_argument, 0, 'l'},
        {"zfs-disks", required_argument, 0, 'z'},
        {"zfs-type", required_argument, 0, 't'},
        {"debug", no_argument, 0, 'D'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };
    
    int option_index = 0;
    
    while ((opt = getopt_long(argc, argv, "aDvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'a':
                opts.config.autoMode = true;
                break;
            case 'l':
                opts.logPath = optarg;
                break;
            case 'z':
                opts.zfsDisks = optarg;
                break;
            case 't':
                opts.zfsType = optarg;
                break;
            case 'D':
                Logs::setDebug(true);
                break;
            case 'v':
                Version::printVersion("pvestrap-firstboot");
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                printUsage();
                return false;
        }
    }
    
    if (!opts.zfsDisks.empty()) {
        opts.config.deferredPool = true;
        opts.config.pool.disks = Strings::splitList(opts.zfsDisks);
        opts.config.pool.topology = StoragePool::parseTopology(opts.zfsType);
    }
    
    return true;
}

int main(int argc, char* argv[]) {
    Options opts;
    
    try {
        Logs::setTag("SETUP");
        
        if (!parseArguments(argc, argv, opts)) {
            return 1;
        }
        
        if (!Logs::openLogFile(opts.logPath)) {
            Logs::warning("Cannot open " + opts.logPath + ", logging to the console only");
        }
        
        Version::printBanner("Proxmox VE first boot setup");
        ErrorHandler::checkPrivileges();
        
        Logs::info(std::string("Mode: ") + (opts.config.autoMode ? "automatic" : "interactive"));
        
        SystemCommandRunner runner;
        FirstBoot::StateMachine machine(runner, opts.config);
        FirstBoot::ProvisioningRun run = machine.run();
        
        if (run.hasHardFailure()) {
            Logs::error("First boot setup finished with failures; see " + opts.logPath);
        } else {
            Logs::success("First boot setup finished");
        }
        
        Logs::closeLogFile();
        return run.exitCode();
    
    } catch (const PermissionError& e) {
        Logs::closeLogFile();
        return 1;
    } catch (const PvestrapException& e) {
        Logs::fatal(e.what());
        Logs::closeLogFile();
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        Logs::closeLogFile();
        return 1;
    }
}
