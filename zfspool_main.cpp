#include "lib/errors.hpp"
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
    StoragePool::PoolSpec spec;
    bool forceOperation = false;
};

void printUsage() {
    std::cout << Colors::bold("Usage:") << " pvestrap-zfs --disks <a,b> [OPTIONS]\n\n";
    std::cout << Colors::cyan("Options:") << "\n";
    std::cout << "  --disks <a,b>       Disks for the pool (e.g. sdb,sdc or /dev/sdb,/dev/sdc)\n";
    std::cout << "  --type <type>       single, mirror, raidz1 or raidz2 (default single)\n";
    std::cout << "  --pool <name>       Pool name (default " << Defaults::POOL_NAME << ")\n";
    std::cout << "  --strict-single     Reject extra disks for single instead of using the first\n";
    std::cout << "  --force             Skip the confirmation prompt\n";
    std::cout << "  -D, --debug         Verbose output\n";
    std::cout << "  -v, --version       Show version information\n";
    std::cout << "  -h, --help          Show this help message\n\n";
    
    std::cout << Colors::bold("Minimum disks:") << " single 1, mirror 2, raidz1 3, raidz2 4\n\n";
    
    std::cout << Colors::bold("Examples:") << "\n";
    std::cout << "  pvestrap-zfs --disks sdb,sdc --type mirror\n";
    std::cout << "  pvestrap-zfs --disks sdb,sdc,sdd,sde --type raidz2 --pool tank\n\n";
    
    std::cout << Colors::yellow("Note: ") << "This tool requires root privileges (use sudo)\n";
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;
    
    static struct option long_options[] = {
        {"disks", required_argument, 0, 'd'},
        {"type", required_argument, 0, 't'},
        {"pool", required_argument, 0, 'p'},
        {"strict-single", no_argument, 0, 's'},
        {"force", no_argument, 0, 'F'},
        {"debug", no_argument, 0, 'D'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };
    
    int option_index = 0;
    
    while ((opt = getopt_long(argc, argv, "Dvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'd':
                opts.spec.disks = Strings::splitList(optarg);
                break;
            case 't':
                opts.spec.topology = StoragePool::parseTopology(optarg);
                break;
            case 'p':
                opts.spec.name = optarg;
                opts.spec.mountRoot = "/" + opts.spec.name;
                break;
            case 's':
                opts.spec.extraDisks = StoragePool::ExtraDiskPolicy::Reject;
                break;
            case 'F':
                opts.forceOperation = true;
                break;
            case 'D':
                Logs::setDebug(true);
                break;
            case 'v':
                Version::printVersion("pvestrap-zfs");
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                printUsage();
                return false;
        }
    }
    
    if (opts.spec.disks.empty()) {
        Logs::error("--disks is required");
        printUsage();
        return false;
    }
    
    return true;
}

int main(int argc, char* argv[]) {
    Options opts;
    
    try {
        Logs::setTag("ZFS");
        Version::printBanner("ZFS storage pool setup");
        
        if (!parseArguments(argc, argv, opts)) {
            return 1;
        }
        
        ErrorHandler::checkPrivileges();
        
        SystemCommandRunner runner;
        StoragePool::SystemDiskProbe probe;
        StoragePool::Provisioner provisioner(runner, probe, std::cin, std::cout);
        
        if (!provisioner.setupPool(opts.spec, opts.forceOperation)) {
            return 0;
        }
        
        Logs::success("Storage pool " + opts.spec.name + " is ready");
        return 0;
    
    } catch (const PermissionError& e) {
        return 1;
    } catch (const CommandError& e) {
        Logs::fatal(e.what());
        if (!e.output().empty()) {
            std::cerr << e.output() << std::endl;
        }
        return 1;
    } catch (const PvestrapException& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
