#include "lib/zfs_pool.hpp"
#include "lib/confirm.hpp"
#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "misc/defaults.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cctype>
#include <ostream>

namespace StoragePool {
    
    Topology parseTopology(const std::string& keyword) {
        std::string lower = keyword;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        
        if (lower == "single") return Topology::Single;
        if (lower == "mirror") return Topology::Mirror;
        if (lower == "raidz1") return Topology::RaidZ1;
        if (lower == "raidz2") return Topology::RaidZ2;
        
        throw ValidationError("Unknown pool type '" + keyword + "' (expected single, mirror, raidz1 or raidz2)");
    }
    
    std::string topologyKeyword(Topology topology) {
        switch (topology) {
            case Topology::Single: return "single";
            case Topology::Mirror: return "mirror";
            case Topology::RaidZ1: return "raidz1";
            case Topology::RaidZ2: return "raidz2";
        }
        return "single";
    }
    
    std::string installerRaidLevel(Topology topology) {
        switch (topology) {
            case Topology::Single: return "raid0";
            case Topology::Mirror: return "raid1";
            case Topology::RaidZ1: return "raidz-1";
            case Topology::RaidZ2: return "raidz-2";
        }
        return "raid0";
    }
    
    Topology fromInstallerRaidLevel(const std::string& level) {
        if (level == "raid0") return Topology::Single;
        if (level == "raid1") return Topology::Mirror;
        if (level == "raidz-1") return Topology::RaidZ1;
        if (level == "raidz-2") return Topology::RaidZ2;
        
        throw ValidationError("Unsupported installer raid level '" + level + "'");
    }
    
    size_t minimumDisks(Topology topology) {
        switch (topology) {
            case Topology::Single: return 1;
            case Topology::Mirror: return 2;
            case Topology::RaidZ1: return 3;
            case Topology::RaidZ2: return 4;
        }
        return 1;
    }
    
    PoolSpec::PoolSpec() : name(Defaults::POOL_NAME), mountRoot(Defaults::POOL_MOUNT_ROOT) {}
    
    std::vector<Dataset> datasetsFor(const PoolSpec& spec) {
        const std::string& root = spec.mountRoot;
        return {
            {"data", root + "/data", "local-zfs", "zfspool", "images,rootdir"},
            {"template", root + "/template", "local-template", "dir", "vztmpl"},
            {"iso", root + "/iso", "local-iso", "dir", "iso"},
            {"backup", root + "/backup", "local-backup", "dir", "backup"}
        };
    }
    
    bool SystemDiskProbe::isBlockDevice(const std::string& path) {
        return DeviceHandler::validateDevice(path);
    }
    
    bool SystemDiskProbe::isMounted(const std::string& path) {
        return DeviceHandler::isDeviceMounted(path, mountTable);
    }
    
    std::vector<std::string> validate(const PoolSpec& spec, DiskProbe& probe) {
        if (spec.disks.empty()) {
            throw ValidationError("No disks given");
        }
        
        std::vector<std::string> paths;
        for (const auto& disk : spec.disks) {
            paths.push_back(DeviceHandler::devicePath(disk));
        }
        
        for (const auto& path : paths) {
            if (!probe.isBlockDevice(path)) {
                throw ValidationError("Disk not found or not a block device: " + path);
            }
        }
        
        for (const auto& path : paths) {
            if (probe.isMounted(path)) {
                throw ValidationError("Disk is mounted: " + path + " (unmount it first)");
            }
        }
        
        size_t required = minimumDisks(spec.topology);
        if (paths.size() < required) {
            throw ValidationError(topologyKeyword(spec.topology) + " requires at least " +
                                  std::to_string(required) + " disks, got " +
                                  std::to_string(paths.size()));
        }
        
        if (spec.topology == Topology::Single && paths.size() > 1) {
            if (spec.extraDisks == ExtraDiskPolicy::Reject) {
                throw ValidationError("single takes exactly 1 disk, got " + std::to_string(paths.size()));
            }
            Logs::warning("single uses one disk; ignoring all but " + paths.front());
            paths.resize(1);
        }
        
        return paths;
    }
    
    std::vector<std::string> wipeCommands(const std::string& disk) {
        std::string quoted = CommandRunner::quote(disk);
        return {
            "wipefs -a " + quoted,
            "sgdisk --zap-all " + quoted,
            "zpool labelclear -f " + quoted
        };
    }
    
    std::string createCommand(const PoolSpec& spec, const std::vector<std::string>& disks) {
        std::string command = "zpool create -f"
                              " -o ashift=12"
                              " -O acltype=posixacl"
                              " -O compression=lz4"
                              " -O dnodesize=auto"
                              " -O normalization=formD"
                              " -O relatime=on"
                              " -O xattr=sa"
                              " -O mountpoint=" + CommandRunner::quote(spec.mountRoot) +
                              " " + CommandRunner::quote(spec.name);
        
        if (spec.topology != Topology::Single) {
            command += " " + topologyKeyword(spec.topology);
        }
        
        for (const auto& disk : disks) {
            command += " " + CommandRunner::quote(disk);
        }
        
        return command;
    }
    
    std::string datasetCommand(const PoolSpec& spec, const Dataset& dataset) {
        return "zfs create -o mountpoint=" + CommandRunner::quote(dataset.mountpoint) + " " +
               CommandRunner::quote(spec.name + "/" + dataset.name);
    }
    
    std::vector<std::string> registrationCommands(const PoolSpec& spec) {
        std::vector<std::string> commands;
        
        for (const auto& dataset : datasetsFor(spec)) {
            if (dataset.storageType == "zfspool") {
                commands.push_back("pvesm add zfspool " + dataset.storageId +
                                   " -pool " + spec.name + "/" + dataset.name +
                                   " -content " + dataset.content);
            } else {
                commands.push_back("pvesm add dir " + dataset.storageId +
                                   " -path " + dataset.mountpoint +
                                   " -content " + dataset.content);
            }
        }
        
        return commands;
    }
    
    Provisioner::Provisioner(CommandRunner& commandRunner, DiskProbe& diskProbe,
                             std::istream& input, std::ostream& output)
        : runner(commandRunner), probe(diskProbe), in(input), out(output) {}
    
    bool Provisioner::setupPool(const PoolSpec& spec, bool skipConfirmation) {
        Logs::step("Validating disks");
        std::vector<std::string> disks = validate(spec, probe);
        
        for (const auto& disk : disks) {
            Logs::info("  " + disk);
        }
        Logs::success("Topology " + topologyKeyword(spec.topology) + " with " +
                      std::to_string(disks.size()) + " disk(s)");
        
        if (!skipConfirmation) {
            out << Colors::red("All data on the disks above will be destroyed.") << std::endl;
            if (!Confirm::requireToken(in, out, "Create pool " + spec.name + "?", Defaults::CONFIRM_TOKEN)) {
                Logs::info("Cancelled");
                return false;
            }
        }
        
        Logs::step("Wiping disks");
        wipe(disks);
        
        Logs::step("Creating pool " + spec.name);
        runner.runChecked(createCommand(spec, disks));
        Logs::success("Pool " + spec.name + " created");
        
        Logs::step("Creating datasets");
        createDatasets(spec);
        
        Logs::step("Registering storage");
        registerStorage(spec);
        
        printStatus(spec);
        return true;
    }
    
    void Provisioner::wipe(const std::vector<std::string>& disks) {
        for (const auto& disk : disks) {
            Logs::info("Wiping " + disk);
            std::vector<std::string> commands = wipeCommands(disk);
            
            runner.runChecked(commands[0]);
            
            CommandResult zap = runner.run(commands[1]);
            if (!zap.ok()) {
                Logs::warning("sgdisk could not clear " + disk + ": " + zap.output);
            }
            
            // Fails on disks that never held a pool.
            CommandResult label = runner.run(commands[2]);
            if (!label.ok()) {
                Logs::debug("No pool label on " + disk);
            }
        }
        
        runner.run("udevadm settle");
    }
    
    void Provisioner::createDatasets(const PoolSpec& spec) {
        for (const auto& dataset : datasetsFor(spec)) {
            runner.runChecked(datasetCommand(spec, dataset));
            Logs::success(spec.name + "/" + dataset.name + " -> " + dataset.mountpoint);
        }
    }
    
    void Provisioner::registerStorage(const PoolSpec& spec) {
        std::vector<std::string> commands = registrationCommands(spec);
        
        if (!runner.exists("pvesm")) {
            Logs::warning("pvesm not found; register the storage manually with:");
            for (const auto& command : commands) {
                Logs::plain(out, "  " + command);
            }
            return;
        }
        
        for (const auto& command : commands) {
            CommandResult result = runner.run(command);
            if (result.ok()) {
                Logs::success(command);
            } else {
                Logs::warning("Storage registration failed (" + command + "): " + result.output);
            }
        }
    }
    
    void Provisioner::printStatus(const PoolSpec& spec) {
        CommandResult status = runner.run("zpool status " + CommandRunner::quote(spec.name));
        CommandResult list = runner.run("zfs list -r " + CommandRunner::quote(spec.name));
        Logs::plain(out, status.output);
        Logs::plain(out, list.output);
    }
}
