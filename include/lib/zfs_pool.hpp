#ifndef ZFS_POOL_HPP
#define ZFS_POOL_HPP

#include "lib/command_runner.hpp"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace StoragePool {
    
    enum class Topology {
        Single,
        Mirror,
        RaidZ1,
        RaidZ2
    };
    
    // What to do when Single is given more than one disk.
    enum class ExtraDiskPolicy {
        UseFirst,
        Reject
    };
    
    // Throws ValidationError for an unknown keyword.
    Topology parseTopology(const std::string& keyword);
    std::string topologyKeyword(Topology topology);
    // Installer answer-file spelling: raid0, raid1, raidz-1, raidz-2
    std::string installerRaidLevel(Topology topology);
    Topology fromInstallerRaidLevel(const std::string& level);
    size_t minimumDisks(Topology topology);
    
    struct PoolSpec {
        std::string name;
        std::string mountRoot;
        Topology topology = Topology::Single;
        std::vector<std::string> disks;
        ExtraDiskPolicy extraDisks = ExtraDiskPolicy::UseFirst;
        
        PoolSpec();
    };
    
    struct Dataset {
        std::string name;
        std::string mountpoint;
        std::string storageId;
        std::string storageType;
        std::string content;
    };
    
    std::vector<Dataset> datasetsFor(const PoolSpec& spec);
    
    class DiskProbe {
    public:
        virtual ~DiskProbe() = default;
        virtual bool isBlockDevice(const std::string& path) = 0;
        virtual bool isMounted(const std::string& path) = 0;
    };
    
    class SystemDiskProbe : public DiskProbe {
    private:
        std::string mountTable;
    
    public:
        explicit SystemDiskProbe(const std::string& mounts = "/proc/mounts") : mountTable(mounts) {}
        bool isBlockDevice(const std::string& path) override;
        bool isMounted(const std::string& path) override;
    };
    
    // Checks existence, then mount state, then disk count. Returns the disk
    // paths the pool will be built from. Throws ValidationError.
    std::vector<std::string> validate(const PoolSpec& spec, DiskProbe& probe);
    
    std::vector<std::string> wipeCommands(const std::string& disk);
    std::string createCommand(const PoolSpec& spec, const std::vector<std::string>& disks);
    std::string datasetCommand(const PoolSpec& spec, const Dataset& dataset);
    std::vector<std::string> registrationCommands(const PoolSpec& spec);
    
    class Provisioner {
    private:
        CommandRunner& runner;
        DiskProbe& probe;
        std::istream& in;
        std::ostream& out;
    
    public:
        Provisioner(CommandRunner& commandRunner, DiskProbe& diskProbe,
                    std::istream& input, std::ostream& output);
        
        // Returns false when the operator declines the confirmation gate.
        // Throws ValidationError before anything is touched, CommandError afterwards.
        bool setupPool(const PoolSpec& spec, bool skipConfirmation = false);
    
    private:
        void wipe(const std::vector<std::string>& disks);
        void createDatasets(const PoolSpec& spec);
        void registerStorage(const PoolSpec& spec);
        void printStatus(const PoolSpec& spec);
    };
}

#endif // ZFS_POOL_HPP
