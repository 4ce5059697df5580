#ifndef DEV_HANDLER_HPP
#define DEV_HANDLER_HPP

#include "lib/command_runner.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace DeviceHandler {
    
    struct PartitionInfo {
        int number = 0;
        std::string path;
        uint64_t sizeBytes = 0;
    };
    
    bool validateDevice(const std::string& device);
    std::string deviceName(const std::string& device);
    std::string devicePath(const std::string& nameOrPath);
    // "/dev/sdb" + 2 -> "/dev/sdb2", "/dev/nvme0n1" + 2 -> "/dev/nvme0n1p2"
    std::string partitionPath(const std::string& device, int number);
    
    std::vector<std::string> mountPoints(const std::string& device,
                                         const std::string& mountTable = "/proc/mounts");
    bool isDeviceMounted(const std::string& device,
                         const std::string& mountTable = "/proc/mounts");
    bool unmountDevice(CommandRunner& runner, const std::string& device,
                       const std::string& mountTable = "/proc/mounts");
    
    uint64_t getDeviceSize(const std::string& device, const std::string& sysfsRoot = "/sys");
    std::vector<PartitionInfo> listPartitions(const std::string& device,
                                              const std::string& sysfsRoot = "/sys");
    
    bool rereadPartitionTable(CommandRunner& runner, const std::string& device);
    bool syncDevice(CommandRunner& runner, const std::string& device);
}

#endif // DEV_HANDLER_HPP
