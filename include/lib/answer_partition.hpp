#ifndef ANSWER_PARTITION_HPP
#define ANSWER_PARTITION_HPP

#include "lib/answer_config.hpp"
#include "lib/command_runner.hpp"
#include "lib/dev_handler.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace AnswerPartition {
    
    enum class Placement {
        Partition,
        SideChannel
    };
    
    struct PartitionResult {
        Placement placement = Placement::SideChannel;
        // Partition node or side-channel file.
        std::string path;
        // True when the answer did not reach the media.
        bool degraded = false;
        std::string reason;
    };
    
    struct Settings {
        std::string sideChannelPath;
        std::string sysfsRoot = "/sys";
        std::string label;
        uint64_t minimumFreeBytes;
        uint64_t partitionBytes;
        
        Settings();
    };
    
    // capacity minus the sum of partition sizes, never below zero
    uint64_t freeSpace(uint64_t capacity, const std::vector<DeviceHandler::PartitionInfo>& partitions);
    Placement choosePlacement(uint64_t freeBytes, uint64_t threshold);
    
    // "label: gpt" line of `sfdisk --dump`; empty when absent.
    std::string parseTableLabel(const std::string& dump);
    // sfdisk type for a FAT answer volume on a "gpt" or "dos" table; empty otherwise.
    std::string partitionTypeFor(const std::string& label);
    
    // Throws FileError; nothing is left to fall back on.
    void writeSideChannel(const std::string& path, const std::string& contents);
    
    class Provisioner {
    private:
        CommandRunner& runner;
        Settings settings;
    
    public:
        Provisioner(CommandRunner& commandRunner, const Settings& partitionSettings);
        
        // Never throws for partition or format problems; those degrade to the
        // side-channel file.
        PartitionResult createAnswerPartition(const std::string& device, const Answer::AnswerConfig& config);
    
    private:
        DeviceHandler::PartitionInfo appendPartition(const std::string& device);
        void discardPartition(const std::string& device, const DeviceHandler::PartitionInfo& partition);
        void writeToPartition(const std::string& partition, const std::string& contents);
        PartitionResult fallback(const std::string& contents, const std::string& reason);
    };
}

#endif // ANSWER_PARTITION_HPP
