#include "lib/answer_partition.hpp"
#include "lib/errors.hpp"
#include "lib/fs_supports.hpp"
#include "misc/defaults.hpp"
#include "utils/logs.hpp"
#include "utils/progress_bar.hpp"
#include "utils/strings.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace AnswerPartition {
    
    namespace {
        // Microsoft basic data; what GPT tools expect for a FAT volume.
        const std::string GPT_BASIC_DATA = "EBD0A0A2-B9E5-4433-87C0-68B6B72699C7";
        const std::string DOS_FAT32_LBA = "c";
    }
    
    std::string parseTableLabel(const std::string& dump) {
        std::istringstream lines(dump);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.compare(0, 6, "label:") == 0) {
                return Strings::trim(line.substr(6));
            }
        }
        return "";
    }
    
    std::string partitionTypeFor(const std::string& label) {
        if (label == "gpt") {
            return GPT_BASIC_DATA;
        }
        if (label == "dos") {
            return DOS_FAT32_LBA;
        }
        return "";
    }
    
    Settings::Settings()
        : sideChannelPath(Defaults::ANSWER_SIDE_CHANNEL),
          label(Defaults::ANSWER_LABEL),
          minimumFreeBytes(Defaults::ANSWER_MIN_FREE_BYTES),
          partitionBytes(Defaults::ANSWER_PARTITION_BYTES) {}
    
    uint64_t freeSpace(uint64_t capacity, const std::vector<DeviceHandler::PartitionInfo>& partitions) {
        uint64_t used = 0;
        for (const auto& partition : partitions) {
            used += partition.sizeBytes;
        }
        return used >= capacity ? 0 : capacity - used;
    }
    
    Placement choosePlacement(uint64_t freeBytes, uint64_t threshold) {
        return freeBytes >= threshold ? Placement::Partition : Placement::SideChannel;
    }
    
    void writeSideChannel(const std::string& path, const std::string& contents) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FileError(path, "Cannot open for writing");
        }
        
        file << contents;
        file.close();
        
        if (file.fail()) {
            throw FileError(path, "Write failed");
        }
    }
    
    Provisioner::Provisioner(CommandRunner& commandRunner, const Settings& partitionSettings)
        : runner(commandRunner), settings(partitionSettings) {}
    
    PartitionResult Provisioner::createAnswerPartition(const std::string& device,
                                                       const Answer::AnswerConfig& config) {
        std::string contents = config.render();
        
        try {
            DeviceHandler::rereadPartitionTable(runner, device);
            
            uint64_t capacity = DeviceHandler::getDeviceSize(device, settings.sysfsRoot);
            uint64_t available = freeSpace(capacity, DeviceHandler::listPartitions(device, settings.sysfsRoot));
            
            Logs::info("Free space after image: " + ProgressBar::formatSize(available));
            
            if (choosePlacement(available, settings.minimumFreeBytes) == Placement::SideChannel) {
                return fallback(contents, "only " + ProgressBar::formatSize(available) +
                                          " free, need " + ProgressBar::formatSize(settings.minimumFreeBytes));
            }
            
            DeviceHandler::PartitionInfo partition = appendPartition(device);
            try {
                FilesystemSupport::formatPartition(runner, partition.path, FilesystemSupport::FSType::FAT32,
                                                   settings.label);
                writeToPartition(partition.path, contents);
            } catch (const PvestrapException&) {
                // A labelled volume without the answer file would stop the installer.
                discardPartition(device, partition);
                throw;
            }
            
            Logs::success("Answer file written to " + partition.path + " (label " + settings.label + ")");
            
            PartitionResult result;
            result.placement = Placement::Partition;
            result.path = partition.path;
            return result;
        } catch (const PvestrapException& e) {
            return fallback(contents, e.what());
        }
    }
    
    DeviceHandler::PartitionInfo Provisioner::appendPartition(const std::string& device) {
        std::vector<DeviceHandler::PartitionInfo> before = DeviceHandler::listPartitions(device, settings.sysfsRoot);
        
        CommandResult dump = runner.run("sfdisk --dump " + CommandRunner::quote(device));
        std::string label = dump.ok() ? parseTableLabel(dump.output) : "";
        std::string type = partitionTypeFor(label);
        if (type.empty()) {
            throw DeviceError(device, "Unsupported partition table '" + label + "': " + dump.output);
        }
        
        std::string script = "size=" + std::to_string(settings.partitionBytes / 512) + ", type=" + type;
        CommandResult result = runner.run("echo " + CommandRunner::quote(script) +
                                          " | sfdisk --append --force --no-reread " +
                                          CommandRunner::quote(device));
        if (!result.ok()) {
            throw DeviceError(device, "sfdisk could not append a partition: " + result.output);
        }
        
        DeviceHandler::rereadPartitionTable(runner, device);
        
        std::vector<DeviceHandler::PartitionInfo> after = DeviceHandler::listPartitions(device, settings.sysfsRoot);
        int highest = before.empty() ? 0 : before.back().number;
        
        if (after.empty() || after.back().number <= highest) {
            throw DeviceError(device, "New partition did not appear after re-reading the table");
        }
        
        DeviceHandler::PartitionInfo created = after.back();
        created.path = DeviceHandler::partitionPath(device, created.number);
        return created;
    }
    
    void Provisioner::discardPartition(const std::string& device, const DeviceHandler::PartitionInfo& partition) {
        Logs::info("Removing incomplete answer partition " + partition.path);
        
        CommandResult wiped = runner.run("wipefs -a " + CommandRunner::quote(partition.path));
        if (!wiped.ok()) {
            Logs::warning("Could not clear signatures on " + partition.path + ": " + wiped.output);
        }
        
        CommandResult deleted = runner.run("sfdisk --delete " + CommandRunner::quote(device) + " " +
                                           std::to_string(partition.number));
        if (!deleted.ok()) {
            Logs::warning("Could not delete partition " + partition.path + ": " + deleted.output);
        }
        
        DeviceHandler::rereadPartitionTable(runner, device);
    }
    
    void Provisioner::writeToPartition(const std::string& partition, const std::string& contents) {
        char mountTemplate[] = "/tmp/pvestrap-answer.XXXXXX";
        if (!mkdtemp(mountTemplate)) {
            throw FilesystemError("Cannot create a temporary mount point");
        }
        std::string mountDir = mountTemplate;
        
        CommandResult mounted = runner.run("mount " + CommandRunner::quote(partition) + " " +
                                           CommandRunner::quote(mountDir));
        if (!mounted.ok()) {
            rmdir(mountDir.c_str());
            throw FilesystemError("Cannot mount " + partition + ": " + mounted.output);
        }
        
        std::string target = mountDir + "/" + Defaults::ANSWER_FILE_NAME;
        bool written = false;
        {
            std::ofstream file(target, std::ios::binary | std::ios::trunc);
            if (file.is_open()) {
                file << contents;
                file.close();
                written = !file.fail();
            }
        }
        
        bool unmounted = runner.run("umount " + CommandRunner::quote(mountDir)).ok();
        if (unmounted) {
            rmdir(mountDir.c_str());
        }
        
        if (!written) {
            throw FileError(target, "Write failed");
        }
        if (!unmounted) {
            throw FilesystemError("Cannot unmount " + mountDir);
        }
    }
    
    PartitionResult Provisioner::fallback(const std::string& contents, const std::string& reason) {
        Logs::warning("Answer partition not created: " + reason);
        
        writeSideChannel(settings.sideChannelPath, contents);
        
        Logs::warning("Answer file saved to " + settings.sideChannelPath +
                      "; copy it to a FAT32 volume labelled " + settings.label + " before installing");
        
        PartitionResult result;
        result.placement = Placement::SideChannel;
        result.path = settings.sideChannelPath;
        result.degraded = true;
        result.reason = reason;
        return result;
    }
}
