#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <algorithm>
#include <cctype>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <linux/fs.h>
#include <mntent.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace DeviceHandler {
    
    namespace {
        bool readNumber(const std::string& path, uint64_t& value) {
            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }
            file >> value;
            return !file.fail();
        }
        
        // True for the device itself or one of its partitions.
        bool belongsTo(const std::string& source, const std::string& device) {
            if (source.compare(0, device.size(), device) != 0) {
                return false;
            }
            if (source.size() == device.size()) {
                return true;
            }
            char next = source[device.size()];
            return std::isdigit(static_cast<unsigned char>(next)) || next == 'p';
        }
    }
    
    bool validateDevice(const std::string& device) {
        struct stat st;
        if (stat(device.c_str(), &st) != 0) {
            return false;
        }
        
        return S_ISBLK(st.st_mode);
    }
    
    std::string deviceName(const std::string& device) {
        return device.substr(device.find_last_of('/') + 1);
    }
    
    std::string devicePath(const std::string& nameOrPath) {
        if (nameOrPath.empty() || nameOrPath[0] == '/') {
            return nameOrPath;
        }
        return "/dev/" + nameOrPath;
    }
    
    std::string partitionPath(const std::string& device, int number) {
        std::string name = deviceName(device);
        bool needsSeparator = !name.empty() && std::isdigit(static_cast<unsigned char>(name.back()));
        return device + (needsSeparator ? "p" : "") + std::to_string(number);
    }
    
    std::vector<std::string> mountPoints(const std::string& device, const std::string& mountTable) {
        std::vector<std::string> points;
        
        FILE* table = setmntent(mountTable.c_str(), "r");
        if (!table) {
            return points;
        }
        
        struct mntent* entry;
        while ((entry = getmntent(table)) != nullptr) {
            if (belongsTo(entry->mnt_fsname, device)) {
                points.push_back(entry->mnt_dir);
            }
        }
        
        endmntent(table);
        return points;
    }
    
    bool isDeviceMounted(const std::string& device, const std::string& mountTable) {
        return !mountPoints(device, mountTable).empty();
    }
    
    bool unmountDevice(CommandRunner& runner, const std::string& device, const std::string& mountTable) {
        std::vector<std::string> points = mountPoints(device, mountTable);
        if (points.empty()) {
            return true;
        }
        
        // Deepest first so nested mounts come off before their parents.
        std::sort(points.rbegin(), points.rend());
        
        for (const auto& point : points) {
            Logs::info("Unmounting " + point);
            
            if (!runner.run("umount " + CommandRunner::quote(point)).ok()) {
                Logs::warning("Failed to unmount " + point + " cleanly, forcing...");
                if (!runner.run("umount -l " + CommandRunner::quote(point)).ok()) {
                    Logs::error("Could not unmount " + point);
                    return false;
                }
            }
        }
        
        return !isDeviceMounted(device, mountTable);
    }
    
    uint64_t getDeviceSize(const std::string& device, const std::string& sysfsRoot) {
        std::string sizeFile = sysfsRoot + "/class/block/" + deviceName(device) + "/size";
        
        uint64_t sectors = 0;
        if (!readNumber(sizeFile, sectors)) {
            throw DeviceError(device, "Cannot read device size");
        }
        
        // sysfs always counts 512-byte sectors regardless of the logical block size
        return sectors * 512;
    }
    
    std::vector<PartitionInfo> listPartitions(const std::string& device, const std::string& sysfsRoot) {
        std::vector<PartitionInfo> partitions;
        std::string name = deviceName(device);
        std::string base = sysfsRoot + "/class/block/" + name;
        
        DIR* dir = opendir(base.c_str());
        if (!dir) {
            throw DeviceError(device, "Cannot inspect partitions");
        }
        
        struct dirent* entry;
        while ((entry = readdir(dir)) != nullptr) {
            std::string child = entry->d_name;
            if (child.compare(0, name.size(), name) != 0 || child == name) {
                continue;
            }
            
            PartitionInfo info;
            uint64_t number = 0;
            uint64_t sectors = 0;
            if (!readNumber(base + "/" + child + "/partition", number) ||
                !readNumber(base + "/" + child + "/size", sectors)) {
                continue;
            }
            
            info.number = static_cast<int>(number);
            info.path = "/dev/" + child;
            info.sizeBytes = sectors * 512;
            partitions.push_back(info);
        }
        
        closedir(dir);
        
        std::sort(partitions.begin(), partitions.end(),
                  [](const PartitionInfo& a, const PartitionInfo& b) { return a.number < b.number; });
        return partitions;
    }
    
    bool rereadPartitionTable(CommandRunner& runner, const std::string& device) {
        bool refreshed = false;
        
        int fd = open(device.c_str(), O_RDONLY);
        if (fd >= 0) {
            refreshed = ioctl(fd, BLKRRPART) == 0;
            close(fd);
        }
        
        if (!refreshed) {
            Logs::debug("BLKRRPART failed on " + device + ", trying partprobe");
            refreshed = runner.run("partprobe " + CommandRunner::quote(device)).ok();
        }
        
        if (!runner.run("udevadm settle").ok()) {
            Logs::debug("udevadm settle reported an error");
        }
        
        return refreshed;
    }
    
    bool syncDevice(CommandRunner& runner, const std::string& device) {
        Logs::info("Syncing device buffers...");
        sync();
        
        return runner.run("blockdev --flushbufs " + CommandRunner::quote(device)).ok();
    }
}
