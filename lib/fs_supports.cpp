#include "lib/fs_supports.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <algorithm>

namespace FilesystemSupport {
    
    FSType parseFSType(const std::string& fsName) {
        std::string lower = fsName;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        
        if (lower == "ext4") return FSType::EXT4;
        if (lower == "xfs") return FSType::XFS;
        if (lower == "zfs") return FSType::ZFS;
        if (lower == "btrfs") return FSType::BTRFS;
        if (lower == "fat32" || lower == "vfat") return FSType::FAT32;
        
        return FSType::UNKNOWN;
    }
    
    std::string getFSName(FSType fs) {
        switch (fs) {
            case FSType::EXT4: return "ext4";
            case FSType::XFS: return "xfs";
            case FSType::ZFS: return "zfs";
            case FSType::BTRFS: return "btrfs";
            case FSType::FAT32: return "fat32";
            default: return "unknown";
        }
    }
    
    bool isInstallTarget(FSType fs) {
        return fs == FSType::EXT4 || fs == FSType::XFS || fs == FSType::ZFS || fs == FSType::BTRFS;
    }
    
    std::vector<std::string> getInstallFilesystems() {
        return {"ext4", "xfs", "zfs", "btrfs"};
    }
    
    void formatPartition(CommandRunner& runner, const std::string& device, FSType fs,
                         const std::string& label) {
        Logs::info("Formatting " + device + " as " + getFSName(fs));
        
        // Only the answer volume is formatted here; the installer lays out the target disks.
        if (fs != FSType::FAT32) {
            throw FilesystemError("Cannot format a partition as " + getFSName(fs));
        }
        
        std::string command = "mkfs.vfat -F 32";
        if (!label.empty()) command += " -n " + CommandRunner::quote(label);
        
        CommandResult result = runner.run(command + " " + CommandRunner::quote(device));
        
        if (!result.ok()) {
            throw FilesystemError("Failed to format " + device + " as " + getFSName(fs) + ": " + result.output);
        }
        
        Logs::success("Formatted " + device + " as " + getFSName(fs));
    }
}
