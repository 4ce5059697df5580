#ifndef FS_SUPPORTS_HPP
#define FS_SUPPORTS_HPP

#include "lib/command_runner.hpp"
#include <string>
#include <vector>

namespace FilesystemSupport {
    enum class FSType {
        EXT4,
        XFS,
        ZFS,
        BTRFS,
        FAT32,
        UNKNOWN
    };
    
    FSType parseFSType(const std::string& fsName);
    std::string getFSName(FSType fs);
    // Root filesystems the unattended installer can lay down.
    bool isInstallTarget(FSType fs);
    std::vector<std::string> getInstallFilesystems();
    // Throws FilesystemError.
    void formatPartition(CommandRunner& runner, const std::string& device, FSType fs,
                         const std::string& label = "");
}

#endif // FS_SUPPORTS_HPP
