#include "misc/defaults.hpp"

namespace Defaults {
    const std::string PVE_VERSION = "8.2-2";
    const std::string ISO_URL_PREFIX = "https://enterprise.proxmox.com/iso/proxmox-ve_";
    const std::string IMAGE_PATH = "proxmox-ve.iso";
    // Anything smaller is an error page saved under the image name.
    const uint64_t IMAGE_MIN_BYTES = 500ULL * 1024 * 1024;
    const uint64_t HELPER_MIN_BYTES = 64ULL * 1024;
    
    const std::string CONFIRM_TOKEN = "yes";
    
    // The unattended installer searches for a partition with this label.
    const std::string ANSWER_LABEL = "PROXMOX-AIS";
    const std::string ANSWER_FILE_NAME = "answer.toml";
    const std::string ANSWER_SIDE_CHANNEL = "answer.toml";
    const uint64_t ANSWER_MIN_FREE_BYTES = 10ULL * 1024 * 1024;
    const uint64_t ANSWER_PARTITION_BYTES = 8ULL * 1024 * 1024;
    
    const std::string POOL_NAME = "rpool";
    const std::string POOL_MOUNT_ROOT = "/rpool";
    
    const std::string FIRSTBOOT_BINARY = "/usr/local/sbin/pvestrap-firstboot";
    const std::string FIRSTBOOT_UNIT = "pve-first-boot.service";
    const std::string FIRSTBOOT_MARKER = "/var/lib/pve-first-boot.done";
    const std::string FIRSTBOOT_LOG = "/var/log/pve-first-boot.log";
    
    std::string isoUrlFor(const std::string& version) {
        return ISO_URL_PREFIX + version + ".iso";
    }
}
