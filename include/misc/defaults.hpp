#ifndef DEFAULTS_HPP
#define DEFAULTS_HPP

#include <cstdint>
#include <string>

namespace Defaults {
    extern const std::string PVE_VERSION;
    extern const std::string ISO_URL_PREFIX;
    extern const std::string IMAGE_PATH;
    extern const uint64_t IMAGE_MIN_BYTES;
    extern const uint64_t HELPER_MIN_BYTES;
    
    extern const std::string CONFIRM_TOKEN;
    
    extern const std::string ANSWER_LABEL;
    extern const std::string ANSWER_FILE_NAME;
    extern const std::string ANSWER_SIDE_CHANNEL;
    extern const uint64_t ANSWER_MIN_FREE_BYTES;
    extern const uint64_t ANSWER_PARTITION_BYTES;
    
    extern const std::string POOL_NAME;
    extern const std::string POOL_MOUNT_ROOT;
    
    extern const std::string FIRSTBOOT_BINARY;
    extern const std::string FIRSTBOOT_UNIT;
    extern const std::string FIRSTBOOT_MARKER;
    extern const std::string FIRSTBOOT_LOG;
    
    std::string isoUrlFor(const std::string& version);
}

#endif // DEFAULTS_HPP
