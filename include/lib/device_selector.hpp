#ifndef DEVICE_SELECTOR_HPP
#define DEVICE_SELECTOR_HPP

#include "lib/command_runner.hpp"
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Snapshot from one enumeration pass. Device names can shift between
// enumeration and use, so re-read the capacity before writing.
struct BlockDevice {
    std::string name;
    std::string path;
    std::string mountpoint;
    uint64_t capacity = 0;
    std::string model;
    std::string transport;
    bool removable = false;
};

namespace DeviceSelector {
    
    class Enumerator {
    private:
        CommandRunner& runner;
        std::string sysfsRoot;
    
    public:
        explicit Enumerator(CommandRunner& commandRunner, const std::string& sysfs = "/sys");
        
        // Layered: bus type from lsblk, then sysfs bus hints, then removable
        // volumes walked back to their disk. First layer with results wins.
        std::vector<BlockDevice> listRemovableDevices();
        
        std::vector<BlockDevice> byTransport();
        std::vector<BlockDevice> byBusHint();
        std::vector<BlockDevice> byRemovableVolumes();
    
    private:
        BlockDevice describe(const std::string& name);
        std::vector<std::string> diskNames();
    };
    
    // Parses one `lsblk -P` line: KEY="value" KEY2="value2"
    std::map<std::string, std::string> parsePairs(const std::string& line);
    std::vector<BlockDevice> deduplicate(const std::vector<BlockDevice>& devices);
    std::string describeDevice(const BlockDevice& device);
    
    // Returns nothing when the operator picks an invalid index or declines the
    // confirmation token.
    std::optional<BlockDevice> selectDevice(const std::vector<BlockDevice>& devices,
                                            std::istream& in, std::ostream& out);
}

#endif // DEVICE_SELECTOR_HPP
