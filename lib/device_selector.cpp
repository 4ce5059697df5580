#include "lib/device_selector.hpp"
#include "lib/confirm.hpp"
#include "misc/defaults.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include "utils/progress_bar.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace DeviceSelector {
    
    namespace {
        const char* const VIRTUAL_PREFIXES[] = {"loop", "ram", "zram", "dm-", "md", "sr", "fd", "nbd"};
        
        bool isVirtual(const std::string& name) {
            for (const char* prefix : VIRTUAL_PREFIXES) {
                if (name.rfind(prefix, 0) == 0) {
                    return true;
                }
            }
            return false;
        }
        
        std::string readLine(const fs::path& path) {
            std::ifstream file(path);
            std::string value;
            if (file.is_open()) {
                std::getline(file, value);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            return value;
        }
    }
    
    Enumerator::Enumerator(CommandRunner& commandRunner, const std::string& sysfs)
        : runner(commandRunner), sysfsRoot(sysfs) {}
    
    std::vector<BlockDevice> Enumerator::listRemovableDevices() {
        std::vector<BlockDevice> found = byTransport();
        
        if (found.empty()) {
            Logs::debug("No USB transport reported by lsblk, checking sysfs bus hints");
            found = byBusHint();
        }
        
        if (found.empty()) {
            Logs::debug("No bus hints found, checking removable volumes");
            found = byRemovableVolumes();
        }
        
        return deduplicate(found);
    }
    
    std::vector<BlockDevice> Enumerator::byTransport() {
        std::vector<BlockDevice> devices;
        
        CommandResult result = runner.run("lsblk -b -d -P -o NAME,TRAN,SIZE,MODEL,RM,TYPE,MOUNTPOINT");
        if (!result.ok()) {
            Logs::debug("lsblk failed: " + result.output);
            return devices;
        }
        
        std::istringstream lines(result.output);
        std::string line;
        while (std::getline(lines, line)) {
            auto pairs = parsePairs(line);
            if (pairs["TYPE"] != "disk" || pairs["TRAN"] != "usb") {
                continue;
            }
            
            BlockDevice device;
            device.name = pairs["NAME"];
            device.path = "/dev/" + device.name;
            device.transport = pairs["TRAN"];
            device.model = pairs["MODEL"];
            device.mountpoint = pairs["MOUNTPOINT"];
            device.removable = pairs["RM"] == "1";
            try {
                device.capacity = std::stoull(pairs["SIZE"]);
            } catch (const std::exception&) {
                device.capacity = 0;
            }
            devices.push_back(device);
        }
        
        return devices;
    }
    
    std::vector<BlockDevice> Enumerator::byBusHint() {
        std::vector<BlockDevice> devices;
        
        for (const auto& name : diskNames()) {
            std::error_code ec;
            fs::path resolved = fs::canonical(fs::path(sysfsRoot) / "block" / name, ec);
            if (ec) {
                continue;
            }
            
            std::string target = resolved.string();
            if (target.find("/usb") == std::string::npos) {
                continue;
            }
            
            BlockDevice device = describe(name);
            device.transport = "usb";
            devices.push_back(device);
        }
        
        return devices;
    }
    
    std::vector<BlockDevice> Enumerator::byRemovableVolumes() {
        std::vector<BlockDevice> devices;
        fs::path classDir = fs::path(sysfsRoot) / "class" / "block";
        
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(classDir, ec)) {
            std::string name = entry.path().filename().string();
            if (isVirtual(name)) {
                continue;
            }
            
            // Volumes carry a "partition" attribute; their owning disk is the parent directory.
            std::string owner = name;
            if (fs::exists(entry.path() / "partition")) {
                std::error_code resolveError;
                fs::path resolved = fs::canonical(entry.path(), resolveError);
                if (resolveError) {
                    continue;
                }
                owner = resolved.parent_path().filename().string();
            }
            
            if (readLine(fs::path(sysfsRoot) / "block" / owner / "removable") != "1") {
                continue;
            }
            
            devices.push_back(describe(owner));
        }
        
        return devices;
    }
    
    BlockDevice Enumerator::describe(const std::string& name) {
        fs::path base = fs::path(sysfsRoot) / "block" / name;
        
        BlockDevice device;
        device.name = name;
        device.path = "/dev/" + name;
        device.model = readLine(base / "device" / "model");
        device.removable = readLine(base / "removable") == "1";
        
        try {
            device.capacity = std::stoull(readLine(base / "size")) * 512;
        } catch (const std::exception&) {
            device.capacity = 0;
        }
        
        return device;
    }
    
    std::vector<std::string> Enumerator::diskNames() {
        std::vector<std::string> names;
        
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(fs::path(sysfsRoot) / "block", ec)) {
            std::string name = entry.path().filename().string();
            if (!isVirtual(name)) {
                names.push_back(name);
            }
        }
        
        std::sort(names.begin(), names.end());
        return names;
    }
    
    std::map<std::string, std::string> parsePairs(const std::string& line) {
        std::map<std::string, std::string> pairs;
        size_t pos = 0;
        
        while (pos < line.size()) {
            while (pos < line.size() && line[pos] == ' ') {
                ++pos;
            }
            
            size_t eq = line.find("=\"", pos);
            if (eq == std::string::npos) {
                break;
            }
            
            std::string key = line.substr(pos, eq - pos);
            size_t close = line.find('"', eq + 2);
            if (close == std::string::npos) {
                break;
            }
            
            pairs[key] = line.substr(eq + 2, close - eq - 2);
            pos = close + 1;
        }
        
        return pairs;
    }
    
    std::vector<BlockDevice> deduplicate(const std::vector<BlockDevice>& devices) {
        std::vector<BlockDevice> unique;
        std::set<std::string> seen;
        
        for (const auto& device : devices) {
            if (seen.insert(device.name).second) {
                unique.push_back(device);
            }
        }
        
        return unique;
    }
    
    std::string describeDevice(const BlockDevice& device) {
        std::string text = device.path + "  " + ProgressBar::formatSize(device.capacity);
        if (!device.model.empty()) {
            text += "  " + device.model;
        }
        if (!device.transport.empty()) {
            text += "  [" + device.transport + "]";
        }
        if (!device.mountpoint.empty()) {
            text += "  mounted at " + device.mountpoint;
        }
        return text;
    }
    
    std::optional<BlockDevice> selectDevice(const std::vector<BlockDevice>& devices,
                                            std::istream& in, std::ostream& out) {
        if (devices.empty()) {
            Logs::error("No removable devices found");
            return std::nullopt;
        }
        
        const BlockDevice* chosen = nullptr;
        
        if (devices.size() == 1) {
            chosen = &devices.front();
            out << "Found one removable device: " << describeDevice(*chosen) << std::endl;
        } else {
            out << Colors::bold("Removable devices:") << std::endl;
            for (size_t i = 0; i < devices.size(); ++i) {
                out << Colors::green("[" + std::to_string(i + 1) + "]") << " "
                    << describeDevice(devices[i]) << std::endl;
            }
            out << Colors::bold("Choose [1-" + std::to_string(devices.size()) + "]: ");
            out.flush();
            
            std::string answer;
            std::getline(in, answer);
            
            size_t index = 0;
            try {
                size_t consumed = 0;
                index = std::stoul(answer, &consumed);
                if (consumed != answer.size()) {
                    index = 0;
                }
            } catch (const std::exception&) {
                index = 0;
            }
            
            if (index < 1 || index > devices.size()) {
                Logs::info("No valid device chosen, aborting");
                return std::nullopt;
            }
            chosen = &devices[index - 1];
        }
        
        out << Colors::yellow("WARNING: All data on " + chosen->path + " will be destroyed!") << std::endl;
        if (!Confirm::requireToken(in, out, "Write to " + chosen->path + "?", Defaults::CONFIRM_TOKEN)) {
            Logs::info("Operation cancelled by user");
            return std::nullopt;
        }
        
        return *chosen;
    }
}
