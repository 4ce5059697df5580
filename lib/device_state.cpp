#include "lib/device_state.hpp"
#include "lib/dev_handler.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

DeviceStateMachine::DeviceStateMachine(CommandRunner& commandRunner, const std::string& devicePath,
                                       const std::string& mounts)
    : runner(commandRunner), device(devicePath), mountTable(mounts),
      current(State::Unknown), claimFd(-1) {}

DeviceStateMachine::~DeviceStateMachine() {
    if (claimFd >= 0) {
        close(claimFd);
    }
}

void DeviceStateMachine::releaseLocks() {
    if (current == State::Online || current == State::Prepared) {
        return;
    }
    if (current == State::Offline) {
        throw DeviceError(device, "cannot release locks while the device is claimed for writing");
    }
    
    if (!DeviceHandler::unmountDevice(runner, device, mountTable)) {
        throw DeviceError(device, "Device is still mounted");
    }
    
    current = State::Online;
    Logs::debug(device + " is " + stateName(current));
}

void DeviceStateMachine::prepare() {
    if (current == State::Prepared) {
        return;
    }
    if (current != State::Online) {
        throw DeviceError(device, "must be online before it can be prepared (is " + stateName(current) + ")");
    }
    
    Logs::info("Clearing partition table and filesystem signatures on " + device);
    
    CommandResult result = runner.run("wipefs -a " + CommandRunner::quote(device));
    if (!result.ok()) {
        throw DeviceError(device, "wipefs failed: " + result.output);
    }
    
    current = State::Prepared;
    Logs::debug(device + " is " + stateName(current));
}

void DeviceStateMachine::takeOffline() {
    if (current == State::Offline) {
        return;
    }
    if (current != State::Prepared) {
        throw DeviceError(device, "must be prepared before it can be taken offline (is " + stateName(current) + ")");
    }
    
    // O_EXCL on a block device fails while anything else holds or mounts it.
    claimFd = open(device.c_str(), O_WRONLY | O_EXCL | O_CLOEXEC);
    if (claimFd < 0) {
        throw DeviceError(device, std::string("Cannot claim device exclusively: ") + strerror(errno));
    }
    
    current = State::Offline;
    Logs::debug(device + " is " + stateName(current));
}

bool DeviceStateMachine::bringOnline() {
    if (current == State::Online) {
        return true;
    }
    
    if (claimFd >= 0) {
        if (close(claimFd) != 0) {
            Logs::warning("Closing " + device + " reported: " + strerror(errno));
        }
        claimFd = -1;
    }
    
    bool refreshed = DeviceHandler::rereadPartitionTable(runner, device);
    if (!refreshed) {
        Logs::warning("Kernel did not re-read the partition table of " + device);
    }
    
    current = State::Online;
    Logs::debug(device + " is " + stateName(current));
    return refreshed;
}

std::string DeviceStateMachine::stateName(State state) {
    switch (state) {
        case State::Unknown: return "unknown";
        case State::Online: return "online";
        case State::Prepared: return "prepared";
        case State::Offline: return "offline";
    }
    return "unknown";
}
