#ifndef DEVICE_STATE_HPP
#define DEVICE_STATE_HPP

#include "lib/command_runner.hpp"
#include <string>

// Unknown -> Online -> Prepared -> Offline -> Online
// Each transition is idempotent: asking for the current state does nothing.
class DeviceStateMachine {
public:
    enum class State {
        Unknown,
        Online,
        Prepared,
        Offline
    };
    
private:
    CommandRunner& runner;
    std::string device;
    std::string mountTable;
    State current;
    int claimFd;
    
public:
    DeviceStateMachine(CommandRunner& commandRunner, const std::string& devicePath,
                       const std::string& mounts = "/proc/mounts");
    ~DeviceStateMachine();
    
    DeviceStateMachine(const DeviceStateMachine&) = delete;
    DeviceStateMachine& operator=(const DeviceStateMachine&) = delete;
    
    // Unmounts everything the host mounted from the device.
    void releaseLocks();
    // Clears partition table and filesystem signatures.
    void prepare();
    // Takes an exclusive kernel claim so nothing can mount the device while we write.
    void takeOffline();
    // Drops the claim and has the kernel re-read the partition table.
    bool bringOnline();
    
    State state() const { return current; }
    const std::string& path() const { return device; }
    // Writable descriptor while Offline, -1 otherwise.
    int writeHandle() const { return claimFd; }
    
    static std::string stateName(State state);
};

#endif // DEVICE_STATE_HPP
