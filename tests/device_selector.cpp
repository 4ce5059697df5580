#include <filesystem>
#include <sstream>

#include <gtest/gtest.h>

#include "lib/device_selector.hpp"

#include "mocks/commandrunnermock.hpp"
#include "utils/tempdir.hpp"

using namespace testing;
using namespace DeviceSelector;

namespace fs = std::filesystem;

/***********************************************************************************************************************
 * Helpers
 **********************************************************************************************************************/

namespace {

BlockDevice makeDevice(const std::string& name, uint64_t capacity) {
    BlockDevice device;
    device.name = name;
    device.path = "/dev/" + name;
    device.capacity = capacity;
    return device;
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class DeviceSelectorTest : public Test {
protected:
    // Real sysfs layout: /sys/block/<name> is a symlink into /sys/devices.
    void addDisk(const std::string& name, const std::string& busPath, const std::string& removable) {
        std::string device = mDir.mkdir("devices/" + busPath + "/block/" + name);
        mDir.write("devices/" + busPath + "/block/" + name + "/size", "15000000\n");
        mDir.write("devices/" + busPath + "/block/" + name + "/removable", removable + "\n");
        mDir.mkdir("block");
        fs::create_directory_symlink(device, mDir.path("block/" + name));
        mDir.mkdir("class/block");
        fs::create_directory_symlink(device, mDir.path("class/block/" + name));
    }

    void addVolume(const std::string& disk, const std::string& busPath, const std::string& volume) {
        std::string dir = mDir.mkdir("devices/" + busPath + "/block/" + disk + "/" + volume);
        mDir.write("devices/" + busPath + "/block/" + disk + "/" + volume + "/partition", "1\n");
        fs::create_directory_symlink(dir, mDir.path("class/block/" + volume));
    }

    ::TempDir mDir;
    NiceMock<MockCommandRunner> mRunner;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(DeviceSelectorTest, ParsePairs) {
    auto pairs = parsePairs(R"(NAME="sdb" TRAN="usb" SIZE="16008609792" MODEL="Cruzer Blade" RM="1")");

    EXPECT_EQ(pairs["NAME"], "sdb");
    EXPECT_EQ(pairs["MODEL"], "Cruzer Blade");
    EXPECT_EQ(pairs["SIZE"], "16008609792");
    EXPECT_TRUE(parsePairs("").empty());
}

TEST_F(DeviceSelectorTest, TransportLayerKeepsUsbDisksOnly) {
    ON_CALL(mRunner, run(StartsWith("lsblk"))).WillByDefault(Return(commandOk(
        "NAME=\"sda\" TRAN=\"sata\" SIZE=\"500107862016\" MODEL=\"SSD\" RM=\"0\" TYPE=\"disk\" MOUNTPOINT=\"\"\n"
        "NAME=\"sdb\" TRAN=\"usb\" SIZE=\"16008609792\" MODEL=\"Cruzer\" RM=\"1\" TYPE=\"disk\" MOUNTPOINT=\"\"\n"
        "NAME=\"sr0\" TRAN=\"usb\" SIZE=\"1073741312\" MODEL=\"DVD\" RM=\"1\" TYPE=\"rom\" MOUNTPOINT=\"\"\n")));

    Enumerator enumerator(mRunner, mDir.path());
    auto devices = enumerator.listRemovableDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].path, "/dev/sdb");
    EXPECT_EQ(devices[0].capacity, 16008609792ULL);
    EXPECT_EQ(devices[0].model, "Cruzer");
    EXPECT_TRUE(devices[0].removable);
}

TEST_F(DeviceSelectorTest, FallsBackToBusHints) {
    ON_CALL(mRunner, run(_)).WillByDefault(Return(commandFailed()));
    addDisk("sda", "pci0000:00/0000:00:17.0/ata1/host0", "0");
    addDisk("sdb", "pci0000:00/0000:00:14.0/usb1/1-1/host2", "1");

    Enumerator enumerator(mRunner, mDir.path());
    auto devices = enumerator.listRemovableDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name, "sdb");
    EXPECT_EQ(devices[0].transport, "usb");
    EXPECT_EQ(devices[0].capacity, 15000000ULL * 512);
}

TEST_F(DeviceSelectorTest, RemovableVolumesResolveToTheirDisk) {
    addDisk("mmcblk0", "platform/sdhci/mmc0/mmc0:0001", "1");
    addVolume("mmcblk0", "platform/sdhci/mmc0/mmc0:0001", "mmcblk0p1");
    addDisk("sda", "pci0000:00/ata1/host0", "0");

    Enumerator enumerator(mRunner, mDir.path());
    auto devices = deduplicate(enumerator.byRemovableVolumes());

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].name, "mmcblk0");
    EXPECT_TRUE(devices[0].removable);
}

TEST_F(DeviceSelectorTest, DeduplicateKeepsFirst) {
    auto unique = deduplicate({makeDevice("sdb", 1), makeDevice("sdc", 2), makeDevice("sdb", 3)});

    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0].capacity, 1u);
    EXPECT_EQ(unique[1].name, "sdc");
}

TEST_F(DeviceSelectorTest, DescribeDevice) {
    BlockDevice device = makeDevice("sdb", 1024 * 1024);
    device.model = "Cruzer";
    device.transport = "usb";

    EXPECT_EQ(describeDevice(device), "/dev/sdb  1.00 MB  Cruzer  [usb]");
}

TEST_F(DeviceSelectorTest, SingleDeviceNeedsToken) {
    std::vector<BlockDevice> devices {makeDevice("sdb", 1)};
    std::ostringstream out;

    std::istringstream accept("yes\n");
    auto chosen = selectDevice(devices, accept, out);
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->path, "/dev/sdb");

    std::istringstream decline("y\n");
    EXPECT_FALSE(selectDevice(devices, decline, out).has_value());
}

TEST_F(DeviceSelectorTest, MultipleDevicesNeedIndexThenToken) {
    std::vector<BlockDevice> devices {makeDevice("sdb", 1), makeDevice("sdc", 2)};
    std::ostringstream out;

    std::istringstream second("2\nyes\n");
    auto chosen = selectDevice(devices, second, out);
    ASSERT_TRUE(chosen.has_value());
    EXPECT_EQ(chosen->name, "sdc");

    std::istringstream outOfRange("3\nyes\n");
    EXPECT_FALSE(selectDevice(devices, outOfRange, out).has_value());

    std::istringstream garbage("1x\nyes\n");
    EXPECT_FALSE(selectDevice(devices, garbage, out).has_value());
}

TEST_F(DeviceSelectorTest, NothingToSelect) {
    std::istringstream in("yes\n");
    std::ostringstream out;

    EXPECT_FALSE(selectDevice({}, in, out).has_value());
}
