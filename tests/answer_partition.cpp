#include <filesystem>
#include <fstream>
#include <iterator>

#include <gtest/gtest.h>

#include "lib/answer_partition.hpp"
#include "lib/errors.hpp"
#include "lib/fs_supports.hpp"
#include "misc/defaults.hpp"

#include "mocks/commandrunnermock.hpp"
#include "utils/tempdir.hpp"

using namespace testing;
using namespace AnswerPartition;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class AnswerPartitionTest : public Test {
protected:
    void SetUp() override {
        ON_CALL(mRunner, run(_)).WillByDefault(Return(commandOk()));
        ON_CALL(mRunner, run(StartsWith("sfdisk --dump"))).WillByDefault(Return(commandOk(
            "label: gpt\nlabel-id: 5B3A1C2E-0000-4000-8000-000000000001\ndevice: /dev/sdz\nunit: sectors\n\n"
            "/dev/sdz1 : start=64, size=65536, type=EBD0A0A2-B9E5-4433-87C0-68B6B72699C7\n")));

        mSettings.sysfsRoot = mSysfs.path();
        mSettings.sideChannelPath = mOutput.path("answer.toml");

        Answer::Identity identity;
        identity.rootPassword = "secret";
        Answer::PostInstallPlan plan;
        plan.firstbootUrl = "https://example.org/pvestrap-firstboot";

        mConfig = Answer::buildAnswer(identity, Answer::NetworkConfig(), Answer::StorageDirective(), plan, false);
    }

    // Mount target from "mount '<partition>' '<dir>'".
    static std::string lastQuoted(const std::string& command) {
        size_t close = command.rfind('\'');
        size_t open = command.rfind('\'', close - 1);
        return command.substr(open + 1, close - open - 1);
    }

    void TearDown() override {
        if (!mMountDir.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(mMountDir, ec);
        }
    }

    // Room for exactly one answer partition after sdz1; sfdisk makes sdz2 appear.
    void prepareRoomyDevice() {
        mSysfs.addBlockDevice("sdz", 64 * 1024 * 1024);
        mSysfs.addPartition("sdz", "sdz1", 1, 32 * 1024 * 1024);
        mSettings.minimumFreeBytes = 32 * 1024 * 1024;

        ON_CALL(mRunner, run(HasSubstr("sfdisk --append"))).WillByDefault(Invoke([this](const std::string&) {
            mSysfs.addPartition("sdz", "sdz2", 2, Defaults::ANSWER_PARTITION_BYTES);
            return commandOk();
        }));
        ON_CALL(mRunner, run(StartsWith("mount '/dev/sdz2' "))).WillByDefault(Invoke([this](const std::string& command) {
            mMountDir = lastQuoted(command);
            return commandOk();
        }));
    }

    const std::string mDevice = "/dev/sdz";
    std::string mMountDir;
    ::TempDir mSysfs;
    ::TempDir mOutput;
    NiceMock<MockCommandRunner> mRunner;
    Settings mSettings;
    Answer::AnswerConfig mConfig;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(AnswerPartitionTest, PlacementBoundaries) {
    const uint64_t threshold = Defaults::ANSWER_MIN_FREE_BYTES;

    EXPECT_EQ(choosePlacement(threshold, threshold), Placement::Partition);
    EXPECT_EQ(choosePlacement(threshold + 1, threshold), Placement::Partition);
    EXPECT_EQ(choosePlacement(threshold - 1, threshold), Placement::SideChannel);
    EXPECT_EQ(choosePlacement(0, threshold), Placement::SideChannel);
}

TEST_F(AnswerPartitionTest, FreeSpaceNeverUnderflows) {
    std::vector<DeviceHandler::PartitionInfo> partitions(2);
    partitions[0].sizeBytes = 600;
    partitions[1].sizeBytes = 500;

    EXPECT_EQ(freeSpace(1000, partitions), 0u);
    EXPECT_EQ(freeSpace(2000, partitions), 900u);
    EXPECT_EQ(freeSpace(2000, {}), 2000u);
}

TEST_F(AnswerPartitionTest, LowFreeSpaceFallsBackToSideChannel) {
    mSysfs.addBlockDevice("sdz", 8000000000ULL);
    mSysfs.addPartition("sdz", "sdz1", 1, 7995000000ULL);

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run(HasSubstr("sfdisk"))).Times(0);
    EXPECT_CALL(mRunner, run(HasSubstr("mkfs"))).Times(0);

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_EQ(result.placement, Placement::SideChannel);
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.path, mSettings.sideChannelPath);
    EXPECT_EQ(mOutput.read("answer.toml"), mConfig.render());
}

TEST_F(AnswerPartitionTest, OneByteBelowThresholdFallsBack) {
    mSysfs.addBlockDevice("sdz", 64 * 1024 * 1024);
    mSysfs.addPartition("sdz", "sdz1", 1, 32 * 1024 * 1024);
    mSettings.minimumFreeBytes = 32 * 1024 * 1024 + 1;

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run(HasSubstr("sfdisk"))).Times(0);

    Provisioner provisioner(mRunner, mSettings);
    EXPECT_EQ(provisioner.createAnswerPartition(mDevice, mConfig).placement, Placement::SideChannel);
}

TEST_F(AnswerPartitionTest, ExactlyAtThresholdCreatesPartition) {
    mSysfs.addBlockDevice("sdz", 64 * 1024 * 1024);
    mSysfs.addPartition("sdz", "sdz1", 1, 32 * 1024 * 1024);
    mSettings.minimumFreeBytes = 32 * 1024 * 1024;

    std::string mountDir;

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run(HasSubstr("sfdisk --append"))).WillOnce(Invoke([&](const std::string&) {
        mSysfs.addPartition("sdz", "sdz2", 2, Defaults::ANSWER_PARTITION_BYTES);
        return commandOk();
    }));
    EXPECT_CALL(mRunner, run("mkfs.vfat -F 32 -n 'PROXMOX-AIS' '/dev/sdz2'")).WillOnce(Return(commandOk()));
    EXPECT_CALL(mRunner, run(StartsWith("mount '/dev/sdz2' "))).WillOnce(Invoke([&](const std::string& command) {
        mountDir = lastQuoted(command);
        return commandOk();
    }));

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_EQ(result.placement, Placement::Partition);
    EXPECT_FALSE(result.degraded);
    EXPECT_EQ(result.path, "/dev/sdz2");
    EXPECT_FALSE(std::filesystem::exists(mSettings.sideChannelPath));

    ASSERT_FALSE(mountDir.empty());
    std::ifstream written(mountDir + "/" + Defaults::ANSWER_FILE_NAME);
    std::string contents((std::istreambuf_iterator<char>(written)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, mConfig.render());

    std::error_code ec;
    std::filesystem::remove_all(mountDir, ec);
}

TEST_F(AnswerPartitionTest, FormatFailureDegradesInsteadOfAborting) {
    mSysfs.addBlockDevice("sdz", 64 * 1024 * 1024);
    mSysfs.addPartition("sdz", "sdz1", 1, 16 * 1024 * 1024);

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run(HasSubstr("sfdisk --append"))).WillOnce(Invoke([&](const std::string&) {
        mSysfs.addPartition("sdz", "sdz2", 2, Defaults::ANSWER_PARTITION_BYTES);
        return commandOk();
    }));
    EXPECT_CALL(mRunner, run(StartsWith("mkfs.vfat"))).WillOnce(Return(commandFailed(1, "no mkfs.vfat")));
    EXPECT_CALL(mRunner, run(StartsWith("mount"))).Times(0);

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_EQ(result.placement, Placement::SideChannel);
    EXPECT_TRUE(result.degraded);
    EXPECT_THAT(result.reason, HasSubstr("fat32"));
    EXPECT_EQ(mOutput.read("answer.toml"), mConfig.render());
}

TEST_F(AnswerPartitionTest, PartitionThatNeverAppearsDegrades) {
    mSysfs.addBlockDevice("sdz", 64 * 1024 * 1024);

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_EQ(result.placement, Placement::SideChannel);
    EXPECT_THAT(result.reason, HasSubstr("did not appear"));
}

TEST_F(AnswerPartitionTest, UnknownDeviceDegrades) {
    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(mOutput.read("answer.toml"), mConfig.render());
}

TEST_F(AnswerPartitionTest, UnwritableSideChannelThrows) {
    mSettings.sideChannelPath = mOutput.path("missing/dir/answer.toml");

    Provisioner provisioner(mRunner, mSettings);
    EXPECT_THROW(provisioner.createAnswerPartition(mDevice, mConfig), FileError);
}

TEST_F(AnswerPartitionTest, TableLabelSelectsPartitionType) {
    EXPECT_EQ(parseTableLabel("label: gpt\nunit: sectors\n"), "gpt");
    EXPECT_EQ(parseTableLabel("label: dos\n"), "dos");
    EXPECT_EQ(parseTableLabel("unit: sectors\n"), "");

    EXPECT_EQ(partitionTypeFor("gpt"), "EBD0A0A2-B9E5-4433-87C0-68B6B72699C7");
    EXPECT_EQ(partitionTypeFor("dos"), "c");
    EXPECT_EQ(partitionTypeFor("sun"), "");
}

TEST_F(AnswerPartitionTest, GptImageGetsBasicDataPartition) {
    prepareRoomyDevice();

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run("echo 'size=16384, type=EBD0A0A2-B9E5-4433-87C0-68B6B72699C7' | "
                             "sfdisk --append --force --no-reread '/dev/sdz'"));

    Provisioner provisioner(mRunner, mSettings);
    EXPECT_EQ(provisioner.createAnswerPartition(mDevice, mConfig).placement, Placement::Partition);
}

TEST_F(AnswerPartitionTest, DosImageGetsFat32Partition) {
    prepareRoomyDevice();
    ON_CALL(mRunner, run(StartsWith("sfdisk --dump"))).WillByDefault(Return(commandOk("label: dos\n")));

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run("echo 'size=16384, type=c' | sfdisk --append --force --no-reread '/dev/sdz'"));

    Provisioner provisioner(mRunner, mSettings);
    EXPECT_EQ(provisioner.createAnswerPartition(mDevice, mConfig).placement, Placement::Partition);
}

TEST_F(AnswerPartitionTest, UnreadableTableDegradesWithoutAppending) {
    prepareRoomyDevice();
    ON_CALL(mRunner, run(StartsWith("sfdisk --dump"))).WillByDefault(Return(commandFailed(1, "no table")));

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    EXPECT_CALL(mRunner, run(HasSubstr("sfdisk --append"))).Times(0);

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_TRUE(result.degraded);
    EXPECT_THAT(result.reason, HasSubstr("Unsupported partition table"));
}

TEST_F(AnswerPartitionTest, MountFailureRemovesTheLabelledVolume) {
    prepareRoomyDevice();
    ON_CALL(mRunner, run(StartsWith("mount '/dev/sdz2' "))).WillByDefault(Return(commandFailed(32, "busy")));

    EXPECT_CALL(mRunner, run(_)).Times(AnyNumber());
    {
        InSequence order;
        EXPECT_CALL(mRunner, run("mkfs.vfat -F 32 -n 'PROXMOX-AIS' '/dev/sdz2'"));
        EXPECT_CALL(mRunner, run(StartsWith("mount '/dev/sdz2' ")));
        EXPECT_CALL(mRunner, run("wipefs -a '/dev/sdz2'"));
        EXPECT_CALL(mRunner, run("sfdisk --delete '/dev/sdz' 2"));
    }

    Provisioner provisioner(mRunner, mSettings);
    PartitionResult result = provisioner.createAnswerPartition(mDevice, mConfig);

    EXPECT_EQ(result.placement, Placement::SideChannel);
    EXPECT_TRUE(result.degraded);
    EXPECT_THAT(result.reason, HasSubstr("Cannot mount /dev/sdz2"));
    EXPECT_EQ(mOutput.read("answer.toml"), mConfig.render());
}

TEST_F(AnswerPartitionTest, OnlyFat32VolumesAreFormatted) {
    EXPECT_CALL(mRunner, run(_)).Times(0);

    EXPECT_THROW(FilesystemSupport::formatPartition(mRunner, "/dev/sdz2", FilesystemSupport::FSType::EXT4),
                 FilesystemError);
}
