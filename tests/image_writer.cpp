#include <csignal>
#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "lib/errors.hpp"
#include "lib/image_writer.hpp"

#include "mocks/commandrunnermock.hpp"
#include "utils/tempdir.hpp"

using namespace testing;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ImageWriterTest : public Test {
protected:
    void SetUp() override {
        ON_CALL(mRunner, run(_)).WillByDefault(Return(commandOk()));
        mMounts = mDir.write("mounts", "");
        mTarget = mDir.write("target", "");
    }

    std::string makeImage(size_t bytes) {
        std::string data(bytes, '\0');
        for (size_t i = 0; i < bytes; ++i) {
            data[i] = static_cast<char>((i * 31 + 7) % 251);
        }
        return mDir.write("image.iso", data);
    }

    ::TempDir mDir;
    std::string mMounts;
    std::string mTarget;
    NiceMock<MockCommandRunner> mRunner;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ImageWriterTest, CopiesImageInChunksAndReturnsDeviceOnline) {
    const size_t size = 3 * 1024 * 1024 + 123;
    std::string image = makeImage(size);

    DeviceStateMachine device(mRunner, mTarget, mMounts);
    ImagingOperation op;
    op.imagePath = image;
    op.devicePath = mTarget;
    op.chunkSize = 1024 * 1024;

    ImageWriter::writeImage(op, device);

    EXPECT_EQ(op.progress.done, size);
    EXPECT_EQ(op.progress.total, size);
    EXPECT_DOUBLE_EQ(op.progress.fraction(), 1.0);
    EXPECT_EQ(device.state(), DeviceStateMachine::State::Online);
    EXPECT_EQ(mDir.read("target"), mDir.read("image.iso"));
}

TEST_F(ImageWriterTest, MissingImageFailsBeforeTouchingTheDevice) {
    EXPECT_CALL(mRunner, run(_)).Times(0);

    DeviceStateMachine device(mRunner, mTarget, mMounts);
    ImagingOperation op;
    op.imagePath = mDir.path("missing.iso");
    op.devicePath = mTarget;

    EXPECT_THROW(ImageWriter::writeImage(op, device), FileError);
    EXPECT_EQ(device.state(), DeviceStateMachine::State::Unknown);
}

TEST_F(ImageWriterTest, WriteFailureBringsDeviceBackOnline) {
    std::string image = makeImage(4096);

    DeviceStateMachine device(mRunner, mTarget, mMounts);
    device.releaseLocks();
    device.prepare();
    device.takeOffline();

    ImagingOperation op;
    op.imagePath = image;
    op.devicePath = mTarget;

    int input = open(image.c_str(), O_RDONLY);
    ASSERT_GE(input, 0);
    ProgressBar bar("test");

    // Reading end of a closed pipe pair: every write fails.
    int pipeFds[2];
    ASSERT_EQ(pipe(pipeFds), 0);
    close(pipeFds[0]);
    signal(SIGPIPE, SIG_IGN);

    EXPECT_THROW(ImageWriter::copyStream(input, pipeFds[1], op, bar), DeviceError);

    close(pipeFds[1]);
    close(input);
    device.bringOnline();
    EXPECT_EQ(device.state(), DeviceStateMachine::State::Online);
}

TEST_F(ImageWriterTest, DetectsImageLayouts) {
    std::string data(40000, '\0');
    data[510] = static_cast<char>(0x55);
    data[511] = static_cast<char>(0xAA);
    data.replace(32769, 5, "CD001");
    EXPECT_EQ(ImageWriter::detectImageType(mDir.write("hybrid.iso", data)), "Hybrid ISO (MBR + ISO 9660)");

    data[510] = 0;
    EXPECT_EQ(ImageWriter::detectImageType(mDir.write("pure.iso", data)), "Pure ISO 9660");

    EXPECT_EQ(ImageWriter::detectImageType(mDir.write("blank.img", std::string(1024, '\0'))),
              "Unknown/Non-standard image");
}

TEST_F(ImageWriterTest, ImageSize) {
    EXPECT_EQ(ImageWriter::getImageSize(makeImage(777)), 777u);
    EXPECT_THROW(ImageWriter::getImageSize(mDir.path("nope")), FileError);
}
