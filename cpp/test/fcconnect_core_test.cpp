//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "mocks.h"
#include "fcconnect/fcconnect_core.h"
#include "shared/fc_exceptions.h"

static int RunFcConnect(const FileSystem &file_system, vector<string> a)
{
    a.insert(a.begin(), { "fcconnect", "--ignore-conf", "--log-level", "off" });
    auto args = CreateArgs(a);
    return FcConnect(file_system).Run(args);
}

TEST(FcConnectTest, Attach)
{
    NiceMock<MockFileSystem> file_system;

    ON_CALL(file_system, ReadDir("/dev/disk/by-path/")).WillByDefault(Return(vector<string> {
        "pci-0000:05:00.0-fc-0x10000000c9a02834-lun-1" }));
    ON_CALL(file_system, EvalSymlinks("/dev/disk/by-path/pci-0000:05:00.0-fc-0x10000000c9a02834-lun-1")).WillByDefault(
        Return("/dev/sdb"));
    ON_CALL(file_system, ReadDir("/sys/block/")).WillByDefault(Return(vector<string> { "dm-7", "sdb" }));
    ON_CALL(file_system, Lstat("/sys/block/dm-7/slaves/sdb")).WillByDefault(Return(true));

    testing::internal::CaptureStdout();
    EXPECT_EQ(EXIT_SUCCESS, RunFcConnect(file_system, { "-w", "10000000c9a02834", "-l", "1", "attach" }));
    EXPECT_EQ("/dev/dm-7\n", testing::internal::GetCapturedStdout());

    testing::internal::CaptureStdout();
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "-w", "10000000c9a02835", "-l", "1", "attach" }));
    EXPECT_EQ("", testing::internal::GetCapturedStdout());
}

TEST(FcConnectTest, Attach_DefaultLogLevel)
{
    NiceMock<MockFileSystem> file_system;

    ON_CALL(file_system, ReadDir("/dev/disk/by-path/")).WillByDefault(Return(vector<string> {
        "pci-0000:05:00.0-fc-0x10000000c9a02834-lun-1" }));
    ON_CALL(file_system, EvalSymlinks("/dev/disk/by-path/pci-0000:05:00.0-fc-0x10000000c9a02834-lun-1")).WillByDefault(
        Return("/dev/sdb"));
    ON_CALL(file_system, ReadDir("/sys/block/")).WillByDefault(Return(vector<string> { "dm-7", "sdb" }));
    ON_CALL(file_system, Lstat("/sys/block/dm-7/slaves/sdb")).WillByDefault(Return(true));

    // Log output at the default level must not end up in the device path printed
    vector<string> a = { "fcconnect", "--ignore-conf", "-w", "10000000c9a02834", "-l", "1", "attach" };
    auto args = CreateArgs(a);
    testing::internal::CaptureStdout();
    EXPECT_EQ(EXIT_SUCCESS, FcConnect(file_system).Run(args));
    EXPECT_EQ("/dev/dm-7\n", testing::internal::GetCapturedStdout());
}

TEST(FcConnectTest, Detach)
{
    NiceMock<MockFileSystem> file_system;
    file_system.AllowAnyCall();

    ON_CALL(file_system, EvalSymlinks("/dev/mapper/mpatha")).WillByDefault(Return("/dev/dm-1"));
    ON_CALL(file_system, ReadDir("/sys/block/dm-1/slaves/")).WillByDefault(Return(vector<string> { "sdb", "sdc" }));
    EXPECT_CALL(file_system, WriteFile("/sys/block/sdb/device/delete", "1", _));
    EXPECT_CALL(file_system, WriteFile("/sys/block/sdc/device/delete", "1", _)).WillOnce(
        Throw(IoException("Permission denied")));

    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "detach", "/dev/mapper/mpatha" }));

    ON_CALL(file_system, EvalSymlinks("/dev/sdd")).WillByDefault(Return("/dev/sdd"));
    EXPECT_CALL(file_system, WriteFile("/sys/block/sdd/device/delete", "1", _));
    EXPECT_EQ(EXIT_SUCCESS, RunFcConnect(file_system, { "detach", "/dev/sdd" }));

    ON_CALL(file_system, EvalSymlinks("/dev/missing")).WillByDefault(Throw(IoException("No such file")));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "detach", "/dev/missing" }));
}

TEST(FcConnectTest, InvalidArguments)
{
    NiceMock<MockFileSystem> file_system;
    EXPECT_CALL(file_system, ReadDir).Times(0);
    EXPECT_CALL(file_system, EvalSymlinks).Times(0);
    EXPECT_CALL(file_system, WriteFile).Times(0);

    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "mount" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "attach" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "-w", "10000000c9a02834", "attach" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "-w", "10000000c9a02834", "-l", "one", "attach" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "-i", "3600508b400105e210000900000490000", "attach", "/dev/sdb" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "detach" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "--log-level", "verbose", "detach", "/dev/sdb" }));
    EXPECT_EQ(EXIT_FAILURE, RunFcConnect(file_system, { "-x", "detach", "/dev/sdb" }));
}
