//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "mocks.h"
#include "fibrechannel/bus_rescanner.h"
#include "shared/fc_exceptions.h"

TEST(BusRescannerTest, RescanAllHosts)
{
    NiceMock<MockFileSystem> file_system;
    const BusRescanner rescanner(file_system, GetTestLogger());

    EXPECT_CALL(file_system, ReadDir("/sys/class/scsi_host/")).WillOnce(Return(vector<string> { "host0", "host1",
        "host2" }));
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host0/scan", "- - -", FileSystem::TRIGGER_PERMISSIONS));
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host1/scan", "- - -", FileSystem::TRIGGER_PERMISSIONS));
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host2/scan", "- - -", FileSystem::TRIGGER_PERMISSIONS));

    const auto [attempted, failed] = rescanner.RescanAllHosts();
    EXPECT_EQ(3, attempted);
    EXPECT_EQ(0, failed);
}

TEST(BusRescannerTest, RescanAllHosts_WriteFails)
{
    NiceMock<MockFileSystem> file_system;
    const BusRescanner rescanner(file_system, GetTestLogger());

    EXPECT_CALL(file_system, ReadDir("/sys/class/scsi_host/")).WillOnce(Return(vector<string> { "host0", "host1",
        "host2" }));
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host0/scan", "- - -", _));
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host1/scan", "- - -", _)).WillOnce(
        Throw(IoException("Permission denied")));
    // The remaining hosts are still rescanned
    EXPECT_CALL(file_system, WriteFile("/sys/class/scsi_host/host2/scan", "- - -", _));

    const auto [attempted, failed] = rescanner.RescanAllHosts();
    EXPECT_EQ(3, attempted);
    EXPECT_EQ(1, failed);
}

TEST(BusRescannerTest, RescanAllHosts_NoHosts)
{
    NiceMock<MockFileSystem> file_system;
    const BusRescanner rescanner(file_system, GetTestLogger());

    EXPECT_CALL(file_system, ReadDir("/sys/class/scsi_host/")).WillOnce(Return(vector<string> { }));
    EXPECT_CALL(file_system, WriteFile).Times(0);

    const auto [attempted, failed] = rescanner.RescanAllHosts();
    EXPECT_EQ(0, attempted);
    EXPECT_EQ(0, failed);
}

TEST(BusRescannerTest, RescanAllHosts_ListingFails)
{
    NiceMock<MockFileSystem> file_system;
    const BusRescanner rescanner(file_system, GetTestLogger());

    EXPECT_CALL(file_system, ReadDir("/sys/class/scsi_host/")).WillOnce(Throw(IoException("No such file")));
    EXPECT_CALL(file_system, WriteFile).Times(0);

    EXPECT_THROW(rescanner.RescanAllHosts(), IoException);
}
