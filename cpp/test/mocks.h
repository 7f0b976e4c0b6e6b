//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <gmock/gmock.h>
#include "fibrechannel/file_system.h"
#include "test_shared.h"

using namespace testing;

class MockFileSystem : public FileSystem
{

public:

    MOCK_METHOD(vector<string>, ReadDir, (const string&), (const, override));
    MOCK_METHOD(bool, Lstat, (const string&), (const, override));
    MOCK_METHOD(string, EvalSymlinks, (const string&), (const, override));
    MOCK_METHOD(void, WriteFile, (const string&, const string&, filesystem::perms), (const, override));

    // Calls not matching a more specific expectation fall back to the ON_CALL defaults
    void AllowAnyCall()
    {
        EXPECT_CALL(*this, ReadDir).Times(AnyNumber());
        EXPECT_CALL(*this, Lstat).Times(AnyNumber());
        EXPECT_CALL(*this, EvalSymlinks).Times(AnyNumber());
        EXPECT_CALL(*this, WriteFile).Times(AnyNumber());
    }
};
