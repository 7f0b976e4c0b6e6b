//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <filesystem>
#include <string>
#include <vector>

using namespace std;

// All host access of the attach and detach logic goes through this interface.
// Implementations must not keep state between calls.
class FileSystem
{

public:

    virtual ~FileSystem() = default;

    // rw-rw-rw-, used for the sysfs trigger files
    static constexpr filesystem::perms TRIGGER_PERMISSIONS = filesystem::perms::owner_read
        | filesystem::perms::owner_write | filesystem::perms::group_read | filesystem::perms::group_write
        | filesystem::perms::others_read | filesystem::perms::others_write;

    // Returns the names of the directory entries, throws IoException
    virtual vector<string> ReadDir(const string&) const = 0;

    // Returns true if the entry itself exists, a dangling symlink counts as existing
    virtual bool Lstat(const string&) const = 0;

    // Returns the absolute path with all symlinks resolved, throws IoException
    virtual string EvalSymlinks(const string&) const = 0;

    // Throws IoException
    virtual void WriteFile(const string&, const string&, filesystem::perms) const = 0;
};
