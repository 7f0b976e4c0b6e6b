//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include "file_system.h"

class OsFileSystem final : public FileSystem
{

public:

    vector<string> ReadDir(const string&) const override;
    bool Lstat(const string&) const override;
    string EvalSymlinks(const string&) const override;
    void WriteFile(const string&, const string&, filesystem::perms) const override;
};
