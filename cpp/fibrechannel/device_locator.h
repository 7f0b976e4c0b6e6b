//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include "multipath_resolver.h"

// The raw device and its device mapper parent, each of them may be empty
struct DiskMatch
{
    string disk;
    string multipath;
};

class DeviceLocator
{

public:

    DeviceLocator(const FileSystem &f, logger &l) : file_system(f), locator_logger(l), resolver(f, l)
    {
    }

    DiskMatch FindByWwn(const string&, const string&) const;
    DiskMatch FindByWwid(const string&) const;

    static constexpr const char *BY_PATH = "/dev/disk/by-path/";
    static constexpr const char *BY_ID = "/dev/disk/by-id/";

private:

    DiskMatch ResolveCandidate(const string&) const;

    vector<string> ListLinks(const string&) const;

    const FileSystem &file_system;

    logger &locator_logger;

    MultipathResolver resolver;
};
