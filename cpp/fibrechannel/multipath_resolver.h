//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <spdlog/spdlog.h>
#include "file_system.h"

using namespace spdlog;

class MultipathResolver
{

public:

    MultipathResolver(const FileSystem &f, logger &l) : file_system(f), resolver_logger(l)
    {
    }

    string FindMultipathParent(const string&) const;
    string FindMultipathDeviceForDevice(const string&) const;
    vector<string> FindSlaveDevices(const string&) const;

    static constexpr const char *SYS_BLOCK = "/sys/block/";
    static constexpr const char *SLAVES = "/slaves/";

private:

    const FileSystem &file_system;

    logger &resolver_logger;
};
