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

struct RescanResult
{
    int attempted;
    int failed;
};

class BusRescanner
{

public:

    BusRescanner(const FileSystem &f, logger &l) : file_system(f), rescanner_logger(l)
    {
    }

    RescanResult RescanAllHosts() const;

    static constexpr const char *SCSI_HOST = "/sys/class/scsi_host/";

    // Wildcards for channel, target ID and LUN
    static constexpr const char *SCAN_ALL = "- - -";

private:

    const FileSystem &file_system;

    logger &rescanner_logger;
};
