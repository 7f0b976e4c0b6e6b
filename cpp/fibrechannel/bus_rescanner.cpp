//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "bus_rescanner.h"
#include "shared/fc_exceptions.h"

RescanResult BusRescanner::RescanAllHosts() const
{
    RescanResult result = { };

    // Only a failure to list the hosts is reported to the caller
    for (const auto &host : file_system.ReadDir(SCSI_HOST)) {
        ++result.attempted;

        const string &scan = SCSI_HOST + host + "/scan";
        try {
            file_system.WriteFile(scan, SCAN_ALL, FileSystem::TRIGGER_PERMISSIONS);
            rescanner_logger.trace("Triggered rescan of SCSI host '{}'", host);
        }
        catch (const IoException &e) {
            ++result.failed;
            rescanner_logger.warn(e.what());
        }
    }

    rescanner_logger.debug("Rescanned {0} SCSI host(s), {1} failed", result.attempted, result.failed);

    return result;
}
