//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <memory>
#include "bus_rescanner.h"
#include "connection_descriptor.h"
#include "device_locator.h"

class FcConnector
{

public:

    // Uses the host file system
    explicit FcConnector(logger&);
    FcConnector(const FileSystem&, logger&);

    // Returns the device path to mount, throws NotFoundException
    string Attach(const ConnectionDescriptor&) const;

    // Removes all SCSI devices backing the device path, throws IoException or RemovalException
    void Detach(const string&) const;

    static constexpr const char *DM_PATH_PREFIX = "/dev/dm-";

private:

    DiskMatch SearchDisk(const ConnectionDescriptor&) const;
    DiskMatch Probe(const ConnectionDescriptor&, const string&) const;
    void Rescan() const;

    void DetachDisk(const string&) const;

    // Only set if the host file system is used
    unique_ptr<FileSystem> os_file_system;

    const FileSystem &file_system;

    logger &connector_logger;

    DeviceLocator locator;

    MultipathResolver resolver;

    BusRescanner rescanner;
};
