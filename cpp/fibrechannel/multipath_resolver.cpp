//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "multipath_resolver.h"
#include "shared/fc_exceptions.h"
#include "fc_path.h"

using namespace fc_path;

string MultipathResolver::FindMultipathParent(const string &disk) const
{
    // Errors while listing /sys/block/ are passed on to the caller
    for (const auto &name : file_system.ReadDir(SYS_BLOCK)) {
        if (name.starts_with(DM_PREFIX) && file_system.Lstat(SYS_BLOCK + name + SLAVES + disk)) {
            resolver_logger.debug("'{0}' is a slave of multipath device '{1}'", disk, name);
            return DEV + name;
        }
    }

    resolver_logger.trace("'{}' is not part of a multipath device", disk);

    return "";
}

string MultipathResolver::FindMultipathDeviceForDevice(const string &device_path) const
{
    return FindMultipathParent(ParseRawDeviceName(file_system.EvalSymlinks(device_path)));
}

vector<string> MultipathResolver::FindSlaveDevices(const string &dm_path) const
{
    vector<string> devices;

    const string &disk = ParseMultipathLeaf(dm_path);
    if (disk.empty()) {
        resolver_logger.warn("'{}' is not a multipath device path", dm_path);
        return devices;
    }

    const string &slaves_path = SYS_BLOCK + disk + SLAVES;
    try {
        for (const auto &name : file_system.ReadDir(slaves_path)) {
            devices.push_back(DEV + name);
        }
    }
    catch (const IoException &e) {
        // No slaves are discoverable, this is not an error
        resolver_logger.debug(e.what());
    }

    return devices;
}
