//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "device_locator.h"
#include "shared/fc_exceptions.h"
#include "fc_path.h"

using namespace fc_path;

DiskMatch DeviceLocator::FindByWwn(const string &wwn, const string &lun) const
{
    // by-path entries may carry additional suffixes like "-part1"
    const string &fragment = "-fc-0x" + wwn + "-lun-" + lun;

    for (const auto &name : ListLinks(BY_PATH)) {
        if (name.find(fragment) == string::npos) {
            continue;
        }

        try {
            return ResolveCandidate(BY_PATH + name);
        }
        catch (const IoException &e) {
            locator_logger.warn(e.what());
        }
        catch (const InvalidPathException &e) {
            locator_logger.warn(e.what());
        }
    }

    locator_logger.debug("No disk found for WWN {0}, LUN {1}", wwn, lun);

    return {};
}

DiskMatch DeviceLocator::FindByWwid(const string &wwid) const
{
    // WWIDs containing white space are exposed under by-id with underscores,
    // e.g. scsi-3600508b400105e210000900000490000 or scsi-<VENDOR NAME>_<IDENTIFIER NUMBER>
    const string &link_name = "scsi-" + wwid;

    for (const auto &name : ListLinks(BY_ID)) {
        if (name != link_name) {
            continue;
        }

        try {
            return ResolveCandidate(BY_ID + name);
        }
        catch (const IoException &e) {
            locator_logger.error("Can't find a disk for symlink '{0}{1}': {2}", BY_ID, name, e.what());
            return {};
        }
        catch (const InvalidPathException &e) {
            locator_logger.error("Can't find a disk for symlink '{0}{1}': {2}", BY_ID, name, e.what());
            return {};
        }
    }

    locator_logger.error("Can't find a disk '{0}{1}'", BY_ID, link_name);

    return {};
}

DiskMatch DeviceLocator::ResolveCandidate(const string &link) const
{
    DiskMatch match;

    match.disk = file_system.EvalSymlinks(link);
    const string &name = ParseRawDeviceName(match.disk);

    locator_logger.trace("'{0}' resolves to '{1}'", link, match.disk);

    // A failing multipath lookup does not invalidate the raw disk
    try {
        match.multipath = resolver.FindMultipathParent(name);
    }
    catch (const IoException &e) {
        locator_logger.warn("Can't check '{0}' for a multipath parent: {1}", match.disk, e.what());
    }

    return match;
}

vector<string> DeviceLocator::ListLinks(const string &dir) const
{
    // The by-path and by-id folders only exist when there are matching devices
    try {
        return file_system.ReadDir(dir);
    }
    catch (const IoException &e) {
        locator_logger.debug(e.what());
    }

    return {};
}
