//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fc_connector.h"
#include "shared/fc_exceptions.h"
#include "shared/fc_util.h"
#include "fc_path.h"
#include "os_file_system.h"

using namespace fc_path;
using namespace fc_util;

FcConnector::FcConnector(logger &l) : os_file_system(make_unique<OsFileSystem>()), file_system(*os_file_system),
    connector_logger(l), locator(file_system, l), resolver(file_system, l), rescanner(file_system, l)
{
}

FcConnector::FcConnector(const FileSystem &f, logger &l) : file_system(f), connector_logger(l), locator(f, l),
    resolver(f, l), rescanner(f, l)
{
}

string FcConnector::Attach(const ConnectionDescriptor &descriptor) const
{
    connector_logger.info("Attaching Fibre Channel volume '{}'", descriptor.volume_name);

    const auto& [disk, multipath] = SearchDisk(descriptor);

    // A device mapper device has precedence over the raw disk
    if (!multipath.empty()) {
        connector_logger.info("Found multipath device '{}'", multipath);
        return multipath;
    }

    if (!disk.empty()) {
        connector_logger.info("Found disk '{}'", disk);
        return disk;
    }

    connector_logger.info("Can't find a disk for the given WWNs or WWIDs");

    throw NotFoundException(
        descriptor.target_wwns.empty() ?
            fmt::format("No Fibre Channel disk found for WWIDs {}", Join(descriptor.wwids)) :
            fmt::format("No Fibre Channel disk found for WWNs {0}, LUN {1}", Join(descriptor.target_wwns),
                descriptor.lun));
}

DiskMatch FcConnector::SearchDisk(const ConnectionDescriptor &descriptor) const
{
    const auto &ids = descriptor.target_wwns.empty() ? descriptor.wwids : descriptor.target_wwns;

    DiskMatch result;

    // First search the existing devices. If there is no multipath device rescan the SCSI bus and search again.
    bool rescanned = false;
    while (true) {
        for (const auto &id : ids) {
            const auto& [disk, multipath] = Probe(descriptor, id);

            if (!disk.empty()) {
                result.disk = disk;
            }

            if (!multipath.empty()) {
                result.multipath = multipath;
                break;
            }
        }

        if (rescanned || !result.multipath.empty()) {
            break;
        }

        Rescan();
        rescanned = true;
    }

    return result;
}

DiskMatch FcConnector::Probe(const ConnectionDescriptor &descriptor, const string &id) const
{
    return descriptor.target_wwns.empty() ? locator.FindByWwid(id) : locator.FindByWwn(id, descriptor.lun);
}

void FcConnector::Rescan() const
{
    try {
        if (const auto& [attempted, failed] = rescanner.RescanAllHosts(); failed) {
            connector_logger.warn("Rescan failed for {0} of {1} SCSI host(s)", failed, attempted);
        }
    }
    catch (const IoException &e) {
        // The search is repeated anyway, in case the devices showed up in the meantime
        connector_logger.error("Can't rescan the SCSI bus: {}", e.what());
    }
}

void FcConnector::Detach(const string &device_path) const
{
    connector_logger.info("Detaching Fibre Channel volume '{}'", device_path);

    const string &dst_path = file_system.EvalSymlinks(device_path);

    vector<string> devices;
    if (dst_path.starts_with(DM_PATH_PREFIX)) {
        devices = resolver.FindSlaveDevices(dst_path);
    }
    else {
        devices.push_back(dst_path);
    }

    connector_logger.info("Device path: '{0}', resolved path: '{1}', devices: {2}", device_path, dst_path,
        Join(devices));

    string last_device;
    string last_error;
    removal_error last_kind = removal_error::io;

    // Every device is tried even if removing a previous one failed
    for (const auto &device : devices) {
        try {
            DetachDisk(device);
        }
        catch (const InvalidPathException &e) {
            connector_logger.error("Can't detach '{0}': {1}", device, e.what());
            last_device = device;
            last_error = e.what();
            last_kind = removal_error::invalid_path;
        }
        catch (const IoException &e) {
            connector_logger.error("Can't detach '{0}': {1}", device, e.what());
            last_device = device;
            last_error = e.what();
            last_kind = removal_error::io;
        }
    }

    if (!last_device.empty()) {
        connector_logger.error("Last error while detaching '{0}': '{1}': {2}", device_path, last_device, last_error);
        throw RemovalException(last_device, last_error, last_kind);
    }
}

void FcConnector::DetachDisk(const string &device) const
{
    const string &delete_path = MultipathResolver::SYS_BLOCK + GetLeafName(device) + "/device/delete";

    connector_logger.info("Removing device from SCSI subsystem: '{}'", delete_path);

    file_system.WriteFile(delete_path, "1", FileSystem::TRIGGER_PERMISSIONS);
}
