//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fc_path.h"
#include <spdlog/spdlog.h>
#include "shared/fc_exceptions.h"
#include "shared/fc_util.h"

using namespace fc_util;

namespace
{

// Only shallow paths like /dev/sdx are accepted, i.e. "", "dev", "sdx"
string GetShallowDeviceName(const string &device_path)
{
    if (device_path.ends_with('/')) {
        return "";
    }

    const auto &components = Split(device_path, '/');
    if (components.size() != 3 || !components[0].empty() || !components[1].starts_with("dev")
        || components[2].empty()) {
        return "";
    }

    return components[2];
}

}

string fc_path::ParseRawDeviceName(const string &device_path)
{
    const string &name = GetShallowDeviceName(device_path);
    if (name.empty()) {
        throw InvalidPathException(fmt::format("Illegal path for device '{}'", device_path));
    }

    return name;
}

string fc_path::ParseMultipathLeaf(const string &dm_path)
{
    return GetShallowDeviceName(dm_path);
}

string fc_path::GetLeafName(const string &device_path)
{
    if (!device_path.starts_with(DEV)) {
        throw InvalidPathException(fmt::format("Invalid device name '{}'", device_path));
    }

    const string &leaf = device_path.substr(device_path.find_last_of('/') + 1);
    if (leaf.empty()) {
        throw InvalidPathException(fmt::format("Invalid device name '{}'", device_path));
    }

    return leaf;
}
