//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <span>
#include <spdlog/spdlog.h>
#include "fibrechannel/connection_descriptor.h"
#include "fibrechannel/file_system.h"

class FcConnector;

using namespace spdlog;

class FcConnect final
{

public:

    FcConnect() = default;
    // For testing, if not set the host file system is used
    explicit FcConnect(const FileSystem &f) : file_system(&f)
    {
    }

    int Run(span<char*>);

private:

    bool ParseArguments(span<char*>);

    int Attach() const;
    int Detach() const;

    unique_ptr<FcConnector> CreateConnector() const;

    const FileSystem *file_system = nullptr;

    shared_ptr<logger> fc_logger;

    string command;

    string device;

    ConnectionDescriptor descriptor;
};
