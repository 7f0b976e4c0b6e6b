//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <stdexcept>
#include <string>

using namespace std;

class ParserException final : public runtime_error
{
    using runtime_error::runtime_error;
};

class IoException final : public runtime_error
{
    using runtime_error::runtime_error;
};

class InvalidPathException final : public runtime_error
{
    using runtime_error::runtime_error;
};

class NotFoundException final : public runtime_error
{
    using runtime_error::runtime_error;
};

enum class removal_error
{
    io,
    invalid_path
};

// Reports the last of possibly several failed SCSI device removals
class RemovalException final : public runtime_error
{
    string device;
    removal_error error;

public:

    RemovalException(const string &d, const string &cause, removal_error e = removal_error::io)
    : runtime_error("Can't remove '" + d + "': " + cause), device(d), error(e)
    {
    }
    ~RemovalException() override = default;

    const string& GetDevice() const
    {
        return device;
    }
    removal_error GetError() const
    {
        return error;
    }
};
