//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <span>
#include "fibrechannel/connection_descriptor.h"
#include "shared/property_handler.h"

namespace fcconnect_parser
{

void Banner(bool);
property_map ParseArguments(span<char*>, bool&, vector<string>&);
ConnectionDescriptor CreateDescriptor(const string&, const string&, const string&, const string&);

}
