//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <string>
#include <vector>

using namespace std;

// If there are target WWNs the WWIDs are ignored
struct ConnectionDescriptor
{
    string volume_name;
    vector<string> target_wwns;
    string lun;
    vector<string> wwids;
};
