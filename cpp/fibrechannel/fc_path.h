//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <string>

using namespace std;

namespace fc_path
{

static constexpr const char *DEV = "/dev/";
static constexpr const char *DM_PREFIX = "dm-";

// Returns "sdx" for "/dev/sdx", throws InvalidPathException for any other shape
string ParseRawDeviceName(const string&);

// Returns "dm-N" for "/dev/dm-N", or an empty string for any other shape
string ParseMultipathLeaf(const string&);

// Returns the last component of a path starting with /dev/, throws InvalidPathException
string GetLeafName(const string&);

}
