//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <string>

extern const int fc_major_version;
extern const int fc_minor_version;
extern const int fc_revision;
// Version suffix, usually indicating a development version
extern const std::string fc_suffix;
