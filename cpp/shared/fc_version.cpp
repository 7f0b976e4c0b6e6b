//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fc_version.h"

const int fc_major_version = 1;
const int fc_minor_version = 0;
const int fc_revision = 0;
const std::string fc_suffix = "-devel";
