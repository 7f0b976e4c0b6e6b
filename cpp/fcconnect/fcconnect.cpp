//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fcconnect_core.h"
#include <vector>

int main(int argc, char *argv[])
{
    vector<char*> args(argv, argv + argc);

    return FcConnect().Run(args);
}
