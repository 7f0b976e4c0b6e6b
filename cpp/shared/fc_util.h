//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

using namespace std;

namespace fc_util
{

// Separator for lists of WWNs, WWIDs and property files
static constexpr char LIST_SEPARATOR = ',';

string Join(const auto &collection, const string &separator = ", ")
{
    // Using a stream (and not a string) is required in order to correctly convert the element data
    ostringstream s;

    for (const auto &element : collection) {
        if (s.tellp()) {
            s << separator;
        }

        s << element;
    }

    return s.str();
}

string GetVersionString();
vector<string> Split(const string&, char, int = numeric_limits<int>::max());
vector<string> SplitList(const string&);
string Trim(const string&);
bool GetAsUnsignedInt(const string&, int&);

bool SetLogLevel(spdlog::logger&, const string&);
shared_ptr<spdlog::logger> CreateLogger(const string&);

}
