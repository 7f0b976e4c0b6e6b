//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#pragma once

#include <map>
#include <string>
#include <vector>

using namespace std;

using property_map = map<string, string, less<>>;

class PropertyHandler
{

public:

    static constexpr const char *CONFIGURATION = "/etc/fcconnect.conf";

    static constexpr const char *LOG_LEVEL = "log_level";
    static constexpr const char *LOG_PATTERN = "log_pattern";
    static constexpr const char *PROPERTY_FILES = "property_files";
    static constexpr const char *VOLUME_NAME = "volume_name";
    static constexpr const char *TARGET_WWNS = "target_wwns";
    static constexpr const char *LUN = "lun";
    static constexpr const char *WWIDS = "wwids";

    static PropertyHandler& GetInstance()
    {
        static PropertyHandler instance; // NOSONAR instance cannot be inlined
        return instance;
    }

    void Init(const string&, const property_map&, bool);

    property_map GetProperties() const;
    const property_map& GetUnknownProperties() const;
    string RemoveProperty(const string&, const string& = "");

private:

    PropertyHandler() = default;

    void AddProperty(const string&, const string&);

    static void ParsePropertyFile(property_map&, const string&, bool);

    property_map property_cache;

    property_map unknown_properties;
};
