//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "property_handler.h"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "fc_exceptions.h"
#include "fc_util.h"

using namespace filesystem;
using namespace fc_util;

void PropertyHandler::Init(const string &filenames, const property_map &cmd_properties, bool ignore_conf)
{
    // A clear property cache helps with unit testing because Init() can be called for different files
    property_cache.clear();
    unknown_properties.clear();

    property_map properties;

    // Parse the optional global property file unless disabled
    if (!ignore_conf && exists(path(CONFIGURATION))) {
        ParsePropertyFile(properties, CONFIGURATION, true);
    }

    for (const auto &filename : SplitList(filenames)) {
        ParsePropertyFile(properties, filename, false);
    }

    // Merge properties from property files and from the command line, giving the command line priority
    for (const auto& [key, value] : cmd_properties) {
        properties[key] = value;
    }

    for (const auto& [key, value] : properties) {
        AddProperty(key, value);
    }
}

void PropertyHandler::ParsePropertyFile(property_map &properties, const string &filename, bool default_file)
{
    ifstream property_file(filename);
    if (property_file.fail()) {
        // Only report an error if an explicitly specified file is missing
        if (default_file) {
            return;
        }
        throw ParserException(fmt::format("No property file '{}'", filename));
    }

    string property;
    while (getline(property_file, property)) {
        property = Trim(property);

        if (!property.empty() && !property.starts_with("#")) {
            const vector<string> kv = Split(property, '=', 2);
            if (kv.size() < 2 || Trim(kv[0]).empty()) {
                throw ParserException(fmt::format("Invalid property '{0}' in '{1}'", property, filename));
            }

            properties[Trim(kv[0])] = Trim(kv[1]);
        }
    }

    if (property_file.bad()) {
        throw ParserException(fmt::format("Error reading from property file '{}'", filename));
    }
}

property_map PropertyHandler::GetProperties() const
{
    return property_cache;
}

const property_map& PropertyHandler::GetUnknownProperties() const
{
    return unknown_properties;
}

string PropertyHandler::RemoveProperty(const string &key, const string &def)
{
    if (const auto &it = property_cache.find(key); it != property_cache.end()) {
        unknown_properties.erase(key);
        return it->second;
    }

    return def;
}

void PropertyHandler::AddProperty(const string &key, const string &value)
{
    property_cache[key] = value;
    unknown_properties[key] = value;
}
