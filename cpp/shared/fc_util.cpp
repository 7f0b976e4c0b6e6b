//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fc_util.h"
#include <cassert>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "fc_version.h"

using namespace spdlog;

string fc_util::GetVersionString()
{
    const string &revision = fc_revision <= 0 ? "" : "." + to_string(fc_revision);
    return fmt::format("{0}.{1}{2}{3}", fc_major_version, fc_minor_version, revision, fc_suffix);
}

vector<string> fc_util::Split(const string &s, char separator, int limit)
{
    assert(limit >= 0);

    string component;
    vector<string> result;
    stringstream str(s);

    while (--limit > 0 && getline(str, component, separator)) {
        result.push_back(component);
    }

    if (!str.eof()) {
        getline(str, component);
        result.push_back(component);
    }

    return result;
}

vector<string> fc_util::SplitList(const string &list)
{
    vector<string> result;

    // Blank entries like in "a,,b" or "a, " are dropped
    for (const auto &element : Split(list, LIST_SEPARATOR)) {
        if (const string &e = Trim(element); !e.empty()) {
            result.push_back(e);
        }
    }

    return result;
}

string fc_util::Trim(const string &s)
{
    const size_t first = s.find_first_not_of(" \t\r");
    if (first == string::npos) {
        return "";
    }
    const size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, (last - first + 1));
}

bool fc_util::GetAsUnsignedInt(const string &value, int &result)
{
    if (value.empty() || value.find_first_not_of("0123456789") != string::npos) {
        return false;
    }

    try {
        const unsigned long v = stoul(value);
        if (v > static_cast<unsigned long>(numeric_limits<int>::max())) {
            return false;
        }
        result = static_cast<int>(v);
    }
    catch (const invalid_argument&) {
        return false;
    }
    catch (const out_of_range&) {
        return false;
    }

    return true;
}

bool fc_util::SetLogLevel(logger &logger, const string &log_level)
{
    // Default spdlog format without the timestamp
    logger.set_pattern("[%^%l%$] [%n] %v");

    if (log_level.empty()) {
        return true;
    }

    // Compensate for spdlog using 'off' for unknown levels
    if (const level::level_enum level = level::from_str(log_level); to_string_view(level) == log_level) {
        logger.set_level(level);
        return true;
    }

    return false;
}

shared_ptr<logger> fc_util::CreateLogger(const string &name)
{
    // Handling duplicate names is in particular required by the unit tests
    auto l = spdlog::get(name);
    if (!l) {
        // stdout is reserved for results, e.g. the device path reported by 'fcconnect attach'
        l = stderr_color_st(name);
    }

    return l;
}
