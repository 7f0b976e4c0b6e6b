//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fcconnect_parser.h"
#include <cstdlib>
#include <iostream>
#include <unordered_map>
#include <getopt.h>
#include <spdlog/spdlog.h>
#include "shared/fc_exceptions.h"
#include "shared/fc_util.h"

using namespace fc_util;

void fcconnect_parser::Banner(bool usage)
{
    cout << "Fibre Channel Volume Attach and Detach Tool FcConnect\n"
        << "Version " << GetVersionString() << "\n"
        << "Copyright (C) 2025 The FcConnect Authors\n";

    if (usage) {
        cout << "Usage: fcconnect [options] attach\n"
            << "       fcconnect [options] detach DEVICE\n"
            << "  --wwn/-w WWN[,WWN...]       Target WWN(s), without the leading '0x'.\n"
            << "  --lun/-l LUN                LUN of the volume, required with --wwn.\n"
            << "  --wwid/-i WWID[,WWID...]    WWID(s), only used if there is no WWN.\n"
            << "  --volume-name/-n NAME       Optional volume name for logging.\n"
            << "  --property-files/-P FILES   List of configuration property files.\n"
            << "  --ignore-conf               Ignore /etc/fcconnect.conf.\n"
            << "  --log-level/-L LEVEL        Log level (trace|debug|info|warning|error|\n"
            << "                              critical|off), default is 'info'.\n"
            << "  --log-pattern PATTERN       The spdlog pattern to use for logging.\n"
            << "  --version/-v                Display the program version.\n"
            << "  --help/-h                   Display this help.\n"
            << "  attach prints the device path to mount, a multipath device if there is one.\n"
            << "  detach removes the SCSI devices backing DEVICE from the system.\n";
    }
}

property_map fcconnect_parser::ParseArguments(span<char*> args, bool &ignore_conf, vector<string> &operands) // NOSONAR Acceptable complexity for parsing
{
    const int OPT_IGNORE_CONF = 2;
    const int OPT_LOG_PATTERN = 3;

    const vector<option> options = {
        { "help", no_argument, nullptr, 'h' },
        { "ignore-conf", no_argument, nullptr, OPT_IGNORE_CONF },
        { "log-level", required_argument, nullptr, 'L' },
        { "log-pattern", required_argument, nullptr, OPT_LOG_PATTERN },
        { "lun", required_argument, nullptr, 'l' },
        { "property-files", required_argument, nullptr, 'P' },
        { "version", no_argument, nullptr, 'v' },
        { "volume-name", required_argument, nullptr, 'n' },
        { "wwid", required_argument, nullptr, 'i' },
        { "wwn", required_argument, nullptr, 'w' },
        { nullptr, 0, nullptr, 0 }
    };

    const unordered_map<int, const char*> OPTIONS_TO_PROPERTIES = {
        { 'l', PropertyHandler::LUN },
        { 'n', PropertyHandler::VOLUME_NAME },
        { 'L', PropertyHandler::LOG_LEVEL },
        { 'P', PropertyHandler::PROPERTY_FILES },
        { OPT_LOG_PATTERN, PropertyHandler::LOG_PATTERN }
    };

    // These options may be repeated, their values are collected
    const unordered_map<int, const char*> LIST_OPTIONS_TO_PROPERTIES = {
        { 'i', PropertyHandler::WWIDS },
        { 'w', PropertyHandler::TARGET_WWNS }
    };

    property_map properties;

    optind = 1;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(static_cast<int>(args.size()), args.data(), "-hi:l:n:vw:L:P:", options.data(),
        nullptr)) != -1) {
        if (const auto &property = OPTIONS_TO_PROPERTIES.find(opt); property != OPTIONS_TO_PROPERTIES.end()) {
            properties[property->second] = optarg;
            continue;
        }

        if (const auto &property = LIST_OPTIONS_TO_PROPERTIES.find(opt); property
            != LIST_OPTIONS_TO_PROPERTIES.end()) {
            string &value = properties[property->second];
            value += value.empty() ? optarg : LIST_SEPARATOR + string(optarg);
            continue;
        }

        switch (opt) {
        case 'h':
            Banner(true);
            exit(EXIT_SUCCESS);
            break;

        case 'v':
            cout << GetVersionString() << '\n';
            exit(EXIT_SUCCESS);
            break;

        case OPT_IGNORE_CONF:
            ignore_conf = true;
            break;

        case 1:
            operands.emplace_back(optarg);
            break;

        default:
            throw ParserException(fmt::format("Invalid option '{}'", args[optind - 1]));
        }
    }

    return properties;
}

ConnectionDescriptor fcconnect_parser::CreateDescriptor(const string &volume_name, const string &wwns,
    const string &lun, const string &wwids)
{
    ConnectionDescriptor descriptor;
    descriptor.volume_name = volume_name;
    descriptor.target_wwns = SplitList(wwns);
    descriptor.wwids = SplitList(wwids);

    if (descriptor.target_wwns.empty() && descriptor.wwids.empty()) {
        throw ParserException("Missing target WWN or WWID");
    }

    if (!descriptor.target_wwns.empty()) {
        if (int l; !GetAsUnsignedInt(lun, l)) {
            throw ParserException(lun.empty() ? "Missing LUN" : fmt::format("Invalid LUN '{}'", lun));
        }
        descriptor.lun = lun;
    }

    return descriptor;
}
