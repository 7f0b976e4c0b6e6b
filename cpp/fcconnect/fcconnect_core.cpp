//---------------------------------------------------------------------------
//
// FcConnect, Fibre Channel volume attach and detach tools for Linux
//
// Copyright (C) 2025 The FcConnect Authors
//
//---------------------------------------------------------------------------

#include "fcconnect_core.h"
#include <cstdlib>
#include <iostream>
#include "fibrechannel/fc_connector.h"
#include "shared/fc_exceptions.h"
#include "shared/fc_util.h"
#include "fcconnect_parser.h"

using namespace fc_util;
using namespace fcconnect_parser;

int FcConnect::Run(span<char*> args)
{
    if (args.size() < 2) {
        Banner(true);
        return EXIT_FAILURE;
    }

    fc_logger = CreateLogger("fcconnect");

    if (!ParseArguments(args)) {
        return EXIT_FAILURE;
    }

    return command == "attach" ? Attach() : Detach();
}

bool FcConnect::ParseArguments(span<char*> args)
{
    PropertyHandler &property_handler = PropertyHandler::GetInstance();

    try {
        bool ignore_conf = false;
        vector<string> operands;
        const property_map &properties = fcconnect_parser::ParseArguments(args, ignore_conf, operands);

        const auto &property_files = properties.find(PropertyHandler::PROPERTY_FILES);
        property_handler.Init(property_files != properties.end() ? property_files->second : "", properties,
            ignore_conf);
        property_handler.RemoveProperty(PropertyHandler::PROPERTY_FILES);

        if (const string &log_level = property_handler.RemoveProperty(PropertyHandler::LOG_LEVEL, "info"); !SetLogLevel(
            *fc_logger, log_level)) {
            throw ParserException("Invalid log level: '" + log_level + "'");
        }

        if (const string &log_pattern = property_handler.RemoveProperty(PropertyHandler::LOG_PATTERN); !log_pattern.empty()) {
            fc_logger->set_pattern(log_pattern);
        }

        if (operands.empty() || (operands[0] != "attach" && operands[0] != "detach")) {
            throw ParserException("Missing command, must be 'attach' or 'detach'");
        }
        command = operands[0];

        if (command == "detach") {
            if (operands.size() != 2) {
                throw ParserException("'detach' requires exactly one device");
            }
            device = operands[1];
        }
        else {
            if (operands.size() != 1) {
                throw ParserException("'attach' does not accept any arguments");
            }
            descriptor = CreateDescriptor(property_handler.RemoveProperty(PropertyHandler::VOLUME_NAME),
                property_handler.RemoveProperty(PropertyHandler::TARGET_WWNS),
                property_handler.RemoveProperty(PropertyHandler::LUN),
                property_handler.RemoveProperty(PropertyHandler::WWIDS));
        }
    }
    catch (const ParserException &e) {
        cerr << "Error: " << e.what() << '\n';
        return false;
    }

    // Volume properties are allowed in the configuration file but are not used by 'detach'
    for (const auto& [key, value] : property_handler.GetUnknownProperties()) {
        if (key != PropertyHandler::VOLUME_NAME && key != PropertyHandler::TARGET_WWNS
            && key != PropertyHandler::LUN && key != PropertyHandler::WWIDS) {
            cerr << "Error: Invalid property \"" << key << "\", check your command line and "
                << PropertyHandler::CONFIGURATION << '\n';
            return false;
        }
    }

    return true;
}

int FcConnect::Attach() const
{
    const auto &connector = CreateConnector();

    try {
        cout << connector->Attach(descriptor) << '\n';
    }
    catch (const NotFoundException &e) {
        cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int FcConnect::Detach() const
{
    const auto &connector = CreateConnector();

    try {
        connector->Detach(device);
    }
    catch (const IoException &e) {
        cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const RemovalException &e) {
        cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

unique_ptr<FcConnector> FcConnect::CreateConnector() const
{
    return file_system ? make_unique<FcConnector>(*file_system, *fc_logger) : make_unique<FcConnector>(*fc_logger);
}
