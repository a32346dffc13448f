// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the OptionTable.
 */

#include "objcbind/Option/OptionTable.h"

#include <algorithm>

#include "objcbind/Basic/Print.h"
#include "objcbind/Basic/Utils.h"

using namespace ObjCBind;
using namespace ObjCBind::Options;

namespace {
constexpr char OPTION_LEADER = '-';
constexpr char VALUE_SEPARATOR = '=';
constexpr int OPTION_COLUMN_WIDTH = 28;

const std::vector<OptionInfo> OBJCBIND_OPTIONS = {
    {ID::CLASS_DUMP, {"--class-dump"}, "<file>", "Read Objective-C classes from a class-dump file"},
    {ID::STUB, {"--stub"}, "<file>", "Read exported symbols from a .tbd stub library (repeatable)"},
    {ID::CONFIG, {"--config"}, "<file>", "Read the binding configuration from a TOML file"},
    {ID::OUTPUT, {"-o", "--output"}, "<file>", "Write class bindings to <file> instead of stdout"},
    {ID::STUB_OUTPUT, {"--stub-output"}, "<file>", "Write stub symbol bindings to <file>"},
    {ID::EMIT_MODEL, {"--emit-model"}, "<file>", "Save the parsed interface model to <file>"},
    {ID::FROM_MODEL, {"--from-model"}, "<file>", "Load the interface model from <file> instead of parsing"},
    {ID::VERBOSE, {"--verbose"}, "", "Print progress and a generation summary"},
    {ID::HELP, {"-h", "--help"}, "", "Print this help message"},
    {ID::VERSION, {"-v", "--version"}, "", "Print version information"},
};
} // namespace

const OptionInfo* OptionTable::FindOption(const std::string& name) const
{
    for (auto& info : infos) {
        if (std::find(info.names.begin(), info.names.end(), name) != info.names.end()) {
            return &info;
        }
    }
    return nullptr;
}

bool OptionTable::ParseArgs(const std::vector<std::string>& argStrs, ArgList& argList) const
{
    for (size_t i = 1; i < argStrs.size(); ++i) {
        auto& arg = argStrs[i];
        if (arg.size() < 2 || arg.front() != OPTION_LEADER) {
            argList.args.emplace_back(std::make_unique<InputArgInstance>(arg));
            continue;
        }

        auto name = arg;
        std::string value;
        bool hasJoinedValue = false;
        if (auto sep = arg.find(VALUE_SEPARATOR); sep != std::string::npos) {
            name = arg.substr(0, sep);
            value = arg.substr(sep + 1);
            hasJoinedValue = true;
        }
        auto info = FindOption(name);
        if (info == nullptr) {
            Errorln("unknown option '", name, "'");
            return false;
        }
        if (!info->TakesValue()) {
            if (hasJoinedValue) {
                Errorln("option '", name, "' does not take a value");
                return false;
            }
            argList.args.emplace_back(std::make_unique<OptionArgInstance>(*info, arg, ""));
            continue;
        }
        if (!hasJoinedValue) {
            if (i + 1 >= argStrs.size()) {
                Errorln("option '", name, "' requires a value");
                return false;
            }
            value = argStrs[++i];
        }
        argList.args.emplace_back(std::make_unique<OptionArgInstance>(*info, arg, value));
    }
    return true;
}

void OptionTable::PrintHelp(const std::string& exeName) const
{
    Println("Usage:", exeName, "[options]");
    Println("");
    Println("Options:");
    for (auto& info : infos) {
        auto option = Utils::JoinStrings(info.names, ", ");
        if (info.TakesValue()) {
            option += " " + info.valueName;
        }
        PrintCommandDesc(option, info.description, OPTION_COLUMN_WIDTH);
    }
}

std::unique_ptr<OptionTable> ObjCBind::CreateOptionTable()
{
    return std::make_unique<OptionTable>(OBJCBIND_OPTIONS);
}
