// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the GlobalOptions class.
 */

#include "objcbind/Option/Option.h"

#include <functional>
#include <unordered_map>

#include "objcbind/Basic/Print.h"
#include "objcbind/Utils/CheckUtils.h"

using namespace ObjCBind;

#define OPTION_TRUE_ACTION(EXPR) [](GlobalOptions& opts, const OptionArgInstance&) { (EXPR); return true; }

namespace {
std::unordered_map<Options::ID, std::function<bool(GlobalOptions&, const OptionArgInstance&)>> g_actions = {
    { Options::ID::CLASS_DUMP, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.classDumpPath = arg.value;
        return true;
    }},
    { Options::ID::STUB, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.stubPaths.emplace_back(arg.value);
        return true;
    }},
    { Options::ID::CONFIG, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.configPath = arg.value;
        return true;
    }},
    { Options::ID::OUTPUT, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.outputPath = arg.value;
        return true;
    }},
    { Options::ID::STUB_OUTPUT, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.stubOutputPath = arg.value;
        return true;
    }},
    { Options::ID::EMIT_MODEL, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.emitModelPath = arg.value;
        return true;
    }},
    { Options::ID::FROM_MODEL, [](GlobalOptions& opts, const OptionArgInstance& arg) {
        opts.fromModelPath = arg.value;
        return true;
    }},
    { Options::ID::VERBOSE, OPTION_TRUE_ACTION(opts.verbose = true) },
};

// Options that may be given more than once without a warning.
bool IsRepeatable(Options::ID id)
{
    return id == Options::ID::STUB || id == Options::ID::VERBOSE;
}
} // namespace

bool GlobalOptions::TryParsePreOption(const OptionArgInstance& arg, bool& skip)
{
    switch (arg.info.id) {
        case Options::ID::HELP:
            showHelp = true;
            skip = true;
            return true;
        case Options::ID::VERSION:
            showVersion = true;
            skip = true;
            return true;
        default:
            return false;
    }
}

bool GlobalOptions::ParseFromArgs(ArgList& argList)
{
    std::vector<OptionArgInstance*> optArgs;

    // Inputs are collected and '--help'/'--version' are handled first: their presence suppresses all other
    // argument errors in a command.
    bool skipParsing = false;
    for (auto& arg : argList.args) {
        switch (arg->argInstanceType) {
            case ArgInstanceType::Input:
                argList.AddInput(static_cast<InputArgInstance*>(arg.get())->value);
                break;
            case ArgInstanceType::Option: {
                auto optArg = static_cast<OptionArgInstance*>(arg.get());
                bool skip = false;
                if (!TryParsePreOption(*optArg, skip)) {
                    optArgs.emplace_back(optArg);
                }
                skipParsing = skipParsing || skip;
                break;
            }
        }
    }

    if (skipParsing) {
        return true;
    }

    for (auto optArg : optArgs) {
        if (!TryParseOption(*optArg, argList)) {
            return false;
        }
    }

    if (!ProcessInputs(argList.GetInputs())) {
        return false;
    }

    return PerformPostActions();
}

bool GlobalOptions::TryParseOption(OptionArgInstance& arg, ArgList& argList)
{
    auto found = g_actions.find(arg.info.id);
    OBJCBIND_ASSERT_WITH_MSG(found != g_actions.end(), "option without an action");
    if (found == g_actions.end()) {
        return false;
    }
    if (arg.info.TakesValue() && arg.value.empty()) {
        Errorln("option '", arg.str, "' requires a non-empty value");
        return false;
    }
    auto success = found->second(*this, arg);
    OccurrenceCheck(arg, argList);
    return success;
}

void GlobalOptions::OccurrenceCheck(const OptionArgInstance& arg, ArgList& argList) const
{
    auto id = arg.info.id;
    if (argList.IsSpecified(id) && !IsRepeatable(id) && !argList.IsWarned(id)) {
        Warningln("'", arg.info.names.back(), "' is specified multiple times. The last one is chosen.");
        argList.MarkWarned(id);
    }
    argList.MarkSpecified(id);
}

bool GlobalOptions::ProcessInputs(const std::vector<std::string>& inputs) const
{
    if (inputs.empty()) {
        return true;
    }
    // Every input file is named by an option, so a bare argument is a mistake.
    for (auto& input : inputs) {
        Errorln("unexpected argument '", input, "'");
    }
    return false;
}

bool GlobalOptions::PerformPostActions() const
{
    if (fromModelPath.has_value()) {
        if (classDumpPath.has_value() || !stubPaths.empty()) {
            Errorln("'--from-model' cannot be used together with '--class-dump' or '--stub'");
            return false;
        }
        return true;
    }
    if (!classDumpPath.has_value() && stubPaths.empty()) {
        Errorln("no input: specify '--class-dump', '--stub' or '--from-model'");
        return false;
    }
    return true;
}
