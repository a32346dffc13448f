// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the GlobalOptions class, the command line settings of objcbind.
 */

#ifndef OBJCBIND_OPTION_OPTION_H
#define OBJCBIND_OPTION_OPTION_H

#include <optional>
#include <string>
#include <vector>

#include "objcbind/Option/OptionTable.h"

namespace ObjCBind {
const std::string OBJCBIND_VERSION = "0.1.0";

class GlobalOptions {
public:
    std::optional<std::string> classDumpPath;
    std::vector<std::string> stubPaths;
    std::optional<std::string> configPath;
    /// Class bindings go to stdout when not set.
    std::optional<std::string> outputPath;
    std::optional<std::string> stubOutputPath;
    std::optional<std::string> emitModelPath;
    std::optional<std::string> fromModelPath;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;

    /**
     * Fill the options from parsed arguments. '--help' and '--version' take priority: when either is
     * present, no other argument is checked.
     * @return false if the arguments do not form a valid command.
     */
    bool ParseFromArgs(ArgList& argList);

private:
    bool TryParsePreOption(const OptionArgInstance& arg, bool& skip);
    bool TryParseOption(OptionArgInstance& arg, ArgList& argList);
    void OccurrenceCheck(const OptionArgInstance& arg, ArgList& argList) const;
    bool ProcessInputs(const std::vector<std::string>& inputs) const;
    bool PerformPostActions() const;
};
} // namespace ObjCBind

#endif // OBJCBIND_OPTION_OPTION_H
