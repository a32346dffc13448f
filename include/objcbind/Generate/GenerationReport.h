// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the record of what a generation run bound and what it had to leave out.
 */

#ifndef OBJCBIND_GENERATE_GENERATIONREPORT_H
#define OBJCBIND_GENERATE_GENERATIONREPORT_H

#include <string>
#include <vector>

namespace ObjCBind::Generate {
struct GenerationReport {
    size_t boundClasses = 0;
    size_t boundMethods = 0;
    size_t boundFunctions = 0;
    size_t boundConstants = 0;
    std::vector<std::string> filteredClasses;  // Left out by the configuration.
    std::vector<std::string> skippedClasses;   // Name cannot be turned into an identifier.
    std::vector<std::string> skippedMethods;   // "<class> <selector>"
    std::vector<std::string> unknownSymbols;   // Function symbols without a known signature.
    std::vector<std::string> skippedSymbols;   // Name cannot be turned into an identifier.

    size_t SkippedCount() const
    {
        return skippedClasses.size() + skippedMethods.size() + skippedSymbols.size();
    }

    /// One line per counter, for verbose output.
    std::vector<std::string> Summary() const;
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_GENERATIONREPORT_H
