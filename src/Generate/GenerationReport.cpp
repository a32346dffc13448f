// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "objcbind/Generate/GenerationReport.h"

#include "objcbind/Generate/CodeWriter.h"

using namespace ObjCBind::Generate;

std::vector<std::string> GenerationReport::Summary() const
{
    std::vector<std::string> res;
    if (boundClasses != 0 || !skippedClasses.empty() || !filteredClasses.empty()) {
        res.emplace_back(Join("classes: ", boundClasses, " bound, ", skippedClasses.size(), " skipped, ",
            filteredClasses.size(), " filtered out"));
        res.emplace_back(Join("methods: ", boundMethods, " bound, ", skippedMethods.size(), " skipped"));
    }
    if (boundFunctions != 0 || boundConstants != 0 || !unknownSymbols.empty() || !skippedSymbols.empty()) {
        res.emplace_back(Join("symbols: ", boundFunctions, " functions, ", boundConstants, " constants, ",
            unknownSymbols.size(), " without signature, ", skippedSymbols.size(), " skipped"));
    }
    return res;
}
