// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the best-effort classification of exported symbols into functions and constants.
 * Symbol tables carry no kind tag, so the two derived sets may overlap and some symbols belong to neither.
 */

#ifndef OBJCBIND_STUB_SYMBOLCLASSIFIER_H
#define OBJCBIND_STUB_SYMBOLCLASSIFIER_H

#include <string>
#include <vector>

#include "objcbind/Model/InterfaceModel.h"

namespace ObjCBind {
class SymbolClassifier {
public:
    /// Uses the default platform-function prefixes "NS" and "CF".
    SymbolClassifier();
    explicit SymbolClassifier(std::vector<std::string> functionPrefixes);

    /// Drop exactly one leading underscore.
    static std::string StripUnderscore(const std::string& symbol);
    /// Linker directives ("$ld$...") and ObjC runtime metadata ("_OBJC_CLASS_$_...") are never bound.
    static bool IsExcluded(const std::string& symbol);

    bool IsFunction(const std::string& symbol) const;
    bool IsConstant(const std::string& symbol) const;

    /// Function symbols of \ref exports in export order, duplicates kept.
    std::vector<std::string> FunctionSymbols(const StubExportSet& exports) const;
    /// Constant symbols of \ref exports in export order, duplicates kept.
    std::vector<std::string> ConstantSymbols(const StubExportSet& exports) const;

    const std::vector<std::string>& GetFunctionPrefixes() const
    {
        return functionPrefixes;
    }

private:
    std::vector<std::string> functionPrefixes;

    /// Length of the platform-function prefix \ref name starts with, 0 when there is none.
    size_t MatchFunctionPrefix(const std::string& name) const;
};
} // namespace ObjCBind

#endif // OBJCBIND_STUB_SYMBOLCLASSIFIER_H
