// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the classification of exported symbols.
 */

#include "objcbind/Stub/SymbolClassifier.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <utility>

#include "objcbind/Basic/Utils.h"

using namespace ObjCBind;

namespace {
constexpr auto LINKER_DIRECTIVE_MARKER = "$ld$";
constexpr auto OBJC_RUNTIME_INFIX = "_OBJC_";
constexpr char CONSTANT_LEADER = 'k';
const std::vector<std::string> DEFAULT_FUNCTION_PREFIXES = {"NS", "CF"};

bool IsLower(char c)
{
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool IsUpper(char c)
{
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

// "kCFAllocatorDefault", "kNilOptions"
bool IsKConstantName(const std::string& name)
{
    return name.size() > 1 && name[0] == CONSTANT_LEADER && IsUpper(name[1]);
}
} // namespace

SymbolClassifier::SymbolClassifier() : functionPrefixes(DEFAULT_FUNCTION_PREFIXES)
{
}

SymbolClassifier::SymbolClassifier(std::vector<std::string> functionPrefixes)
    : functionPrefixes(std::move(functionPrefixes))
{
}

std::string SymbolClassifier::StripUnderscore(const std::string& symbol)
{
    if (!symbol.empty() && symbol.front() == '_') {
        return symbol.substr(1);
    }
    return symbol;
}

bool SymbolClassifier::IsExcluded(const std::string& symbol)
{
    return Utils::StartsWith(symbol, LINKER_DIRECTIVE_MARKER) || symbol.find(OBJC_RUNTIME_INFIX) != std::string::npos;
}

size_t SymbolClassifier::MatchFunctionPrefix(const std::string& name) const
{
    for (auto& prefix : functionPrefixes) {
        if (!prefix.empty() && Utils::StartsWith(name, prefix)) {
            return prefix.size();
        }
    }
    return 0;
}

bool SymbolClassifier::IsFunction(const std::string& symbol) const
{
    if (IsExcluded(symbol)) {
        return false;
    }
    auto name = StripUnderscore(symbol);
    if (name.empty()) {
        return false;
    }
    if (MatchFunctionPrefix(name) > 0) {
        return true;
    }
    return IsLower(name[0]);
}

bool SymbolClassifier::IsConstant(const std::string& symbol) const
{
    if (IsExcluded(symbol)) {
        return false;
    }
    auto name = StripUnderscore(symbol);
    size_t prefixLen = MatchFunctionPrefix(name);
    bool mixedCaseRemainder =
        prefixLen > 0 && std::any_of(name.begin() + static_cast<std::ptrdiff_t>(prefixLen), name.end(), IsLower);
    if (IsKConstantName(name)) {
        // A prefixed mixed-case name reads as a function even when it looks like a constant.
        return !mixedCaseRemainder;
    }
    // "NSFOUNDATION_VERSION" style names; these are functions too by prefix.
    return prefixLen > 0 && prefixLen < name.size() && !mixedCaseRemainder;
}

std::vector<std::string> SymbolClassifier::FunctionSymbols(const StubExportSet& exports) const
{
    std::vector<std::string> res;
    std::copy_if(exports.symbols.begin(), exports.symbols.end(), std::back_inserter(res),
        [this](const std::string& symbol) { return IsFunction(symbol); });
    return res;
}

std::vector<std::string> SymbolClassifier::ConstantSymbols(const StubExportSet& exports) const
{
    std::vector<std::string> res;
    std::copy_if(exports.symbols.begin(), exports.symbols.end(), std::back_inserter(res),
        [this](const std::string& symbol) { return IsConstant(symbol); });
    return res;
}
