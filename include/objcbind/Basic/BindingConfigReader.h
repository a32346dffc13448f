// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This document aims to parse the binding configuration (a TOML file), which selects the classes to bind,
 * tunes the classification of stub symbols and supplies extra C function signatures.
 *
 */

#ifndef OBJCBIND_BASIC_BINDINGCONFIGREADER_H
#define OBJCBIND_BASIC_BINDINGCONFIGREADER_H

#include <string>
#include <vector>

#include "objcbind/Model/FunctionSignature.h"

namespace ObjCBind {
// Complete Configuration Structure. Every field keeps its default when absent from the file.
class BindingConfigReader {
public:
    // [generator]
    std::string stringClass = "NSString";
    bool emitPropertyDocs = true;
    bool emitUnknownSymbols = false;
    // [classes]
    std::vector<std::string> includedClasses;
    std::vector<std::string> excludedClasses;
    // [symbols]
    std::vector<std::string> functionPrefixes = {"NS", "CF"};
    // [[function]]
    std::vector<FunctionSignature> functions;

    // Parsing configuration file
    bool Parse(const std::string& filePath);

    // An empty include list admits every class that is not excluded.
    bool IsClassSelected(const std::string& className) const;

    // Verify Configuration
    bool Validate() const;
};
} // namespace ObjCBind
#endif // OBJCBIND_BASIC_BINDINGCONFIGREADER_H
