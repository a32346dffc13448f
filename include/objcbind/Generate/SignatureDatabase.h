// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the database of known C function signatures. Stub descriptors only list symbol names,
 * so a function can be bound only when its signature is known here.
 */

#ifndef OBJCBIND_GENERATE_SIGNATUREDATABASE_H
#define OBJCBIND_GENERATE_SIGNATUREDATABASE_H

#include <string>
#include <unordered_map>

#include "objcbind/Model/FunctionSignature.h"

namespace ObjCBind::Generate {
class SignatureDatabase {
public:
    /// Creates the database with the built-in Foundation signatures.
    SignatureDatabase();

    const FunctionSignature* Lookup(const std::string& name) const;
    bool Contains(const std::string& name) const
    {
        return Lookup(name) != nullptr;
    }
    /// Adds \ref signature, replacing any entry of the same name.
    void Register(FunctionSignature signature);
    size_t Size() const
    {
        return signatures.size();
    }

    /// "    /// NSLog\n    pub fn NSLog(format: id, ...);\n"
    static std::string RenderFunction(const FunctionSignature& signature);

private:
    std::unordered_map<std::string, FunctionSignature> signatures;
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_SIGNATUREDATABASE_H
