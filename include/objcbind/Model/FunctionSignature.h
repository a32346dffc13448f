// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the signature of a C function, with types already spelled in the target language.
 */

#ifndef OBJCBIND_MODEL_FUNCTIONSIGNATURE_H
#define OBJCBIND_MODEL_FUNCTIONSIGNATURE_H

#include <string>
#include <utility>
#include <vector>

namespace ObjCBind {
using ParamList = std::vector<std::pair<std::string, std::string>>; // (name, type)

struct FunctionSignature {
    std::string name;
    std::string returnType; // "()" for no value
    ParamList params;
    bool isVariadic = false;

    bool operator==(const FunctionSignature& other) const
    {
        return name == other.name && returnType == other.returnType && params == other.params &&
            isVariadic == other.isVariadic;
    }
};
} // namespace ObjCBind

#endif // OBJCBIND_MODEL_FUNCTIONSIGNATURE_H
