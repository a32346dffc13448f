// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares type mappings Objective-C encoding -> Rust FFI helper
 */

#ifndef OBJCBIND_GENERATE_TYPEMAPPER_H
#define OBJCBIND_GENERATE_TYPEMAPPER_H

#include <string>

#include "objcbind/Encoding/TypeEncoding.h"

namespace ObjCBind::Generate {
class TypeMapper {
public:
    /// Never returns an empty string: anything without a concrete spelling becomes an opaque pointer.
    static std::string RenderType(const Encoding::EncodedType& type);

    /// "objc_msgSend", "objc_msgSend_stret" or "objc_msgSend_fpret".
    static std::string DispatchEntryPoint(Encoding::DispatchKind kind);
    static std::string DispatchEntryPoint(const Encoding::EncodedType& returnType)
    {
        return DispatchEntryPoint(Encoding::GetDispatchKind(returnType));
    }
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_TYPEMAPPER_H
