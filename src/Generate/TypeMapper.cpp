// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements type mappings Objective-C encoding -> Rust FFI helper
 */

#include "objcbind/Generate/TypeMapper.h"

#include "objcbind/Basic/Utils.h"
#include "objcbind/Utils/CheckUtils.h"

using namespace ObjCBind;
using namespace ObjCBind::Encoding;
using namespace ObjCBind::Generate;

namespace {
constexpr auto UNIT_TYPE = "()";
constexpr auto BOOL_TYPE = "bool";
constexpr auto INT8_TYPE = "i8";
constexpr auto UINT8_TYPE = "u8";
constexpr auto INT16_TYPE = "i16";
constexpr auto UINT16_TYPE = "u16";
constexpr auto INT32_TYPE = "i32";
constexpr auto UINT32_TYPE = "u32";
constexpr auto INT64_TYPE = "i64";
constexpr auto UINT64_TYPE = "u64";
constexpr auto ISIZE_TYPE = "isize";
constexpr auto USIZE_TYPE = "usize";
constexpr auto FLOAT_TYPE = "f32";
constexpr auto DOUBLE_TYPE = "f64";
constexpr auto ID_TYPE = "id";
constexpr auto CLASS_TYPE = "Class";
constexpr auto SEL_TYPE = "SEL";
constexpr auto CSTRING_TYPE = "*const i8";
constexpr auto POINTER_PREFIX = "*mut ";
constexpr auto OPAQUE_POINTER_TYPE = "*mut c_void";

constexpr auto MSG_SEND = "objc_msgSend";
constexpr auto MSG_SEND_STRET = "objc_msgSend_stret";
constexpr auto MSG_SEND_FPRET = "objc_msgSend_fpret";

// The fragment goes into a block comment, so it must not be able to close or open one.
std::string NeutralizeComment(const std::string& raw)
{
    return Utils::ReplaceAll(Utils::ReplaceAll(raw, "*/", "* /"), "/*", "/ *");
}
} // namespace

std::string TypeMapper::RenderType(const EncodedType& type)
{
    switch (type.GetKind()) {
        case TypeKind::VOID:
            return UNIT_TYPE;
        case TypeKind::BOOL:
            return BOOL_TYPE;
        case TypeKind::INT8:
            return INT8_TYPE;
        case TypeKind::UINT8:
            return UINT8_TYPE;
        case TypeKind::INT16:
            return INT16_TYPE;
        case TypeKind::UINT16:
            return UINT16_TYPE;
        case TypeKind::INT32:
            return INT32_TYPE;
        case TypeKind::UINT32:
            return UINT32_TYPE;
        case TypeKind::INT64:
            return INT64_TYPE;
        case TypeKind::UINT64:
            return UINT64_TYPE;
        case TypeKind::ISIZE:
            return ISIZE_TYPE;
        case TypeKind::USIZE:
            return USIZE_TYPE;
        case TypeKind::FLOAT:
            return FLOAT_TYPE;
        case TypeKind::DOUBLE:
            return DOUBLE_TYPE;
        case TypeKind::RECEIVER:
            return ID_TYPE;
        case TypeKind::CLASS:
            return CLASS_TYPE;
        case TypeKind::SELECTOR:
            return SEL_TYPE;
        case TypeKind::CSTRING:
            return CSTRING_TYPE;
        case TypeKind::POINTER: {
            auto pointee = type.GetPointee();
            OBJCBIND_NULLPTR_CHECK(pointee);
            if (pointee == nullptr || pointee->GetKind() == TypeKind::VOID) {
                return OPAQUE_POINTER_TYPE;
            }
            return POINTER_PREFIX + RenderType(*pointee);
        }
        case TypeKind::AGGREGATE:
            if (Utils::IsAsciiIdentifier(type.GetText())) {
                return type.GetText();
            }
            return OPAQUE_POINTER_TYPE;
        case TypeKind::UNRESOLVED:
            return "/* " + NeutralizeComment(type.GetText()) + " */ " + OPAQUE_POINTER_TYPE;
    }
    return OPAQUE_POINTER_TYPE;
}

std::string TypeMapper::DispatchEntryPoint(DispatchKind kind)
{
    switch (kind) {
        case DispatchKind::STRUCT_RETURN:
            return MSG_SEND_STRET;
        case DispatchKind::FLOAT_RETURN:
            return MSG_SEND_FPRET;
        case DispatchKind::STANDARD:
            return MSG_SEND;
    }
    return MSG_SEND;
}
