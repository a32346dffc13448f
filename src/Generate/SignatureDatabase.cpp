// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the database of known C function signatures.
 */

#include "objcbind/Generate/SignatureDatabase.h"

#include <utility>
#include <vector>

#include "objcbind/Generate/CodeWriter.h"

using namespace ObjCBind;
using namespace ObjCBind::Generate;

namespace {
constexpr auto UNIT_RETURN = "()";
constexpr auto VARIADIC_MARKER = "...";

const std::vector<FunctionSignature> FOUNDATION_SIGNATURES = {
    // Logging
    {"NSLog", "()", {{"format", "id"}}, true},
    {"NSLogv", "()", {{"format", "id"}, {"args", "*mut c_void"}}},

    // Class, selector and protocol names
    {"NSClassFromString", "Class", {{"aClassName", "id"}}},
    {"NSSelectorFromString", "SEL", {{"aSelectorName", "id"}}},
    {"NSStringFromClass", "id", {{"aClass", "Class"}}},
    {"NSStringFromSelector", "id", {{"aSelector", "SEL"}}},
    {"NSStringFromProtocol", "id", {{"proto", "*const c_void"}}},
    {"NSStringFromBOOL", "id", {{"value", "bool"}}},
    {"NSClassFromObject", "Class", {{"obj", "id"}}},

    // Ranges
    {"NSMakeRange", "NSRange", {{"loc", "NSUInteger"}, {"len", "NSUInteger"}}},
    {"NSMaxRange", "NSUInteger", {{"range", "NSRange"}}},
    {"NSLocationInRange", "bool", {{"loc", "NSUInteger"}, {"range", "NSRange"}}},
    {"NSEqualRanges", "bool", {{"range1", "NSRange"}, {"range2", "NSRange"}}},
    {"NSUnionRange", "NSRange", {{"range1", "NSRange"}, {"range2", "NSRange"}}},
    {"NSIntersectionRange", "NSRange", {{"range1", "NSRange"}, {"range2", "NSRange"}}},
    {"NSStringFromRange", "id", {{"range", "NSRange"}}},
    {"NSRangeFromString", "NSRange", {{"aString", "id"}}},

    // Zones and autorelease pools
    {"NSDefaultMallocZone", "*mut c_void", {}},
    {"NSCreateZone", "*mut c_void",
        {{"startSize", "NSUInteger"}, {"granularity", "NSUInteger"}, {"canFree", "bool"}}},
    {"NSRecycleZone", "()", {{"zone", "*mut c_void"}}},
    {"NSZoneName", "id", {{"zone", "*mut c_void"}}},
    {"NSSetZoneName", "()", {{"zone", "*mut c_void"}, {"name", "id"}}},
    {"NSZoneFromPointer", "*mut c_void", {{"ptr", "*mut c_void"}}},
    {"NSPushAutoreleasePool", "()", {{"pool", "*mut c_void"}}},
    {"NSPopAutoreleasePool", "()", {{"pool", "*mut c_void"}}},

    // Pages
    {"NSPageSize", "NSUInteger", {}},
    {"NSLogPageSize", "NSUInteger", {}},
    {"NSRoundUpToMultipleOfPageSize", "NSUInteger", {{"bytes", "NSUInteger"}}},
    {"NSRoundDownToMultipleOfPageSize", "NSUInteger", {{"bytes", "NSUInteger"}}},
    {"NSAllocateMemoryPages", "*mut c_void", {{"bytes", "NSUInteger"}}},
    {"NSDeallocateMemoryPages", "()", {{"ptr", "*mut c_void"}, {"bytes", "NSUInteger"}}},
    {"NSCopyMemoryPages", "()", {{"source", "*const c_void"}, {"dest", "*mut c_void"}, {"bytes", "NSUInteger"}}},

    // Type encodings
    {"NSGetSizeAndAlignment", "*const i8",
        {{"typePtr", "*const i8"}, {"sizep", "*mut NSUInteger"}, {"alignp", "*mut NSUInteger"}}},

    // Users and directories
    {"NSUserName", "id", {}},
    {"NSFullUserName", "id", {}},
    {"NSHomeDirectory", "id", {}},
    {"NSHomeDirectoryForUser", "id", {{"userName", "id"}}},
    {"NSTemporaryDirectory", "id", {}},
    {"NSSearchPathForDirectoriesInDomains", "id",
        {{"directory", "NSUInteger"}, {"domainMask", "NSUInteger"}, {"expandTilde", "bool"}}},

    // Decimals
    {"NSDecimalAdd", "NSUInteger",
        {{"result", "*mut NSDecimal"}, {"leftOperand", "*const NSDecimal"}, {"rightOperand", "*const NSDecimal"},
            {"roundingMode", "NSUInteger"}}},
    {"NSDecimalSubtract", "NSUInteger",
        {{"result", "*mut NSDecimal"}, {"leftOperand", "*const NSDecimal"}, {"rightOperand", "*const NSDecimal"},
            {"roundingMode", "NSUInteger"}}},
    {"NSDecimalMultiply", "NSUInteger",
        {{"result", "*mut NSDecimal"}, {"leftOperand", "*const NSDecimal"}, {"rightOperand", "*const NSDecimal"},
            {"roundingMode", "NSUInteger"}}},
    {"NSDecimalDivide", "NSUInteger",
        {{"result", "*mut NSDecimal"}, {"leftOperand", "*const NSDecimal"}, {"rightOperand", "*const NSDecimal"},
            {"roundingMode", "NSUInteger"}}},
    {"NSDecimalCompare", "NSInteger", {{"leftOperand", "*const NSDecimal"}, {"rightOperand", "*const NSDecimal"}}},
    {"NSDecimalRound", "()",
        {{"result", "*mut NSDecimal"}, {"number", "*const NSDecimal"}, {"scale", "NSInteger"},
            {"roundingMode", "NSUInteger"}}},
    {"NSDecimalString", "id", {{"dcm", "*const NSDecimal"}, {"locale", "id"}}},

    // Geometry
    {"NSMakeRect", "NSRect", {{"x", "CGFloat"}, {"y", "CGFloat"}, {"w", "CGFloat"}, {"h", "CGFloat"}}},
    {"NSMakePoint", "NSPoint", {{"x", "CGFloat"}, {"y", "CGFloat"}}},
    {"NSMakeSize", "NSSize", {{"w", "CGFloat"}, {"h", "CGFloat"}}},
    {"NSContainsRect", "bool", {{"aRect", "NSRect"}, {"bRect", "NSRect"}}},
    {"NSIntersectsRect", "bool", {{"aRect", "NSRect"}, {"bRect", "NSRect"}}},
    {"NSUnionRect", "NSRect", {{"aRect", "NSRect"}, {"bRect", "NSRect"}}},
    {"NSIntersectionRect", "NSRect", {{"aRect", "NSRect"}, {"bRect", "NSRect"}}},
    {"NSEqualRects", "bool", {{"aRect", "NSRect"}, {"bRect", "NSRect"}}},
    {"NSEqualPoints", "bool", {{"aPoint", "NSPoint"}, {"bPoint", "NSPoint"}}},
    {"NSEqualSizes", "bool", {{"aSize", "NSSize"}, {"bSize", "NSSize"}}},
    {"NSStringFromRect", "id", {{"rect", "NSRect"}}},
    {"NSStringFromPoint", "id", {{"point", "NSPoint"}}},
    {"NSStringFromSize", "id", {{"size", "NSSize"}}},
    {"NSRectFromString", "NSRect", {{"aString", "id"}}},
    {"NSPointFromString", "NSPoint", {{"aString", "id"}}},
    {"NSSizeFromString", "NSSize", {{"aString", "id"}}},

    // Hash and map tables
    {"NSCreateHashTable", "*mut c_void", {{"callBacks", "*const c_void"}, {"capacity", "NSUInteger"}}},
    {"NSFreeHashTable", "()", {{"table", "*mut c_void"}}},
    {"NSResetHashTable", "()", {{"table", "*mut c_void"}}},
    {"NSCompareHashTables", "bool", {{"table1", "*const c_void"}, {"table2", "*const c_void"}}},
    {"NSCountHashTable", "NSUInteger", {{"table", "*const c_void"}}},
    {"NSAllHashTableObjects", "id", {{"table", "*const c_void"}}},
    {"NSCreateMapTable", "*mut c_void",
        {{"keyCallBacks", "*const c_void"}, {"valueCallBacks", "*const c_void"}, {"capacity", "NSUInteger"}}},
    {"NSFreeMapTable", "()", {{"table", "*mut c_void"}}},
    {"NSResetMapTable", "()", {{"table", "*mut c_void"}}},
    {"NSCompareMapTables", "bool", {{"table1", "*const c_void"}, {"table2", "*const c_void"}}},
    {"NSCountMapTable", "NSUInteger", {{"table", "*const c_void"}}},
    {"NSAllMapTableKeys", "id", {{"table", "*const c_void"}}},
    {"NSAllMapTableValues", "id", {{"table", "*const c_void"}}},

    // Reference counts
    {"NSExtraRefCount", "NSUInteger", {{"object", "id"}}},
    {"NSIncrementExtraRefCount", "()", {{"object", "id"}}},
    {"NSDecrementExtraRefCountWasZero", "bool", {{"object", "id"}}},
    {"NSShouldRetainWithZone", "bool", {{"object", "id"}, {"zone", "*mut c_void"}}},

    // Run loops
    {"NSRunLoopModeMinimumRunDate", "id", {{"runLoop", "id"}, {"mode", "id"}}},
    {"NSRunLoopModeIsWaiting", "bool", {{"runLoop", "id"}, {"mode", "id"}}},

    // Frames
    {"NSReturnAddress", "*mut c_void", {{"frame", "NSUInteger"}}},
    {"NSFrameAddress", "*mut c_void", {{"frame", "NSUInteger"}}},
    {"NSCountFrames", "NSUInteger", {}},
};
} // namespace

SignatureDatabase::SignatureDatabase()
{
    for (auto& signature : FOUNDATION_SIGNATURES) {
        signatures.emplace(signature.name, signature);
    }
}

const FunctionSignature* SignatureDatabase::Lookup(const std::string& name) const
{
    auto it = signatures.find(name);
    return it == signatures.end() ? nullptr : &it->second;
}

void SignatureDatabase::Register(FunctionSignature signature)
{
    auto name = signature.name;
    signatures[name] = std::move(signature);
}

std::string SignatureDatabase::RenderFunction(const FunctionSignature& signature)
{
    std::vector<std::string> params;
    for (auto& param : signature.params) {
        params.emplace_back(Join(param.first, ": ", param.second));
    }
    if (signature.isVariadic) {
        params.emplace_back(VARIADIC_MARKER);
    }
    auto paramStr = JoinVec<std::string>(params, [](const std::string& s) { return s; });
    auto retStr = signature.returnType == UNIT_RETURN ? "" : Join(" -> ", signature.returnType);
    return Join("    /// ", signature.name, "\n", "    pub fn ", signature.name, "(", paramStr, ")", retStr, ";\n");
}
