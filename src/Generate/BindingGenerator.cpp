// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements class for Rust binding generation from Objective-C class records.
 */

#include "objcbind/Generate/BindingGenerator.h"

#include <unordered_map>

#include "objcbind/Encoding/TypeEncoding.h"
#include "objcbind/Generate/NameGenerator.h"
#include "objcbind/Generate/TypeMapper.h"

using namespace ObjCBind;
using namespace ObjCBind::Encoding;
using namespace ObjCBind::Generate;

namespace {
constexpr auto HEADER_COMMENT = "// Auto-generated Objective-C bindings from runtime introspection";
constexpr auto DO_NOT_EDIT_COMMENT = "// DO NOT EDIT - regenerate with class_dump";
constexpr auto FOUNDATION_FUNCTIONS_COMMENT = "// Essential Foundation C functions";
constexpr auto FOUNDATION_TYPES_COMMENT = "// Basic Foundation types";
constexpr auto OPAQUE_TYPES_COMMENT = "// Common opaque Foundation types";
constexpr auto FOUNDATION_LINK_ATTR_HEAD = "#[cfg_attr(all(target_vendor = \"apple\", feature = \"runtime\"),";
constexpr auto FOUNDATION_LINK_ATTR_TAIL = "           link(name = \"Foundation\", kind = \"framework\"))]";
constexpr auto EXTERN_C_BLOCK = "unsafe extern \"C\"";

constexpr auto REPR_C = "#[repr(C)]";
constexpr auto REPR_TRANSPARENT = "#[repr(transparent)]";
constexpr auto DERIVE_COPY = "#[derive(Debug, Copy, Clone)]";
constexpr auto DERIVE_COPY_EQ = "#[derive(Debug, Copy, Clone, PartialEq)]";
constexpr auto INLINE_ATTR = "#[inline]";

constexpr auto SKIPPED_PREFIX = "// Skipped: ";
constexpr auto UNRENDERABLE_NAME = "no usable method name";
constexpr auto UNPARSEABLE_ENCODING = "unparseable encoding: ";
constexpr auto MISSING_IMPLICIT_ARGS = "missing receiver and selector arguments";

constexpr size_t IMPLICIT_ARG_COUNT = 2; // receiver and selector
constexpr auto ARG_PREFIX = "arg";

const std::vector<std::string> FOUNDATION_FUNCTIONS = {
    "NSLog", "NSClassFromString", "NSSelectorFromString", "NSStringFromClass", "NSStringFromSelector"};

std::string Identity(const std::string& s)
{
    return s;
}
} // namespace

BindingGenerator::BindingGenerator(const BindingConfigReader& config, const SignatureDatabase& signatures)
    : config(config), signatures(signatures)
{
}

std::string BindingGenerator::Generate(const std::vector<ClassRecord>& classes)
{
    report = GenerationReport();
    (void)writer.Take();

    GeneratePreamble();
    for (auto& record : classes) {
        GenerateClass(record);
    }
    return writer.Take();
}

/* ------------------------preamble------------------------ */
void BindingGenerator::GeneratePreamble()
{
    GenerateImports();
    GenerateFoundationFunctions();
    GenerateFoundationTypes();
}

void BindingGenerator::GenerateImports()
{
    writer.WriteSeq({HEADER_COMMENT, DO_NOT_EDIT_COMMENT, ""});
    writer.WriteSeq({"use crate::objc::{", "    id, Class, SEL, objc_getClass, sel_registerName,",
        "    objc_ivar, objc_method, objc_method_description, objc_property_t,", "};"});
    writer.WriteSeq({"use std::ffi::CString;", "use core::ffi::c_void;", ""});
}

void BindingGenerator::GenerateFoundationFunctions()
{
    writer.WriteSeq({FOUNDATION_FUNCTIONS_COMMENT, FOUNDATION_LINK_ATTR_HEAD, FOUNDATION_LINK_ATTR_TAIL});
    writer.WriteBlock(
        [this]() {
            for (auto& name : FOUNDATION_FUNCTIONS) {
                if (auto signature = signatures.Lookup(name)) {
                    writer.WriteRaw(SignatureDatabase::RenderFunction(*signature));
                }
            }
        },
        EXTERN_C_BLOCK);
    writer.WriteLine();
}

void BindingGenerator::GenerateFoundationTypes()
{
    writer.WriteSeq({FOUNDATION_TYPES_COMMENT, "pub type NSInteger = isize;", "pub type NSUInteger = usize;",
        "pub type CGFloat = f64;", "pub type NSTimeInterval = f64;", ""});

    GenerateStruct({REPR_C, DERIVE_COPY_EQ}, "NSRange", {"pub location: NSUInteger,", "pub length: NSUInteger,"});

    writer.WriteLine(OPAQUE_TYPES_COMMENT);
    GenerateStruct({REPR_C}, "NSZone", {"_private: [u8; 0],"});
    GenerateStruct({REPR_C, DERIVE_COPY}, "NSProgressFraction", {"pub completed: i64,", "pub total: i64,"});
    GenerateStruct({REPR_C, DERIVE_COPY}, "NSDecimal", {"_private: [u8; 20],"});
    GenerateStruct({REPR_C, DERIVE_COPY}, "NSFastEnumerationState",
        {"pub state: u64,", "pub itemsPtr: *mut id,", "pub mutationsPtr: *mut u64,", "pub extra: [u64; 5],"});
}

void BindingGenerator::GenerateStruct(
    const std::vector<std::string>& attributes, const std::string& name, const std::vector<std::string>& fields)
{
    writer.WriteSeq(attributes);
    writer.WriteBlock([this, &fields]() { writer.WriteSeq(fields); }, Join("pub struct ", name));
    writer.WriteLine();
}
/* -------------------------------------------------------- */

void BindingGenerator::GenerateClass(const ClassRecord& record)
{
    if (!config.IsClassSelected(record.name)) {
        report.filteredClasses.push_back(record.name);
        return;
    }
    auto typeName = NameGenerator::SanitizeClassName(record.name);
    if (!NameGenerator::IsUsableTypeName(typeName)) {
        report.skippedClasses.push_back(record.name);
        return;
    }

    writer.WriteLine();
    GenerateClassDocs(record);
    writer.WriteSeq({REPR_TRANSPARENT, Join("pub struct ", typeName, "(pub id);"), ""});
    writer.WriteBlock(
        [this, &record]() {
            GenerateClassAccessor(record);
            GenerateMethods(record);
            if (record.name == config.stringClass) {
                GenerateStringExtensions();
            }
        },
        Join("impl ", typeName));
    ++report.boundClasses;
}

void BindingGenerator::GenerateClassDocs(const ClassRecord& record)
{
    writer.WriteLine(Join("/// Objective-C class: ", record.name));
    if (record.superclass) {
        writer.WriteLine(Join("/// Superclass: ", *record.superclass));
    }
    if (!config.emitPropertyDocs) {
        return;
    }
    for (auto& property : record.properties) {
        if (property.attributes.empty()) {
            writer.WriteLine(Join("/// Property: ", property.name));
        } else {
            writer.WriteLine(Join("/// Property: ", property.name, " [", property.attributes, "]"));
        }
    }
}

/*
 *   pub unsafe fn class() -> Class {
 *       let name = CString::new("NSString").unwrap();
 *       objc_getClass(name.as_ptr() as *const i8)
 *   }
 */
void BindingGenerator::GenerateClassAccessor(const ClassRecord& record)
{
    writer.WriteLine("/// Get the Objective-C Class object");
    writer.WriteFunc("pub unsafe fn class() -> Class", [this, &record]() {
        writer.WriteSeq({Join("let name = CString::new(\"", NameGenerator::EscapeStringLiteral(record.name),
                             "\").unwrap();"),
            "objc_getClass(name.as_ptr() as *const i8)"});
    });
}

void BindingGenerator::GenerateMethods(const ClassRecord& record)
{
    // Counts every method, rendered or not, so a name keeps its suffix whatever happens to earlier methods.
    std::unordered_map<std::string, size_t> seenNames;
    for (auto& method : record.methods) {
        auto baseName = NameGenerator::SanitizeSelector(method.selector);
        auto duplicateIndex = seenNames[baseName]++;
        GenerateMethod(record, method, baseName, duplicateIndex);
    }
}

void BindingGenerator::GenerateMethod(
    const ClassRecord& record, const MethodRecord& method, const std::string& baseName, size_t duplicateIndex)
{
    if (baseName.empty()) {
        SkipMethod(record, method, UNRENDERABLE_NAME);
        return;
    }
    auto signature = DecodeSignature(method.encoding);
    if (!signature) {
        SkipMethod(record, method, Join(UNPARSEABLE_ENCODING, method.encoding));
        return;
    }
    if (signature->argTypes.size() < IMPLICIT_ARG_COUNT) {
        SkipMethod(record, method, MISSING_IMPLICIT_ARGS);
        return;
    }

    std::vector<std::string> argTypes;
    std::vector<std::string> argNames;
    for (size_t i = IMPLICIT_ARG_COUNT; i < signature->argTypes.size(); ++i) {
        argTypes.push_back(TypeMapper::RenderType(signature->argTypes[i]));
        argNames.push_back(Join(ARG_PREFIX, i - IMPLICIT_ARG_COUNT));
    }
    std::vector<std::string> params;
    for (size_t i = 0; i < argTypes.size(); ++i) {
        params.push_back(Join(argNames[i], ": ", argTypes[i]));
    }
    auto retType = TypeMapper::RenderType(signature->returnType);
    auto entryPoint = TypeMapper::DispatchEntryPoint(signature->returnType);
    auto name = NameGenerator::DeduplicatedName(baseName, duplicateIndex);
    auto selector = NameGenerator::EscapeStringLiteral(NameGenerator::DispatchSelector(method.selector));

    writer.WriteLine();
    writer.WriteSeq({Join("/// Objective-C method `", method.selector, "`"),
        Join("/// Type encoding: `", method.encoding, "`"), INLINE_ATTR});
    auto funcSig =
        Join("pub unsafe fn ", name, "(&self", JoinVec<std::string>(params, Identity, ", ", ", ", "", false), ") -> ",
            retType);
    writer.WriteFunc(funcSig, [&]() {
        writer.WriteSeq({
            Join("let sel = sel_registerName(b\"", selector, "\\0\".as_ptr() as *const i8);"),
            Join("type MsgSend = unsafe extern \"C\" fn(id, SEL",
                JoinVec<std::string>(argTypes, Identity, ", ", ", ", "", false), ") -> ", retType, ";"),
            Join("let msg_send: MsgSend = std::mem::transmute(crate::objc::", entryPoint, " as *const ());"),
            Join("msg_send(self.0, sel", JoinVec<std::string>(argNames, Identity, ", ", ", ", "", false), ")"),
        });
    });
    ++report.boundMethods;
}

void BindingGenerator::SkipMethod(const ClassRecord& record, const MethodRecord& method, const std::string& reason)
{
    writer.WriteLine(Join(SKIPPED_PREFIX, method.selector, " (", reason, ")"));
    report.skippedMethods.push_back(Join(record.name, " ", method.selector));
}

void BindingGenerator::GenerateStringExtensions()
{
    writer.WriteLine();
    writer.WriteLine("/// Create an NSString from a Rust str");
    writer.WriteFunc("pub unsafe fn from_str(s: &str) -> Option<Self>", [this]() {
        writer.WriteSeq({"let class = Self::class();",
            "let sel = sel_registerName(b\"stringWithUTF8String:\\0\".as_ptr() as *const i8);",
            "let c_str = CString::new(s).ok()?;", "",
            "type MsgSend = unsafe extern \"C\" fn(Class, SEL, *const i8) -> id;",
            "let msg_send: MsgSend = std::mem::transmute(crate::objc::objc_msgSend as *const ());", "",
            "let result = msg_send(class, sel, c_str.as_ptr());",
            "if result.is_null() { None } else { Some(Self(result)) }"});
    });
    writer.WriteLine();
    writer.WriteLine("/// Get UTF-8 C string");
    writer.WriteFunc("pub unsafe fn utf8_string(&self) -> Option<*const i8>", [this]() {
        writer.WriteSeq({"let sel = sel_registerName(b\"UTF8String\\0\".as_ptr() as *const i8);",
            "type MsgSend = unsafe extern \"C\" fn(id, SEL) -> *const i8;",
            "let msg_send: MsgSend = std::mem::transmute(crate::objc::objc_msgSend as *const ());",
            "let result = msg_send(self.0, sel);", "if result.is_null() { None } else { Some(result) }"});
    });
}
