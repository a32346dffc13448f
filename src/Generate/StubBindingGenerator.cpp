// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements class for Rust declarations of the C symbols exported by stub libraries.
 */

#include "objcbind/Generate/StubBindingGenerator.h"

#include "objcbind/Basic/Utils.h"
#include "objcbind/Generate/NameGenerator.h"

using namespace ObjCBind;
using namespace ObjCBind::Generate;

namespace {
constexpr auto HEADER_COMMENT = "// Auto-generated bindings from stub library exports";
constexpr auto DO_NOT_EDIT_COMMENT = "// DO NOT EDIT - regenerate with objcbind";
constexpr auto LIBRARY_COMMENT = "// Library: ";
constexpr auto UNKNOWN_SIGNATURE_COMMENT = "// Unknown signature: ";
constexpr auto EXTERN_C_BLOCK = "unsafe extern \"C\"";
constexpr auto OPAQUE_CONSTANT_TYPE = "*const c_void";
} // namespace

StubBindingGenerator::StubBindingGenerator(const BindingConfigReader& config, const SignatureDatabase& signatures)
    : config(config), signatures(signatures), classifier(config.functionPrefixes)
{
}

std::string StubBindingGenerator::Generate(const std::vector<StubExportSet>& stubs)
{
    report = GenerationReport();
    declared.clear();
    (void)writer.Take();

    GenerateHeader(stubs);
    writer.WriteBlock(
        [this, &stubs]() {
            for (auto& exports : stubs) {
                GenerateFunctions(exports);
            }
            for (auto& exports : stubs) {
                GenerateConstants(exports);
            }
        },
        EXTERN_C_BLOCK);
    return writer.Take();
}

void StubBindingGenerator::GenerateHeader(const std::vector<StubExportSet>& stubs)
{
    writer.WriteSeq({HEADER_COMMENT, DO_NOT_EDIT_COMMENT});
    for (auto& exports : stubs) {
        if (!exports.installName.empty()) {
            writer.WriteLine(Join(LIBRARY_COMMENT, exports.installName));
        }
    }
    writer.WriteLine();
    writer.WriteSeq({"use crate::objc::{id, Class, SEL};", "use crate::foundation::*;", "use core::ffi::c_void;", ""});
}

bool StubBindingGenerator::ClaimName(const std::string& symbol, const std::string& name)
{
    if (!declared.insert(name).second) {
        return false;
    }
    if (!Utils::IsAsciiIdentifier(name) || NameGenerator::IsReservedWord(name)) {
        report.skippedSymbols.push_back(symbol);
        return false;
    }
    return true;
}

void StubBindingGenerator::GenerateFunctions(const StubExportSet& exports)
{
    for (auto& symbol : classifier.FunctionSymbols(exports)) {
        auto name = SymbolClassifier::StripUnderscore(symbol);
        auto signature = signatures.Lookup(name);
        // Without a signature a symbol that is also a constant is declared by the constant pass.
        if (signature == nullptr && classifier.IsConstant(symbol)) {
            continue;
        }
        if (!ClaimName(symbol, name)) {
            continue;
        }
        if (signature == nullptr) {
            report.unknownSymbols.push_back(name);
            if (config.emitUnknownSymbols) {
                writer.WriteLine(Join(UNKNOWN_SIGNATURE_COMMENT, name));
            }
            continue;
        }
        writer.WriteRaw(SignatureDatabase::RenderFunction(*signature));
        ++report.boundFunctions;
    }
}

void StubBindingGenerator::GenerateConstants(const StubExportSet& exports)
{
    for (auto& symbol : classifier.ConstantSymbols(exports)) {
        auto name = SymbolClassifier::StripUnderscore(symbol);
        if (!ClaimName(symbol, name)) {
            continue;
        }
        writer.WriteSeq({Join("/// ", name), Join("pub static ", name, ": ", OPAQUE_CONSTANT_TYPE, ";")});
        ++report.boundConstants;
    }
}
