// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares class for Rust declarations of the C symbols exported by stub libraries.
 */

#ifndef OBJCBIND_GENERATE_STUBBINDINGGENERATOR_H
#define OBJCBIND_GENERATE_STUBBINDINGGENERATOR_H

#include <string>
#include <unordered_set>
#include <vector>

#include "objcbind/Basic/BindingConfigReader.h"
#include "objcbind/Generate/CodeWriter.h"
#include "objcbind/Generate/GenerationReport.h"
#include "objcbind/Generate/SignatureDatabase.h"
#include "objcbind/Model/InterfaceModel.h"
#include "objcbind/Stub/SymbolClassifier.h"

namespace ObjCBind::Generate {
/**
 * Functions are declared only when their signature is known; constants are declared as opaque pointers.
 * Each name is declared once, at its first occurrence over all export sets.
 */
class StubBindingGenerator {
public:
    StubBindingGenerator(const BindingConfigReader& config, const SignatureDatabase& signatures);

    std::string Generate(const std::vector<StubExportSet>& stubs);

    const GenerationReport& GetReport() const
    {
        return report;
    }

private:
    const BindingConfigReader& config;
    const SignatureDatabase& signatures;
    SymbolClassifier classifier;
    GenerationReport report;
    CodeWriter writer;
    std::unordered_set<std::string> declared;

    void GenerateHeader(const std::vector<StubExportSet>& stubs);
    void GenerateFunctions(const StubExportSet& exports);
    void GenerateConstants(const StubExportSet& exports);
    /// True when \ref name is not declared yet and is usable; a name is claimed at most once.
    bool ClaimName(const std::string& symbol, const std::string& name);
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_STUBBINDINGGENERATOR_H
