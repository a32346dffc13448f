// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares class for Rust binding generation from Objective-C class records.
 */

#ifndef OBJCBIND_GENERATE_BINDINGGENERATOR_H
#define OBJCBIND_GENERATE_BINDINGGENERATOR_H

#include <string>
#include <vector>

#include "objcbind/Basic/BindingConfigReader.h"
#include "objcbind/Generate/CodeWriter.h"
#include "objcbind/Generate/GenerationReport.h"
#include "objcbind/Generate/SignatureDatabase.h"
#include "objcbind/Model/InterfaceModel.h"

namespace ObjCBind::Generate {
/**
 * Renders a module made of a fixed preamble (imports, Foundation functions and types) followed by one
 * wrapper type per class. Every method becomes an `objc_msgSend` call through the dispatch entry point
 * its return type requires. Methods and classes that cannot be rendered are left out, with a comment in
 * the output and an entry in the report.
 */
class BindingGenerator {
public:
    BindingGenerator(const BindingConfigReader& config, const SignatureDatabase& signatures);

    /// Same input, same output: the generator keeps no state between calls apart from the last report.
    std::string Generate(const std::vector<ClassRecord>& classes);

    const GenerationReport& GetReport() const
    {
        return report;
    }

private:
    const BindingConfigReader& config;
    const SignatureDatabase& signatures;
    GenerationReport report;
    CodeWriter writer;

    void GeneratePreamble();
    void GenerateImports();
    void GenerateFoundationFunctions();
    void GenerateFoundationTypes();
    void GenerateStruct(const std::vector<std::string>& attributes, const std::string& name,
        const std::vector<std::string>& fields);

    void GenerateClass(const ClassRecord& record);
    void GenerateClassDocs(const ClassRecord& record);
    void GenerateClassAccessor(const ClassRecord& record);
    void GenerateMethods(const ClassRecord& record);
    void GenerateMethod(const ClassRecord& record, const MethodRecord& method, const std::string& baseName,
        size_t duplicateIndex);
    void GenerateStringExtensions();
    void SkipMethod(const ClassRecord& record, const MethodRecord& method, const std::string& reason);
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_BINDINGGENERATOR_H
