// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the Driver.
 */

#include "objcbind/Driver/Driver.h"

#include "objcbind/Basic/Print.h"
#include "objcbind/ClassDump/ClassDumpParser.h"
#include "objcbind/Generate/BindingGenerator.h"
#include "objcbind/Generate/StubBindingGenerator.h"
#include "objcbind/Model/ModelSerialization.h"
#include "objcbind/Stub/StubDescriptor.h"
#include "objcbind/Utils/FileUtil.h"

using namespace ObjCBind;
using namespace ObjCBind::Generate;

namespace {
void PrintReport(const std::string& title, const GenerationReport& report, bool verbose)
{
    if (!verbose) {
        if (report.SkippedCount() != 0) {
            Warningln(title, ": ", report.SkippedCount(), " declarations skipped, run with '--verbose' for details");
        }
        return;
    }
    for (auto& line : report.Summary()) {
        Infoln(title, ": ", line);
    }
    for (auto& name : report.skippedClasses) {
        Infoln("skipped class '", name, "'");
    }
    for (auto& name : report.skippedMethods) {
        Infoln("skipped method '", name, "'");
    }
    for (auto& name : report.skippedSymbols) {
        Infoln("skipped symbol '", name, "'");
    }
}
} // namespace

Driver::Driver() : optionTable(CreateOptionTable())
{
}

bool Driver::ParseArgs(const std::vector<std::string>& args)
{
    if (!optionTable->ParseArgs(args, argList)) {
        return false;
    }
    return options.ParseFromArgs(argList);
}

bool Driver::LoadConfig()
{
    if (options.configPath.has_value()) {
        if (!FileUtil::FileExist(*options.configPath)) {
            Errorln("config file '", *options.configPath, "' does not exist");
            return false;
        }
        if (!config.Parse(*options.configPath) || !config.Validate()) {
            return false;
        }
        if (options.verbose) {
            Infoln("loaded config '", *options.configPath, "'");
        }
    }
    // Signatures from the configuration override the built-in ones.
    for (auto& signature : config.functions) {
        signatures.Register(signature);
    }
    return true;
}

void Driver::ParseClassDumpInput(InterfaceModel& model)
{
    if (!options.classDumpPath.has_value()) {
        return;
    }
    std::string failedReason;
    auto content = FileUtil::ReadFileContent(*options.classDumpPath, failedReason);
    if (!content.has_value()) {
        Errorln("cannot read class-dump file '", *options.classDumpPath, "': ", failedReason);
        inputFailed = true;
        return;
    }
    model.classes = ParseClassDump(*content);
    classDumpRead = true;
    if (options.verbose) {
        Infoln("parsed ", model.classes.size(), " classes from '", *options.classDumpPath, "'");
    }
}

void Driver::ParseStubInputs(InterfaceModel& model)
{
    for (auto& path : options.stubPaths) {
        std::string failedReason;
        auto content = FileUtil::ReadFileContent(path, failedReason);
        if (!content.has_value()) {
            Errorln("cannot read stub file '", path, "': ", failedReason);
            inputFailed = true;
            continue;
        }
        auto exports = ParseStubDescriptor(*content);
        if (!exports.has_value()) {
            Warningln("'", path, "' is not a recognized stub library, skipped");
            continue;
        }
        if (options.verbose) {
            Infoln("parsed ", exports->symbols.size(), " symbols from '", path, "' (v",
                static_cast<int>(exports->version), ")");
        }
        model.stubs.emplace_back(std::move(*exports));
    }
}

std::optional<InterfaceModel> Driver::BuildModel()
{
    if (options.fromModelPath.has_value()) {
        auto model = LoadModelFromFile(*options.fromModelPath);
        if (model.has_value() && options.verbose) {
            Infoln("loaded model '", *options.fromModelPath, "' with ", model->classes.size(), " classes and ",
                model->stubs.size(), " stub libraries");
        }
        return model;
    }
    InterfaceModel model;
    ParseClassDumpInput(model);
    ParseStubInputs(model);
    return model;
}

bool Driver::WriteOutput(const std::optional<std::string>& path, const std::string& text) const
{
    if (!path.has_value()) {
        PrintNoSplit(text);
        return true;
    }
    if (!FileUtil::WriteToFile(*path, text)) {
        return false;
    }
    if (options.verbose) {
        Infoln("wrote '", *path, "'");
    }
    return true;
}

bool Driver::EmitBindings(const InterfaceModel& model)
{
    // An unreadable class dump produces no class bindings; the stub libraries are still bound.
    bool hasClasses = classDumpRead || !model.classes.empty();
    bool hasStubs = !model.stubs.empty();
    std::string classText;
    if (hasClasses) {
        BindingGenerator generator(config, signatures);
        classText = generator.Generate(model.classes);
        PrintReport("class bindings", generator.GetReport(), options.verbose);
    }
    std::string stubText;
    if (hasStubs) {
        StubBindingGenerator generator(config, signatures);
        stubText = generator.Generate(model.stubs);
        PrintReport("stub bindings", generator.GetReport(), options.verbose);
    }

    // Without '--stub-output' the stub bindings follow the class bindings in the same output.
    if (hasStubs && !options.stubOutputPath.has_value()) {
        if (hasClasses) {
            classText += "\n";
        }
        classText += stubText;
        hasClasses = true;
        hasStubs = false;
    }
    bool success = true;
    if (hasClasses) {
        success = WriteOutput(options.outputPath, classText) && success;
    }
    if (hasStubs) {
        success = WriteOutput(options.stubOutputPath, stubText) && success;
    }
    return success;
}

int Driver::Run()
{
    if (options.showHelp) {
        optionTable->PrintHelp("objcbind");
        return 0;
    }
    if (options.showVersion) {
        Println("objcbind version", OBJCBIND_VERSION);
        return 0;
    }
    if (!LoadConfig()) {
        return 1;
    }
    auto model = BuildModel();
    if (!model.has_value()) {
        return 1;
    }
    if (options.emitModelPath.has_value()) {
        if (!SaveModelToFile(*model, *options.emitModelPath)) {
            Errorln("cannot write model file '", *options.emitModelPath, "'");
            return 1;
        }
        if (options.verbose) {
            Infoln("saved model '", *options.emitModelPath, "'");
        }
    }
    if (!EmitBindings(*model)) {
        return 1;
    }
    return inputFailed ? 1 : 0;
}

int ObjCBind::ExecuteObjCBind(const std::vector<std::string>& args)
{
    Driver driver;
    if (!driver.ParseArgs(args)) {
        WriteError("Invalid options. Try: 'objcbind --help' for more information.\n");
        return 1;
    }
    return driver.Run();
}
