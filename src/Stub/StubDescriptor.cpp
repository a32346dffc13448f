// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the parser of text-based stub-library descriptors on top of LLVM's YAML I/O.
 *
 * Both supported versions share the part of the layout this tool reads:
 *
 *     --- !tapi-tbd-v3
 *     install-name: /System/Library/Frameworks/Foundation.framework/Foundation
 *     exports:
 *       - archs: [ arm64 ]
 *         symbols: [ _NSLog, _kCFAllocatorDefault ]
 *         objc-classes: [ NSString ]
 *         objc-ivars: [ NSString._length ]
 *
 * Keys this tool does not read (archs, targets, uuids, flags, versions...) are accepted and ignored.
 */

#include "objcbind/Stub/StubDescriptor.h"

#include <utility>
#include <vector>

#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLTraits.h"

#include "objcbind/Basic/Print.h"
#include "objcbind/Basic/Utils.h"

namespace ObjCBind::TextStub {
struct ExportSection {
    std::vector<std::string> symbols;
    std::vector<std::string> objcClasses;
    std::vector<std::string> objcIvars;
};

struct StubDocument {
    unsigned tbdVersion = 0; // Only present in "--- !tapi-tbd" documents.
    std::string installName;
    std::vector<ExportSection> exports;
};
} // namespace ObjCBind::TextStub

LLVM_YAML_IS_SEQUENCE_VECTOR(ObjCBind::TextStub::ExportSection)

namespace llvm::yaml {
using ObjCBind::TextStub::ExportSection;
using ObjCBind::TextStub::StubDocument;

template <> struct MappingTraits<ExportSection> {
    static void mapping(IO& io, ExportSection& section)
    {
        io.mapOptional("symbols", section.symbols);
        io.mapOptional("objc-classes", section.objcClasses);
        io.mapOptional("objc-ivars", section.objcIvars);
    }
};

template <> struct MappingTraits<StubDocument> {
    static void mapping(IO& io, StubDocument& doc)
    {
        io.mapOptional("tbd-version", doc.tbdVersion);
        io.mapOptional("install-name", doc.installName);
        io.mapOptional("exports", doc.exports);
    }
};
} // namespace llvm::yaml

using namespace ObjCBind;
using namespace ObjCBind::TextStub;

namespace {
constexpr auto V3_MARKER = "!tapi-tbd-v3";
constexpr auto V4_MARKER = "!tapi-tbd-v4";
// Untagged "--- !tapi-tbd" documents are read with the v3 layout first.
constexpr auto GENERIC_DOCUMENT_START = "--- !tapi-tbd";

// YAML diagnostics only reach debug builds; the caller only learns that the document is not in this format.
void IgnoreDiagnostic(const llvm::SMDiagnostic& diag, void* context)
{
    (void)context;
    Debugln("stub descriptor:", diag.getMessage().str());
}

std::optional<StubExportSet> Deserialize(const std::string& content, StubVersion version)
{
    llvm::yaml::Input yin(content, nullptr, IgnoreDiagnostic);
    yin.setAllowUnknownKeys(true);
    StubDocument doc;
    yin >> doc;
    if (yin.error()) {
        return std::nullopt;
    }

    StubExportSet res;
    res.version = doc.tbdVersion == static_cast<unsigned>(StubVersion::V4) ? StubVersion::V4 : version;
    res.installName = std::move(doc.installName);
    for (auto& section : doc.exports) {
        res.symbols.insert(res.symbols.end(), section.symbols.begin(), section.symbols.end());
        res.objcClasses.insert(res.objcClasses.end(), section.objcClasses.begin(), section.objcClasses.end());
        res.objcIvars.insert(res.objcIvars.end(), section.objcIvars.begin(), section.objcIvars.end());
    }
    return res;
}
} // namespace

bool ObjCBind::HasStubV3Marker(const std::string& content)
{
    return content.find(V3_MARKER) != std::string::npos || Utils::StartsWith(content, GENERIC_DOCUMENT_START);
}

bool ObjCBind::HasStubV4Marker(const std::string& content)
{
    return content.find(V4_MARKER) != std::string::npos;
}

std::optional<StubExportSet> ObjCBind::ParseStubDescriptorV3(const std::string& content)
{
    if (!HasStubV3Marker(content)) {
        return std::nullopt;
    }
    return Deserialize(content, StubVersion::V3);
}

std::optional<StubExportSet> ObjCBind::ParseStubDescriptorV4(const std::string& content)
{
    if (!HasStubV4Marker(content)) {
        return std::nullopt;
    }
    return Deserialize(content, StubVersion::V4);
}

std::optional<StubExportSet> ObjCBind::ParseStubDescriptor(const std::string& content)
{
    if (auto res = ParseStubDescriptorV3(content)) {
        return res;
    }
    return ParseStubDescriptorV4(content);
}
