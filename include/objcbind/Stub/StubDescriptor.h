// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the parser of text-based stub-library descriptors (TAPI .tbd files, versions 3 and 4).
 */

#ifndef OBJCBIND_STUB_STUBDESCRIPTOR_H
#define OBJCBIND_STUB_STUBDESCRIPTOR_H

#include <optional>
#include <string>

#include "objcbind/Model/InterfaceModel.h"

namespace ObjCBind {
bool HasStubV3Marker(const std::string& content);
bool HasStubV4Marker(const std::string& content);

/**
 * Parse \ref content as a version 3 descriptor.
 * @return std::nullopt when the v3 marker is absent or the document does not deserialize.
 */
std::optional<StubExportSet> ParseStubDescriptorV3(const std::string& content);

/**
 * Parse \ref content as a version 4 descriptor.
 * @return std::nullopt when the v4 marker is absent or the document does not deserialize.
 */
std::optional<StubExportSet> ParseStubDescriptorV4(const std::string& content);

/**
 * Try version 3, then version 4. No result means "not a stub descriptor this tool understands"; it is not a
 * fatal error.
 */
std::optional<StubExportSet> ParseStubDescriptor(const std::string& content);
} // namespace ObjCBind

#endif // OBJCBIND_STUB_STUBDESCRIPTOR_H
