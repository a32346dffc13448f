// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the language-agnostic interface model shared by the parsers and the generators.
 */

#ifndef OBJCBIND_MODEL_INTERFACEMODEL_H
#define OBJCBIND_MODEL_INTERFACEMODEL_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ObjCBind {
struct MethodRecord {
    std::string selector;
    std::string encoding; // Raw runtime type encoding, decoded lazily by the generator.

    bool operator==(const MethodRecord& other) const
    {
        return selector == other.selector && encoding == other.encoding;
    }
};

struct PropertyRecord {
    std::string name;
    std::string attributes;

    bool operator==(const PropertyRecord& other) const
    {
        return name == other.name && attributes == other.attributes;
    }
};

struct ClassRecord {
    std::string name;
    std::optional<std::string> superclass;
    std::vector<MethodRecord> methods;
    std::vector<PropertyRecord> properties;

    explicit ClassRecord(std::string name = "") : name(std::move(name))
    {
    }

    bool operator==(const ClassRecord& other) const
    {
        return name == other.name && superclass == other.superclass && methods == other.methods &&
            properties == other.properties;
    }
};

enum class StubVersion : uint8_t { V3 = 3, V4 = 4 };

/**
 * Exports of one stub-library descriptor, flattened over all of its export stanzas in document order.
 * Duplicates are preserved.
 */
struct StubExportSet {
    StubVersion version = StubVersion::V3;
    std::string installName;
    std::vector<std::string> symbols;
    std::vector<std::string> objcClasses;
    std::vector<std::string> objcIvars;

    bool operator==(const StubExportSet& other) const
    {
        return version == other.version && installName == other.installName && symbols == other.symbols &&
            objcClasses == other.objcClasses && objcIvars == other.objcIvars;
    }
};

/// Everything one run has parsed: the class records of a dump and the exports of every stub descriptor.
struct InterfaceModel {
    std::vector<ClassRecord> classes;
    std::vector<StubExportSet> stubs;

    bool operator==(const InterfaceModel& other) const
    {
        return classes == other.classes && stubs == other.stubs;
    }
};
} // namespace ObjCBind

#endif // OBJCBIND_MODEL_INTERFACEMODEL_H
