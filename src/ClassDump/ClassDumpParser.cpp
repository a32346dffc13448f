// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the parser of runtime class dumps.
 */

#include "objcbind/ClassDump/ClassDumpParser.h"

#include <optional>
#include <utility>

#include "objcbind/Basic/Utils.h"

using namespace ObjCBind;
using namespace ObjCBind::Utils;

namespace {
constexpr auto INTERFACE_MARKER = "@interface ";
constexpr auto SUPERCLASS_MARKER = "Superclass: ";
constexpr auto METHODS_HEADER = "Methods (";
constexpr auto PROPERTIES_HEADER = "Properties (";
constexpr auto END_MARKER = "@end";
constexpr auto METHOD_MARKER = "- ";
constexpr auto PROPERTY_MARKER = "@property ";
constexpr auto ENCODING_OPEN = " [";
constexpr char ENCODING_CLOSE = ']';

class ClassDumpParser {
public:
    std::vector<ClassRecord> Parse(const std::string& content)
    {
        for (auto& rawLine : SplitLines(content)) {
            ParseLine(Trim(rawLine));
        }
        Flush();
        return std::move(classes);
    }

private:
    std::vector<ClassRecord> classes;
    std::optional<ClassRecord> current;
    bool inMethods = false;
    bool inProperties = false;

    void Flush()
    {
        if (current) {
            classes.emplace_back(std::move(*current));
            current.reset();
        }
    }

    void ParseLine(const std::string& line)
    {
        if (StartsWith(line, INTERFACE_MARKER)) {
            Flush();
            auto name = Trim(line.substr(std::string(INTERFACE_MARKER).size()));
            if (!name.empty()) {
                current.emplace(name);
            }
            inMethods = false;
            inProperties = false;
        } else if (StartsWith(line, SUPERCLASS_MARKER)) {
            if (current) {
                current->superclass = line.substr(std::string(SUPERCLASS_MARKER).size());
            }
        } else if (StartsWith(line, METHODS_HEADER)) {
            inMethods = true;
            inProperties = false;
        } else if (StartsWith(line, PROPERTIES_HEADER)) {
            inMethods = false;
            inProperties = true;
        } else if (line == END_MARKER) {
            inMethods = false;
            inProperties = false;
        } else if (inMethods && StartsWith(line, METHOD_MARKER)) {
            ParseMethod(line);
        } else if (inProperties && StartsWith(line, PROPERTY_MARKER)) {
            ParseProperty(line);
        }
    }

    // "- initWithString: [@24@0:8@16]"
    void ParseMethod(const std::string& line)
    {
        if (!current) {
            return;
        }
        auto sepPos = line.find(ENCODING_OPEN);
        if (sepPos == std::string::npos) {
            return;
        }
        // "- [v16@0:8]" has its separator inside the marker and no selector.
        size_t markerLen = std::string(METHOD_MARKER).size();
        auto selector = sepPos > markerLen ? Trim(line.substr(markerLen, sepPos - markerLen)) : std::string();
        auto encodingPart = line.substr(sepPos + std::string(ENCODING_OPEN).size());
        // An encoding without its closing bracket is kept as empty and rejected when it is decoded.
        std::string encoding;
        if (!encodingPart.empty() && encodingPart.back() == ENCODING_CLOSE) {
            encoding = Trim(encodingPart.substr(0, encodingPart.size() - 1));
        }
        current->methods.push_back(MethodRecord{selector, encoding});
    }

    // "@property length [TQ,R,N]"
    void ParseProperty(const std::string& line)
    {
        if (!current) {
            return;
        }
        auto rest = line.substr(std::string(PROPERTY_MARKER).size());
        auto sepPos = rest.find(ENCODING_OPEN);
        PropertyRecord property;
        if (sepPos == std::string::npos) {
            property.name = Trim(rest);
        } else {
            property.name = Trim(rest.substr(0, sepPos));
            auto attributes = rest.substr(sepPos + std::string(ENCODING_OPEN).size());
            if (!attributes.empty() && attributes.back() == ENCODING_CLOSE) {
                attributes.pop_back();
            }
            property.attributes = Trim(attributes);
        }
        if (!property.name.empty()) {
            current->properties.emplace_back(std::move(property));
        }
    }
};
} // namespace

std::vector<ClassRecord> ObjCBind::ParseClassDump(const std::string& content)
{
    ClassDumpParser parser;
    return parser.Parse(content);
}
