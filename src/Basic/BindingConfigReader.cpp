// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This document aims to parse the binding configuration, e.g.
 *
 *     [generator]
 *     string_class = "NSString"
 *
 *     [classes]
 *     exclude = ["NSProxy"]
 *
 *     [[function]]
 *     name = "CFRelease"
 *     return = "()"
 *     params = [ ["cf", "*const c_void"] ]
 */

#include "objcbind/Basic/BindingConfigReader.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wsign-conversion"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <toml.h>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace ObjCBind {
using namespace toml;

namespace {
const std::string GENERATOR_SECTION = "generator";
const std::string STRING_CLASS = "string_class";
const std::string EMIT_PROPERTY_DOCS = "emit_property_docs";
const std::string EMIT_UNKNOWN_SYMBOLS = "emit_unknown_symbols";
const std::string CLASSES_SECTION = "classes";
const std::string INCLUDE = "include";
const std::string EXCLUDE = "exclude";
const std::string SYMBOLS_SECTION = "symbols";
const std::string FUNCTION_PREFIXES = "function_prefixes";
const std::string FUNCTION_SECTION = "function";
const std::string FUNCTION_NAME = "name";
const std::string FUNCTION_RETURN = "return";
const std::string FUNCTION_VARIADIC = "variadic";
const std::string FUNCTION_PARAMS = "params";

const std::string UNIT_RETURN = "()";
constexpr size_t PARAM_PAIR_SIZE = 2;

bool FindTable(toml::Table& tbl, const std::string& key, toml::Table& out)
{
    if (tbl.find(key) == tbl.end() || !tbl[key].is<toml::Table>()) {
        return false;
    }
    out = tbl[key].as<toml::Table>();
    return true;
}

void ParseStringList(toml::Table& tbl, const std::string& key, std::vector<std::string>& out)
{
    if (tbl.find(key) == tbl.end() || !tbl[key].is<toml::Array>()) {
        return;
    }

    auto items = tbl[key].as<toml::Array>();
    out.clear();

    for (const auto& item : items) {
        if (!item.is<std::string>()) {
            continue;
        }
        out.push_back(item.as<std::string>());
    }
}

void ParseGeneratorConfig(toml::Table& tbl, BindingConfigReader& reader)
{
    toml::Table generatorTable;
    if (!FindTable(tbl, GENERATOR_SECTION, generatorTable)) {
        return;
    }

    if (generatorTable.find(STRING_CLASS) != generatorTable.end() && generatorTable[STRING_CLASS].is<std::string>()) {
        reader.stringClass = generatorTable[STRING_CLASS].as<std::string>();
    }
    if (generatorTable.find(EMIT_PROPERTY_DOCS) != generatorTable.end() &&
        generatorTable[EMIT_PROPERTY_DOCS].is<bool>()) {
        reader.emitPropertyDocs = generatorTable[EMIT_PROPERTY_DOCS].as<bool>();
    }
    if (generatorTable.find(EMIT_UNKNOWN_SYMBOLS) != generatorTable.end() &&
        generatorTable[EMIT_UNKNOWN_SYMBOLS].is<bool>()) {
        reader.emitUnknownSymbols = generatorTable[EMIT_UNKNOWN_SYMBOLS].as<bool>();
    }
}

void ParseClassesConfig(toml::Table& tbl, BindingConfigReader& reader)
{
    toml::Table classesTable;
    if (!FindTable(tbl, CLASSES_SECTION, classesTable)) {
        return;
    }

    ParseStringList(classesTable, INCLUDE, reader.includedClasses);
    ParseStringList(classesTable, EXCLUDE, reader.excludedClasses);
}

void ParseSymbolsConfig(toml::Table& tbl, BindingConfigReader& reader)
{
    toml::Table symbolsTable;
    if (!FindTable(tbl, SYMBOLS_SECTION, symbolsTable)) {
        return;
    }

    ParseStringList(symbolsTable, FUNCTION_PREFIXES, reader.functionPrefixes);
}

// params = [ ["name", "type"], ... ]; malformed pairs are dropped.
void ParseParams(toml::Table& functionTable, FunctionSignature& signature)
{
    if (functionTable.find(FUNCTION_PARAMS) == functionTable.end() ||
        !functionTable[FUNCTION_PARAMS].is<toml::Array>()) {
        return;
    }

    auto params = functionTable[FUNCTION_PARAMS].as<toml::Array>();
    for (const auto& item : params) {
        if (!item.is<toml::Array>()) {
            continue;
        }
        auto pair = item.as<toml::Array>();
        if (pair.size() != PARAM_PAIR_SIZE || !pair[0].is<std::string>() || !pair[1].is<std::string>()) {
            continue;
        }
        signature.params.emplace_back(pair[0].as<std::string>(), pair[1].as<std::string>());
    }
}

bool ParseSingleFunction(toml::Table& functionTable, FunctionSignature& signature)
{
    // Function name is required
    if (functionTable.find(FUNCTION_NAME) == functionTable.end() ||
        !functionTable[FUNCTION_NAME].is<std::string>()) {
        return false;
    }
    signature.name = functionTable[FUNCTION_NAME].as<std::string>();

    signature.returnType = UNIT_RETURN;
    if (functionTable.find(FUNCTION_RETURN) != functionTable.end() &&
        functionTable[FUNCTION_RETURN].is<std::string>()) {
        signature.returnType = functionTable[FUNCTION_RETURN].as<std::string>();
    }

    if (functionTable.find(FUNCTION_VARIADIC) != functionTable.end() &&
        functionTable[FUNCTION_VARIADIC].is<bool>()) {
        signature.isVariadic = functionTable[FUNCTION_VARIADIC].as<bool>();
    }

    ParseParams(functionTable, signature);
    return true;
}

void ParseFunctionConfigurations(toml::Table& tbl, BindingConfigReader& reader)
{
    if (tbl.find(FUNCTION_SECTION) == tbl.end()) {
        return;
    }

    const auto& functionEntry = tbl.find(FUNCTION_SECTION)->second;
    if (!functionEntry.is<toml::Array>()) {
        return;
    }

    auto functionArray = functionEntry.as<toml::Array>();

    for (const auto& functionItem : functionArray) {
        if (!functionItem.is<toml::Table>()) {
            continue;
        }

        FunctionSignature signature;
        auto functionTable = functionItem.as<toml::Table>();
        if (!ParseSingleFunction(functionTable, signature)) {
            continue;
        }

        reader.functions.push_back(std::move(signature));
    }
}

bool Contains(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}
} // namespace

bool BindingConfigReader::Parse(const std::string& filePath)
{
    try {
        auto parsed = toml::parseFile(filePath);
        if (!parsed.valid()) {
            std::cerr << "Error parsing config: " << parsed.errorReason << std::endl;
            return false;
        }
        toml::Table tbl = parsed.value.as<toml::Table>();

        ParseGeneratorConfig(tbl, *this);

        ParseClassesConfig(tbl, *this);

        ParseSymbolsConfig(tbl, *this);

        ParseFunctionConfigurations(tbl, *this);

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << std::endl;
        return false;
    }
}

bool BindingConfigReader::IsClassSelected(const std::string& className) const
{
    if (Contains(excludedClasses, className)) {
        return false;
    }
    return includedClasses.empty() || Contains(includedClasses, className);
}

bool BindingConfigReader::Validate() const
{
    if (stringClass.empty()) {
        std::cerr << "Validation failed: string class name is empty" << std::endl;
        return false;
    }

    for (const auto& name : includedClasses) {
        if (Contains(excludedClasses, name)) {
            std::cerr << "Validation failed: class '" << name << "' is both included and excluded" << std::endl;
            return false;
        }
    }

    for (const auto& prefix : functionPrefixes) {
        if (prefix.empty()) {
            std::cerr << "Validation failed: function prefix can not be empty" << std::endl;
            return false;
        }
    }

    for (const auto& function : functions) {
        if (function.name.empty()) {
            std::cerr << "Validation failed: function name can not be empty" << std::endl;
            return false;
        }
        if (function.returnType.empty()) {
            std::cerr << "Validation failed for function '" << function.name << "': return type is empty"
                      << std::endl;
            return false;
        }
    }
    return true;
}
} // namespace ObjCBind
