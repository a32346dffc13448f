// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements factory class for names of the generated binding entities.
 */

#include "objcbind/Generate/NameGenerator.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "objcbind/Basic/Utils.h"

using namespace ObjCBind;
using namespace ObjCBind::Generate;

namespace {
constexpr char SELECTOR_SEPARATOR = ':';
constexpr char DUPLICATE_SEPARATOR = '_';

const std::unordered_set<std::string> RESERVED_WORDS = {"self", "Self", "super", "crate", "type", "move", "box",
    "impl", "fn", "let", "mut", "ref", "static", "const", "unsafe", "async", "await", "dyn", "abstract", "final",
    "override", "macro", "typeof", "yield", "return", "break", "continue", "loop", "while", "for", "if", "else",
    "match", "pub", "use", "extern", "mod", "trait", "struct", "enum", "union", "where", "as", "in", "become"};

bool IsIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
} // namespace

std::string NameGenerator::SanitizeClassName(const std::string& name)
{
    std::string res;
    for (char c : name) {
        switch (c) {
            case '.':
            case '-':
            case ' ':
                res += '_';
                break;
            case '+':
                res += "Plus";
                break;
            case '$':
                res += "Dollar";
                break;
            case '@':
                res += "At";
                break;
            default:
                res += c;
                break;
        }
    }
    return res;
}

bool NameGenerator::IsUsableTypeName(const std::string& name)
{
    return !name.empty() && !IsDigit(name.front()) && std::all_of(name.begin(), name.end(), IsIdentChar);
}

std::string NameGenerator::SanitizeSelector(const std::string& selector)
{
    std::string res;
    for (char c : selector) {
        if (c == '+') {
            res += "plus_";
        } else if (c == '$') {
            res += "dollar_";
        } else if (IsIdentChar(c)) {
            res += c;
        } else {
            // ':', '-', '.' and anything else that cannot appear in an identifier.
            res += '_';
        }
    }
    res = Utils::TrimChar(res, '_');
    if (!res.empty() && IsDigit(res.front())) {
        res.insert(res.begin(), '_');
    }
    if (IsReservedWord(res)) {
        res += '_';
    }
    return res;
}

std::string NameGenerator::DispatchSelector(const std::string& selector)
{
    if (selector.find(SELECTOR_SEPARATOR) == std::string::npos) {
        return selector;
    }
    std::string res;
    for (auto& part : Utils::SplitString(selector, std::string(1, SELECTOR_SEPARATOR))) {
        if (!part.empty()) {
            res += part + SELECTOR_SEPARATOR;
        }
    }
    return res;
}

std::string NameGenerator::DeduplicatedName(const std::string& name, size_t index)
{
    return index == 0 ? name : name + DUPLICATE_SEPARATOR + std::to_string(index);
}

bool NameGenerator::IsReservedWord(const std::string& name)
{
    return RESERVED_WORDS.count(name) != 0;
}

std::string NameGenerator::EscapeStringLiteral(const std::string& text)
{
    std::string res;
    res.reserve(text.size());
    for (char c : text) {
        if (c == '\\' || c == '"') {
            res += '\\';
        }
        res += c;
    }
    return res;
}
