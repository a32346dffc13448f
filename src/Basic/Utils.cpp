// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the utility functions.
 */

#include "objcbind/Basic/Utils.h"

#include <algorithm>
#include <cctype>

using namespace ObjCBind;

std::vector<std::string> Utils::SplitLines(const std::string& str)
{
    std::vector<std::string> res;
    size_t length = str.size();
    if (length == 0) {
        return res;
    }
    size_t lineTerminatorPos;
    size_t windowsTerminatorLength = std::string("\r\n").size();
    for (size_t curIndex = 0, newLineStartPos = 0; curIndex < length;) {
        while (curIndex < length && !(str[curIndex] == '\r' && curIndex + 1 < length && str[curIndex + 1] == '\n') &&
            str[curIndex] != '\n') {
            curIndex++;
        }
        lineTerminatorPos = curIndex;
        if (curIndex < length) {
            if (str[curIndex] == '\r' && curIndex + 1 < length && str[curIndex + 1] == '\n') {
                curIndex += windowsTerminatorLength;
            } else {
                curIndex++;
            }
        }
        res.emplace_back(str.substr(newLineStartPos, lineTerminatorPos - newLineStartPos));
        newLineStartPos = curIndex;
    }
    if (str[length - 1] == '\n') {
        res.emplace_back("");
    }
    return res;
}

std::vector<std::string> Utils::SplitString(const std::string& str, const std::string& delimiter)
{
    std::vector<std::string> res;
    if (str.empty() || delimiter.empty()) {
        if (!str.empty()) {
            res.emplace_back(str);
        }
        return res;
    }
    size_t pos = 0;
    size_t foundPos = str.find(delimiter);
    while (foundPos != std::string::npos) {
        res.emplace_back(str.substr(pos, foundPos - pos));
        pos = foundPos + delimiter.size();
        foundPos = str.find(delimiter, pos);
    }
    res.emplace_back(str.substr(pos));
    return res;
}

std::string Utils::JoinStrings(const std::vector<std::string>& strs, const std::string& delimiter)
{
    std::string s;
    for (unsigned int i = 0; i < strs.size(); ++i) {
        s += strs[i];
        if (i != strs.size() - 1) {
            s += delimiter;
        }
    }
    return s;
}

std::string Utils::Trim(const std::string& str)
{
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string Utils::TrimChar(const std::string& str, char ch)
{
    size_t start = str.find_first_not_of(ch);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(ch);
    return str.substr(start, end - start + 1);
}

bool Utils::StartsWith(const std::string& str, const std::string& prefix)
{
    return str.rfind(prefix, 0) == 0;
}

bool Utils::EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Utils::ReplaceAll(std::string str, const std::string& from, const std::string& to)
{
    if (from.empty()) {
        return str;
    }
    size_t pos = str.find(from);
    while (pos != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos = str.find(from, pos + to.size());
    }
    return str;
}

bool Utils::IsAsciiIdentifier(const std::string& str)
{
    if (str.empty()) {
        return false;
    }
    auto head = static_cast<unsigned char>(str[0]);
    if (!std::isalpha(head) && head != '_') {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}
