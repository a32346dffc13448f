// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares some common utility functions.
 */

#ifndef OBJCBIND_BASIC_UTILS_H
#define OBJCBIND_BASIC_UTILS_H

#include <string>
#include <vector>

namespace ObjCBind::Utils {
/// Split a string by '\r\n' and '\n' to form a vector of strings.
std::vector<std::string> SplitLines(const std::string& str);
/// Split a string by customised \ref delimiter, keeping empty pieces.
std::vector<std::string> SplitString(const std::string& str, const std::string& delimiter);
/// Join strings \ref strs with \ref delimiter.
std::string JoinStrings(const std::vector<std::string>& strs, const std::string& delimiter);
/// Return a copy of \ref str without leading and trailing whitespace.
std::string Trim(const std::string& str);
/// Return a copy of \ref str without leading and trailing \ref ch.
std::string TrimChar(const std::string& str, char ch);
bool StartsWith(const std::string& str, const std::string& prefix);
bool EndsWith(const std::string& str, const std::string& suffix);
/// Replace every occurrence of \ref from in \ref str by \ref to.
std::string ReplaceAll(std::string str, const std::string& from, const std::string& to);
/// Whether \ref str is a non-empty ASCII identifier: [A-Za-z_][A-Za-z0-9_]*.
bool IsAsciiIdentifier(const std::string& str);
} // namespace ObjCBind::Utils

#endif
