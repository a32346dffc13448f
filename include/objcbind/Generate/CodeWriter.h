// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the indented text writer shared by the binding generators.
 */

#ifndef OBJCBIND_GENERATE_CODEWRITER_H
#define OBJCBIND_GENERATE_CODEWRITER_H

#include <functional>
#include <sstream>
#include <string>
#include <vector>

namespace ObjCBind::Generate {
constexpr size_t INDENT_SIZE = 4;

template <typename... Args> inline std::string Join(Args&&... args)
{
    std::stringstream ss;
    ((ss << args), ...);
    return ss.str();
}

template <typename T>
std::string JoinVec(const std::vector<T>& vec, std::function<std::string(const T&)> trans,
    const std::string& sep = ", ", const std::string& pre = "", const std::string& suf = "", bool force = true)
{
    std::stringstream ss;
    auto it = vec.cbegin();
    if (it == vec.cend()) {
        if (!force) {
            return "";
        }
        ss << pre << suf;
        return ss.str();
    }
    ss << pre;
    do {
        ss << trans(*it);
        ++it;
        if (it != vec.cend()) {
            ss << sep;
        }
    } while (it != vec.cend());
    ss << suf;
    return ss.str();
}

class CodeWriter {
public:
    /// Write \ref line at the current indent. An empty line is written without trailing spaces.
    void WriteLine(const std::string& line = "");
    void WriteSeq(const std::vector<std::string>& statements);
    /// Write pre-rendered text as is.
    void WriteRaw(const std::string& text);
    void WriteFunc(const std::string& signature, const std::function<void()>& body, const std::string& suf = "\n");
    /// Write "<pre> {", the indented body and the closing brace followed by \ref suf.
    void WriteBlock(const std::function<void()>& action, const std::string& pre = "", const std::string& suf = "\n");

    /// Move the buffered text out and reset the writer.
    std::string Take();

private:
    size_t currentBlockIndent = 0;
    std::stringstream buffer;
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_CODEWRITER_H
