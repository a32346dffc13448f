// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the indented text writer shared by the binding generators.
 */

#include "objcbind/Generate/CodeWriter.h"

using namespace ObjCBind::Generate;

void CodeWriter::WriteLine(const std::string& line)
{
    if (!line.empty()) {
        buffer << std::string(currentBlockIndent, ' ') << line;
    }
    buffer << '\n';
}

void CodeWriter::WriteSeq(const std::vector<std::string>& statements)
{
    for (auto& statement : statements) {
        WriteLine(statement);
    }
}

void CodeWriter::WriteRaw(const std::string& text)
{
    buffer << text;
}

void CodeWriter::WriteFunc(const std::string& signature, const std::function<void()>& body, const std::string& suf)
{
    WriteBlock(body, signature, suf);
}

void CodeWriter::WriteBlock(const std::function<void()>& action, const std::string& pre, const std::string& suf)
{
    buffer << std::string(currentBlockIndent, ' ') << (pre.empty() ? "{" : Join(pre, " {")) << '\n';
    currentBlockIndent += INDENT_SIZE;
    action();
    currentBlockIndent -= INDENT_SIZE;
    buffer << std::string(currentBlockIndent, ' ') << Join("}", suf);
}

std::string CodeWriter::Take()
{
    auto res = buffer.str();
    buffer.str("");
    buffer.clear();
    currentBlockIndent = 0;
    return res;
}
