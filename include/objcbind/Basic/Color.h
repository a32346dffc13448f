// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the ANSI escape sequences used for colored console output.
 */

#ifndef OBJCBIND_BASIC_COLOR_H
#define OBJCBIND_BASIC_COLOR_H

#include <string>

namespace ObjCBind {
const std::string ANSI_NO_COLOR = "";
const std::string ANSI_COLOR_RESET = "\x1b[0m";
const std::string ANSI_COLOR_BRIGHT = "\x1b[1m";
const std::string ANSI_COLOR_RED = "\x1b[31m";
const std::string ANSI_COLOR_GREEN = "\x1b[32m";
const std::string ANSI_COLOR_YELLOW = "\x1b[33m";
const std::string ANSI_COLOR_CYAN = "\x1b[36m";
} // namespace ObjCBind
#endif // OBJCBIND_BASIC_COLOR_H
