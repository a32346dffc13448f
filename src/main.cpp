// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the entry of the objcbind executable.
 */

#include <string>
#include <vector>

#include "objcbind/Driver/Driver.h"

int main(int argc, const char** argv)
{
    std::vector<std::string> args(argv, argv + argc);
    return ObjCBind::ExecuteObjCBind(args);
}
