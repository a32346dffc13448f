// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the parser of runtime class dumps. A dump is line oriented:
 *
 *     @interface NSString
 *     Superclass: NSObject
 *     Methods (2):
 *       - length [Q16@0:8]
 *       - characterAtIndex: [S24@0:8Q16]
 *     Properties (1):
 *       @property length [TQ,R]
 *     @end
 */

#ifndef OBJCBIND_CLASSDUMP_CLASSDUMPPARSER_H
#define OBJCBIND_CLASSDUMP_CLASSDUMPPARSER_H

#include <string>
#include <vector>

#include "objcbind/Model/InterfaceModel.h"

namespace ObjCBind {
/**
 * Parse a class dump into class records, in the order the interfaces appear. Lines that match no rule are
 * ignored, and malformed method or property lines are dropped.
 */
std::vector<ClassRecord> ParseClassDump(const std::string& content);
} // namespace ObjCBind

#endif // OBJCBIND_CLASSDUMP_CLASSDUMPPARSER_H
