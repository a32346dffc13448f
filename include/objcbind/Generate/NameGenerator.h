// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares factory class for names of the generated binding entities.
 */

#ifndef OBJCBIND_GENERATE_NAMEGENERATOR_H
#define OBJCBIND_GENERATE_NAMEGENERATOR_H

#include <string>

namespace ObjCBind::Generate {
class NameGenerator {
public:
    /**
     * Maps an Objective-C class name to a target identifier: '.', '-' and ' ' become '_', '+' becomes "Plus",
     * '$' becomes "Dollar" and '@' becomes "At". The result may still be unusable, see \ref IsUsableTypeName.
     */
    static std::string SanitizeClassName(const std::string& name);
    static bool IsUsableTypeName(const std::string& name);

    /**
     * Maps a selector to a method name, e.g. "initWithString:" -> "initWithString", "init:with:" -> "init_with",
     * "self" -> "self_". An empty result means the selector has no usable name.
     */
    static std::string SanitizeSelector(const std::string& selector);

    /**
     * Returns the selector string registered at runtime. A selector with colons is rebuilt from its non-empty
     * segments, each followed by ':'; a selector without colons is used unchanged.
     */
    static std::string DispatchSelector(const std::string& selector);

    /// Name of the \ref index th duplicate of \ref name within one class, index 0 being the name itself.
    static std::string DeduplicatedName(const std::string& name, size_t index);

    static bool IsReservedWord(const std::string& name);

    /// Escape \ref text for use inside a double-quoted string literal of the target language.
    static std::string EscapeStringLiteral(const std::string& text);
};
} // namespace ObjCBind::Generate

#endif // OBJCBIND_GENERATE_NAMEGENERATOR_H
