// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the OptionTable which splits a command line into option and input arguments.
 */

#ifndef OBJCBIND_OPTION_OPTIONTABLE_H
#define OBJCBIND_OPTION_OPTIONTABLE_H

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace ObjCBind {
namespace Options {
enum class ID : uint8_t {
    CLASS_DUMP,
    STUB,
    CONFIG,
    OUTPUT,
    STUB_OUTPUT,
    EMIT_MODEL,
    FROM_MODEL,
    VERBOSE,
    HELP,
    VERSION,
};

struct OptionInfo {
    ID id;
    std::vector<std::string> names; // e.g. {"-o", "--output"}
    std::string valueName;          // Empty for flags.
    std::string description;

    bool TakesValue() const
    {
        return !valueName.empty();
    }
};
} // namespace Options

enum class ArgInstanceType { Input, Option };

struct ArgInstance {
    ArgInstanceType argInstanceType;
    std::string str; // The argument as written on the command line.

    ArgInstance(ArgInstanceType type, std::string str) : argInstanceType(type), str(std::move(str))
    {
    }
    virtual ~ArgInstance() = default;
};

struct OptionArgInstance : public ArgInstance {
    const Options::OptionInfo& info;
    std::string value;

    OptionArgInstance(const Options::OptionInfo& info, std::string str, std::string value)
        : ArgInstance(ArgInstanceType::Option, std::move(str)), info(info), value(std::move(value))
    {
    }
};

struct InputArgInstance : public ArgInstance {
    std::string value;

    explicit InputArgInstance(std::string value) : ArgInstance(ArgInstanceType::Input, value), value(value)
    {
    }
};

class ArgList {
public:
    std::vector<std::unique_ptr<ArgInstance>> args;

    void AddInput(const std::string& input)
    {
        inputs.push_back(input);
    }
    const std::vector<std::string>& GetInputs() const
    {
        return inputs;
    }

    bool IsSpecified(Options::ID id) const
    {
        return specified.count(id) != 0;
    }
    void MarkSpecified(Options::ID id)
    {
        specified.insert(id);
    }
    bool IsWarned(Options::ID id) const
    {
        return warned.count(id) != 0;
    }
    void MarkWarned(Options::ID id)
    {
        warned.insert(id);
    }

private:
    std::vector<std::string> inputs;
    std::unordered_set<Options::ID> specified;
    std::unordered_set<Options::ID> warned;
};

class OptionTable {
public:
    explicit OptionTable(std::vector<Options::OptionInfo> infos) : infos(std::move(infos))
    {
    }

    /**
     * Split \ref argStrs into \ref argList. argStrs[0] is the executable and is skipped. Values are accepted
     * both as "--opt value" and "--opt=value".
     * @return false on an unknown option or a missing value.
     */
    bool ParseArgs(const std::vector<std::string>& argStrs, ArgList& argList) const;

    const Options::OptionInfo* FindOption(const std::string& name) const;

    void PrintHelp(const std::string& exeName) const;

private:
    std::vector<Options::OptionInfo> infos;
};

std::unique_ptr<OptionTable> CreateOptionTable();
} // namespace ObjCBind

#endif // OBJCBIND_OPTION_OPTIONTABLE_H
