// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the Driver, which runs one objcbind invocation: read the inputs into an interface model,
 * then render the bindings.
 */

#ifndef OBJCBIND_DRIVER_DRIVER_H
#define OBJCBIND_DRIVER_DRIVER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "objcbind/Basic/BindingConfigReader.h"
#include "objcbind/Generate/SignatureDatabase.h"
#include "objcbind/Model/InterfaceModel.h"
#include "objcbind/Option/Option.h"
#include "objcbind/Option/OptionTable.h"

namespace ObjCBind {
class Driver {
public:
    Driver();

    /// \ref args includes the executable name at index 0.
    bool ParseArgs(const std::vector<std::string>& args);

    /// @return the process exit status.
    int Run();

    const GlobalOptions& GetOptions() const
    {
        return options;
    }

private:
    std::unique_ptr<OptionTable> optionTable;
    ArgList argList;
    GlobalOptions options;
    BindingConfigReader config;
    Generate::SignatureDatabase signatures;
    // Set when an input document could not be read; the run goes on but fails in the end.
    bool inputFailed = false;
    bool classDumpRead = false;

    bool LoadConfig();
    std::optional<InterfaceModel> BuildModel();
    void ParseClassDumpInput(InterfaceModel& model);
    void ParseStubInputs(InterfaceModel& model);
    bool EmitBindings(const InterfaceModel& model);
    bool WriteOutput(const std::optional<std::string>& path, const std::string& text) const;
};

/// Entry of the objcbind executable.
int ExecuteObjCBind(const std::vector<std::string>& args);
} // namespace ObjCBind

#endif // OBJCBIND_DRIVER_DRIVER_H
