// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares Print related apis.
 */

#ifndef OBJCBIND_BASIC_PRINT_H
#define OBJCBIND_BASIC_PRINT_H

#include <iomanip>
#include <iostream>
#include <utility>

#include "objcbind/Basic/Color.h"

namespace ObjCBind {
///@{
/// These functions are used by the driver and the generators to report progress and problems that are not
/// tied to a position in an input document. Errors are printed red, warnings yellow, and info green.
template <typename Arg> inline void Println(Arg&& arg)
{
    std::cout << std::forward<Arg>(arg) << std::endl;
}

template <typename Arg, typename... Args> inline void Println(Arg&& arg, Args&&... args)
{
    std::cout << std::forward<Arg>(arg);
    ((std::cout << ' ' << std::forward<Args>(args)), ...);
    std::cout << std::endl;
}

template <typename... Args> inline void PrintNoSplit(Args&&... args)
{
    (std::cout << ... << args);
}

template <typename Opt, typename Desc>
inline void PrintCommandDesc(const Opt& option, const Desc& desc, int optionWidth)
{
    std::cout << "  " << std::left << std::setfill(' ') << std::setw(optionWidth) << option << desc << std::endl;
}

const std::string RED_ERROR_MARK = ANSI_COLOR_RED + "error" + ANSI_COLOR_RESET + ": ";
const std::string YELLOW_WARNING_MARK = ANSI_COLOR_YELLOW + "warning" + ANSI_COLOR_RESET + ": ";
const std::string GREEN_INFO_MARK = ANSI_COLOR_GREEN + "info" + ANSI_COLOR_RESET + ": ";
const std::string GREEN_DEBUG_MARK = ANSI_COLOR_GREEN + "debug" + ANSI_COLOR_RESET + ": ";

// no format Error print with new line
template <typename... Args> inline void Errorln(Args&&... args) noexcept
{
    std::cerr << RED_ERROR_MARK;
    ((std::cerr << args), ...);
    std::cerr << std::endl;
}

/**
 * Write given args to std error
 */
template <typename... Args> inline void WriteError(Args&&... args)
{
    ((std::cerr << args), ...);
}

template <typename... Args> inline void Warningln(Args&&... args)
{
    std::cerr << YELLOW_WARNING_MARK;
    ((std::cerr << args), ...);
    std::cerr << std::endl;
}

template <typename... Args> inline void Infoln(Args&&... args)
{
    std::cout << GREEN_INFO_MARK;
    ((std::cout << args), ...);
    std::cout << std::endl;
}

template <typename... Args> inline void Debugln([[maybe_unused]] Args&&... args)
{
#ifndef NDEBUG
    PrintNoSplit(GREEN_DEBUG_MARK);
    Println(args...);
#endif
}
///@}
} // namespace ObjCBind
#endif // OBJCBIND_BASIC_PRINT_H
