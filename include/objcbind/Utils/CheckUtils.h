// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares some condition check helper macros.
 */

#ifndef OBJCBIND_UTILS_CHECKUTILS_H
#define OBJCBIND_UTILS_CHECKUTILS_H

#include <cassert>
#include <cstdio>
#include <cstdlib>

#ifdef CMAKE_ENABLE_ASSERT
#define OBJCBIND_ASSERT(f)                                                                                             \
    {                                                                                                                  \
        if (!(f)) {                                                                                                    \
            abort();                                                                                                   \
        }                                                                                                              \
    }
#define OBJCBIND_ASSERT_WITH_MSG(f, msg)                                                                               \
    {                                                                                                                  \
        if (!(f)) {                                                                                                    \
            fprintf(stderr, "OBJCBIND_ASSERT failed at %s:%d: %s\n", __FILE__, __LINE__, msg);                        \
            abort();                                                                                                   \
        }                                                                                                              \
    }
#else
#ifdef NDEBUG
#define OBJCBIND_ASSERT(f) static_cast<void>(f)
#define OBJCBIND_ASSERT_WITH_MSG(f, msg) (static_cast<void>(f), static_cast<void>(msg))
#else
#define OBJCBIND_ASSERT(f) assert(f)
#define OBJCBIND_ASSERT_WITH_MSG(f, msg)                                                                               \
    {                                                                                                                  \
        if (!(f)) {                                                                                                    \
            fprintf(stderr, "OBJCBIND_ASSERT failed at %s:%d: %s\n", __FILE__, __LINE__, msg);                        \
            assert(f);                                                                                                 \
        }                                                                                                              \
    }
#endif
#endif

#define OBJCBIND_NULLPTR_CHECK(p) OBJCBIND_ASSERT((p) != nullptr)

#endif
