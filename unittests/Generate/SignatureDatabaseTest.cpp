// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/Generate/SignatureDatabase.h"

using namespace ObjCBind;
using namespace ObjCBind::Generate;

TEST(SignatureDatabaseTest, BuiltinFoundationFunctions)
{
    SignatureDatabase db;
    auto nsLog = db.Lookup("NSLog");
    ASSERT_NE(nsLog, nullptr);
    EXPECT_EQ(nsLog->returnType, "()");
    EXPECT_TRUE(nsLog->isVariadic);
    EXPECT_EQ(nsLog->params, (ParamList{{"format", "id"}}));

    auto makeRange = db.Lookup("NSMakeRange");
    ASSERT_NE(makeRange, nullptr);
    EXPECT_EQ(makeRange->returnType, "NSRange");
    EXPECT_FALSE(makeRange->isVariadic);

    EXPECT_TRUE(db.Contains("NSCountFrames"));
    EXPECT_TRUE(db.Contains("NSSearchPathForDirectoriesInDomains"));
    EXPECT_FALSE(db.Contains("CFRelease"));
    EXPECT_EQ(db.Lookup("_NSLog"), nullptr);
}

TEST(SignatureDatabaseTest, RegisterAddsAndOverrides)
{
    SignatureDatabase db;
    auto builtinCount = db.Size();

    db.Register({"CFRelease", "()", {{"cf", "*const c_void"}}});
    EXPECT_EQ(db.Size(), builtinCount + 1);
    ASSERT_TRUE(db.Contains("CFRelease"));

    db.Register({"NSLog", "()", {{"format", "id"}, {"arg", "i32"}}});
    EXPECT_EQ(db.Size(), builtinCount + 1);
    auto nsLog = db.Lookup("NSLog");
    ASSERT_NE(nsLog, nullptr);
    EXPECT_FALSE(nsLog->isVariadic);
    EXPECT_EQ(nsLog->params.size(), 2u);
}

TEST(SignatureDatabaseTest, RenderFunction)
{
    EXPECT_EQ(SignatureDatabase::RenderFunction({"NSLog", "()", {{"format", "id"}}, true}),
        "    /// NSLog\n    pub fn NSLog(format: id, ...);\n");
    EXPECT_EQ(SignatureDatabase::RenderFunction({"NSPageSize", "NSUInteger", {}}),
        "    /// NSPageSize\n    pub fn NSPageSize() -> NSUInteger;\n");
    EXPECT_EQ(SignatureDatabase::RenderFunction({"NSEqualRanges", "bool", {{"range1", "NSRange"}, {"range2", "NSRange"}}}),
        "    /// NSEqualRanges\n    pub fn NSEqualRanges(range1: NSRange, range2: NSRange) -> bool;\n");
}
