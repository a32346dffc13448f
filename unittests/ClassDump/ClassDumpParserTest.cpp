// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/ClassDump/ClassDumpParser.h"

using namespace ObjCBind;

TEST(ClassDumpParserTest, SingleInterface)
{
    std::string dump = "@interface Foo\n"
                       "Superclass: Bar\n"
                       "Methods (1):\n"
                       "  - baz [v16@0:8]\n"
                       "@end\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(classes[0].name, "Foo");
    ASSERT_TRUE(classes[0].superclass.has_value());
    EXPECT_EQ(*classes[0].superclass, "Bar");
    ASSERT_EQ(classes[0].methods.size(), 1u);
    EXPECT_EQ(classes[0].methods[0].selector, "baz");
    EXPECT_EQ(classes[0].methods[0].encoding, "v16@0:8");
}

TEST(ClassDumpParserTest, MultipleInterfacesAndCrlf)
{
    std::string dump = "@interface NSString\r\n"
                       "Superclass: NSObject\r\n"
                       "Methods (2):\r\n"
                       "    - length [Q16@0:8]\r\n"
                       "    - characterAtIndex: [S24@0:8Q16]\r\n"
                       "Properties (1):\r\n"
                       "    @property length [TQ,R,N]\r\n"
                       "@end\r\n"
                       "\r\n"
                       "@interface NSArray\r\n"
                       "Methods (1):\r\n"
                       "    - count [Q16@0:8]\r\n"
                       "@end\r\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 2u);
    EXPECT_EQ(classes[0].name, "NSString");
    ASSERT_EQ(classes[0].methods.size(), 2u);
    EXPECT_EQ(classes[0].methods[1].selector, "characterAtIndex:");
    EXPECT_EQ(classes[0].methods[1].encoding, "S24@0:8Q16");
    ASSERT_EQ(classes[0].properties.size(), 1u);
    EXPECT_EQ(classes[0].properties[0].name, "length");
    EXPECT_EQ(classes[0].properties[0].attributes, "TQ,R,N");
    EXPECT_EQ(classes[1].name, "NSArray");
    EXPECT_FALSE(classes[1].superclass.has_value());
    EXPECT_EQ(classes[1].methods.size(), 1u);
}

TEST(ClassDumpParserTest, LastSuperclassWins)
{
    auto classes = ParseClassDump("@interface A\nSuperclass: B\nSuperclass: C\n");
    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(*classes[0].superclass, "C");
}

TEST(ClassDumpParserTest, OpenRecordIsFlushedAtEndOfInput)
{
    auto classes = ParseClassDump("@interface A\nMethods (1):\n- init [@16@0:8]");
    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(classes[0].methods.size(), 1u);
}

TEST(ClassDumpParserTest, MethodLinesOutsideMethodsSectionAreIgnored)
{
    std::string dump = "@interface A\n"
                       "- early [v16@0:8]\n"
                       "Properties (1):\n"
                       "- inProperties [v16@0:8]\n"
                       "@end\n"
                       "- afterEnd [v16@0:8]\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 1u);
    EXPECT_TRUE(classes[0].methods.empty());
}

TEST(ClassDumpParserTest, MalformedMethodLinesAreDropped)
{
    std::string dump = "@interface A\n"
                       "Methods (3):\n"
                       "- noEncoding\n"
                       "- unterminated [v16@0:8\n"
                       "- [v16@0:8]\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 1u);
    ASSERT_EQ(classes[0].methods.size(), 2u);
    EXPECT_EQ(classes[0].methods[0].selector, "unterminated");
    EXPECT_EQ(classes[0].methods[0].encoding, "");
    EXPECT_EQ(classes[0].methods[1].selector, "");
}

TEST(ClassDumpParserTest, LinesBeforeAnyInterfaceAreIgnored)
{
    std::string dump = "Superclass: X\n"
                       "Methods (1):\n"
                       "- orphan [v16@0:8]\n"
                       "Dumped 1 classes\n"
                       "@interface A\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 1u);
    EXPECT_EQ(classes[0].name, "A");
    EXPECT_FALSE(classes[0].superclass.has_value());
    EXPECT_TRUE(classes[0].methods.empty());
}

TEST(ClassDumpParserTest, NewInterfaceResetsSections)
{
    std::string dump = "@interface A\n"
                       "Methods (1):\n"
                       "@interface B\n"
                       "- notAMethod [v16@0:8]\n";
    auto classes = ParseClassDump(dump);
    ASSERT_EQ(classes.size(), 2u);
    EXPECT_TRUE(classes[1].methods.empty());
}

TEST(ClassDumpParserTest, PropertyWithoutAttributes)
{
    auto classes = ParseClassDump("@interface A\nProperties (1):\n@property delegate\n");
    ASSERT_EQ(classes.size(), 1u);
    ASSERT_EQ(classes[0].properties.size(), 1u);
    EXPECT_EQ(classes[0].properties[0].name, "delegate");
    EXPECT_EQ(classes[0].properties[0].attributes, "");
}

TEST(ClassDumpParserTest, EmptyInput)
{
    EXPECT_TRUE(ParseClassDump("").empty());
}
