// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/Basic/BindingConfigReader.h"

using namespace ObjCBind;

namespace {
std::string GetConfigPath(const std::string& name)
{
#ifdef PROJECT_SOURCE_DIR
    // Gets the absolute path of the project from the compile parameter.
    std::string projectPath = PROJECT_SOURCE_DIR;
#else
    // Assume the initial is in the build directory.
    std::string projectPath = "..";
#endif
    return projectPath + "/unittests/Basic/configs/" + name;
}
} // namespace

TEST(BindingConfigReaderTest, Defaults)
{
    BindingConfigReader config;
    EXPECT_EQ(config.stringClass, "NSString");
    EXPECT_TRUE(config.emitPropertyDocs);
    EXPECT_FALSE(config.emitUnknownSymbols);
    EXPECT_EQ(config.functionPrefixes, (std::vector<std::string>{"NS", "CF"}));
    EXPECT_TRUE(config.functions.empty());
    EXPECT_TRUE(config.Validate());
}

TEST(BindingConfigReaderTest, EmptyFileKeepsDefaults)
{
    BindingConfigReader config;
    ASSERT_TRUE(config.Parse(GetConfigPath("empty.toml")));
    EXPECT_EQ(config.stringClass, "NSString");
    EXPECT_TRUE(config.includedClasses.empty());
    EXPECT_EQ(config.functionPrefixes.size(), 2u);
    EXPECT_TRUE(config.Validate());
}

TEST(BindingConfigReaderTest, FullConfig)
{
    BindingConfigReader config;
    ASSERT_TRUE(config.Parse(GetConfigPath("full.toml")));
    EXPECT_EQ(config.stringClass, "NSMutableString");
    EXPECT_FALSE(config.emitPropertyDocs);
    EXPECT_TRUE(config.emitUnknownSymbols);
    EXPECT_EQ(config.includedClasses, (std::vector<std::string>{"NSString", "NSArray", "NSMutableString"}));
    EXPECT_EQ(config.excludedClasses, (std::vector<std::string>{"NSProxy"}));
    EXPECT_EQ(config.functionPrefixes, (std::vector<std::string>{"NS", "CF", "UI"}));

    // The entry without a name is dropped.
    ASSERT_EQ(config.functions.size(), 2u);
    EXPECT_EQ(config.functions[0], (FunctionSignature{"CFRelease", "()", {{"cf", "*const c_void"}}, false}));
    auto& format = config.functions[1];
    EXPECT_EQ(format.name, "CFStringCreateWithFormat");
    EXPECT_EQ(format.returnType, "*const c_void");
    EXPECT_TRUE(format.isVariadic);
    // The malformed ["broken"] pair is dropped.
    EXPECT_EQ(format.params,
        (ParamList{{"alloc", "*const c_void"}, {"options", "*const c_void"}, {"format", "*const c_void"}}));
    EXPECT_TRUE(config.Validate());
}

TEST(BindingConfigReaderTest, ClassSelection)
{
    BindingConfigReader config;
    EXPECT_TRUE(config.IsClassSelected("NSAnything"));

    config.excludedClasses = {"NSProxy"};
    EXPECT_FALSE(config.IsClassSelected("NSProxy"));
    EXPECT_TRUE(config.IsClassSelected("NSArray"));

    config.includedClasses = {"NSArray"};
    EXPECT_TRUE(config.IsClassSelected("NSArray"));
    EXPECT_FALSE(config.IsClassSelected("NSData"));
}

TEST(BindingConfigReaderTest, InvalidToml)
{
    BindingConfigReader config;
    EXPECT_FALSE(config.Parse(GetConfigPath("invalid.toml")));
}

TEST(BindingConfigReaderTest, ConflictingClassLists)
{
    BindingConfigReader config;
    ASSERT_TRUE(config.Parse(GetConfigPath("conflict.toml")));
    EXPECT_FALSE(config.Validate());
}

TEST(BindingConfigReaderTest, EmptyPrefix)
{
    BindingConfigReader config;
    ASSERT_TRUE(config.Parse(GetConfigPath("empty_prefix.toml")));
    EXPECT_FALSE(config.Validate());
}

TEST(BindingConfigReaderTest, ValidateRejectsEmptyValues)
{
    BindingConfigReader config;
    config.stringClass = "";
    EXPECT_FALSE(config.Validate());

    BindingConfigReader noName;
    noName.functions.push_back({"", "()", {}});
    EXPECT_FALSE(noName.Validate());

    BindingConfigReader noReturn;
    noReturn.functions.push_back({"CFRetain", "", {}});
    EXPECT_FALSE(noReturn.Validate());
}
