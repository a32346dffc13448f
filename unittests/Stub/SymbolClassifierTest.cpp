// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/Stub/SymbolClassifier.h"

using namespace ObjCBind;

TEST(SymbolClassifierTest, StripsExactlyOneUnderscore)
{
    EXPECT_EQ(SymbolClassifier::StripUnderscore("_NSLog"), "NSLog");
    EXPECT_EQ(SymbolClassifier::StripUnderscore("__CFRunLoopRun"), "_CFRunLoopRun");
    EXPECT_EQ(SymbolClassifier::StripUnderscore("NSLog"), "NSLog");
    EXPECT_EQ(SymbolClassifier::StripUnderscore(""), "");
}

TEST(SymbolClassifierTest, ExcludedSymbols)
{
    SymbolClassifier classifier;
    for (auto& symbol : {"$ld$hide$os10.0$_NSFoo", "_OBJC_CLASS_$_NSString", "_OBJC_METACLASS_$_NSString",
             "_OBJC_IVAR_$_NSString._length"}) {
        EXPECT_TRUE(SymbolClassifier::IsExcluded(symbol)) << symbol;
        EXPECT_FALSE(classifier.IsFunction(symbol)) << symbol;
        EXPECT_FALSE(classifier.IsConstant(symbol)) << symbol;
    }
}

TEST(SymbolClassifierTest, Functions)
{
    SymbolClassifier classifier;
    EXPECT_TRUE(classifier.IsFunction("_NSLog"));
    EXPECT_TRUE(classifier.IsFunction("_CFRelease"));
    EXPECT_TRUE(classifier.IsFunction("_objc_msgSend"));
    EXPECT_TRUE(classifier.IsFunction("_NSFoundationVersionNumber"));
    EXPECT_FALSE(classifier.IsFunction("_UIApplicationMain"));
    // Lowercase-initial names are functions; a k-constant is both.
    EXPECT_TRUE(classifier.IsFunction("_kCFAllocatorDefault"));
    EXPECT_TRUE(classifier.IsFunction("kNilOptions"));
}

TEST(SymbolClassifierTest, Constants)
{
    SymbolClassifier classifier;
    EXPECT_TRUE(classifier.IsConstant("_kCFAllocatorDefault"));
    EXPECT_TRUE(classifier.IsConstant("kNilOptions"));
    EXPECT_FALSE(classifier.IsConstant("_kinit"));
    EXPECT_FALSE(classifier.IsConstant("_NSLog"));
    EXPECT_FALSE(classifier.IsConstant("_objc_msgSend"));
}

TEST(SymbolClassifierTest, UpperCasePrefixedNamesAreBoth)
{
    SymbolClassifier classifier;
    EXPECT_TRUE(classifier.IsConstant("_NSFOUNDATION_VERSION"));
    EXPECT_TRUE(classifier.IsFunction("_NSFOUNDATION_VERSION"));
}

TEST(SymbolClassifierTest, ConfiguredPrefixes)
{
    SymbolClassifier classifier({"UI"});
    EXPECT_EQ(classifier.GetFunctionPrefixes(), (std::vector<std::string>{"UI"}));
    EXPECT_EQ(SymbolClassifier().GetFunctionPrefixes(), (std::vector<std::string>{"NS", "CF"}));
    EXPECT_TRUE(classifier.IsFunction("_UIApplicationMain"));
    EXPECT_FALSE(classifier.IsFunction("_NSLog"));
}

TEST(SymbolClassifierTest, DerivedViewsKeepOrderAndDuplicates)
{
    SymbolClassifier classifier;
    StubExportSet exports;
    exports.symbols = {"_NSLog", "_kCFAllocatorDefault", "_OBJC_CLASS_$_NSString", "_NSLog", "_Zeta"};
    EXPECT_EQ(classifier.FunctionSymbols(exports),
        (std::vector<std::string>{"_NSLog", "_kCFAllocatorDefault", "_NSLog"}));
    EXPECT_EQ(classifier.ConstantSymbols(exports), (std::vector<std::string>{"_kCFAllocatorDefault"}));
    EXPECT_EQ(exports.symbols.size(), 5u);
}
