// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/Stub/StubDescriptor.h"

using namespace ObjCBind;

namespace {
const std::string V3_TWO_STANZAS = R"(--- !tapi-tbd-v3
archs:           [ armv7, arm64 ]
platform:        ios
install-name:    /System/Library/Frameworks/TestFramework.framework/TestFramework
current-version: 1.0
exports:
  - archs:           [ armv7, arm64 ]
    symbols:         [ A, B ]
    objc-classes:    [ TestClass, TestViewController ]
  - archs:           [ arm64 ]
    symbols:         [ C ]
    objc-ivars:      [ TestClass._value ]
...
)";

const std::string V4_DOCUMENT = R"(--- !tapi-tbd-v4
tbd-version:     4
targets:         [ arm64-ios, arm64e-ios ]
install-name:    '/usr/lib/libTest.dylib'
exports:
  - targets:         [ arm64-ios, arm64e-ios ]
    symbols:         [ _TestFunction, _kTestConstant, _TestFunction ]
    objc-classes:    [ TestClass ]
...
)";
} // namespace

TEST(StubDescriptorTest, V3StanzasAreFlattenedInOrder)
{
    auto res = ParseStubDescriptor(V3_TWO_STANZAS);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->version, StubVersion::V3);
    EXPECT_EQ(res->symbols, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(res->objcClasses, (std::vector<std::string>{"TestClass", "TestViewController"}));
    EXPECT_EQ(res->objcIvars, (std::vector<std::string>{"TestClass._value"}));
    EXPECT_EQ(res->installName, "/System/Library/Frameworks/TestFramework.framework/TestFramework");
}

TEST(StubDescriptorTest, V4DuplicatesArePreserved)
{
    auto res = ParseStubDescriptor(V4_DOCUMENT);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->version, StubVersion::V4);
    EXPECT_EQ(res->symbols, (std::vector<std::string>{"_TestFunction", "_kTestConstant", "_TestFunction"}));
    EXPECT_EQ(res->objcClasses.size(), 1u);
    EXPECT_TRUE(res->objcIvars.empty());
    EXPECT_EQ(res->installName, "/usr/lib/libTest.dylib");
}

TEST(StubDescriptorTest, VersionSpecificEntryPoints)
{
    EXPECT_FALSE(ParseStubDescriptorV4(V3_TWO_STANZAS).has_value());
    EXPECT_TRUE(ParseStubDescriptorV3(V3_TWO_STANZAS).has_value());
    EXPECT_TRUE(ParseStubDescriptorV4(V4_DOCUMENT).has_value());
    // Every "--- !tapi-tbd" document start is read by the v3 layout; the version comes from tbd-version.
    auto res = ParseStubDescriptorV3(V4_DOCUMENT);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->version, StubVersion::V4);
}

TEST(StubDescriptorTest, VersionMarkers)
{
    EXPECT_TRUE(HasStubV3Marker(V3_TWO_STANZAS));
    EXPECT_FALSE(HasStubV4Marker(V3_TWO_STANZAS));
    EXPECT_TRUE(HasStubV4Marker(V4_DOCUMENT));
    EXPECT_TRUE(HasStubV3Marker("--- !tapi-tbd\ntbd-version: 4\n"));
    EXPECT_TRUE(HasStubV3Marker("# comment\n--- !tapi-tbd-v3\n"));
    EXPECT_FALSE(HasStubV3Marker("# comment\n--- !tapi-tbd\n"));
    EXPECT_FALSE(HasStubV4Marker("tbd-version: 4\n"));
}

TEST(StubDescriptorTest, UntaggedDocumentWithVersionKey)
{
    std::string doc = "--- !tapi-tbd\n"
                      "tbd-version: 4\n"
                      "targets: [ x86_64-macos ]\n"
                      "install-name: /usr/lib/libFoo.dylib\n"
                      "exports:\n"
                      "  - targets: [ x86_64-macos ]\n"
                      "    symbols: [ _foo ]\n"
                      "...\n";
    auto res = ParseStubDescriptor(doc);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->version, StubVersion::V4);
    EXPECT_EQ(res->symbols, (std::vector<std::string>{"_foo"}));
}

TEST(StubDescriptorTest, MissingExportsYieldsEmptySet)
{
    auto res = ParseStubDescriptor("--- !tapi-tbd-v3\narchs: [ arm64 ]\ninstall-name: /usr/lib/libEmpty.dylib\n...\n");
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->symbols.empty());
    EXPECT_TRUE(res->objcClasses.empty());
}

TEST(StubDescriptorTest, NoMarkerIsNoResult)
{
    EXPECT_FALSE(ParseStubDescriptor("exports:\n  - symbols: [ _foo ]\n").has_value());
    EXPECT_FALSE(ParseStubDescriptor("").has_value());
}

TEST(StubDescriptorTest, MalformedDocumentIsNoResult)
{
    EXPECT_FALSE(ParseStubDescriptor("--- !tapi-tbd-v3\nexports: [ { symbols: [ _a ] \n").has_value());
    EXPECT_FALSE(ParseStubDescriptor("--- !tapi-tbd-v4\nexports: 42\n...\n").has_value());
}
