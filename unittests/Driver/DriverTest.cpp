// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "gtest/gtest.h"
#include "objcbind/Driver/Driver.h"
#include "objcbind/Utils/FileUtil.h"

using namespace ObjCBind;

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override
    {
#ifdef PROJECT_SOURCE_DIR
        // Gets the absolute path of the project from the compile parameter.
        std::string projectPath = PROJECT_SOURCE_DIR;
#else
        // Assume the initial is in the build directory.
        std::string projectPath = "..";
#endif
        inputDir = projectPath + "/unittests/Driver/inputs";
        classDump = inputDir + "/Foundation.classdump";
        stub = inputDir + "/Foundation.tbd";
        config = inputDir + "/objcbind.toml";

        const char* tmp = std::getenv("TMPDIR");
        std::string tmpDir = (tmp == nullptr || *tmp == '\0') ? "/tmp" : tmp;
        outDir = tmpDir + "/objcbind_driver_" + std::to_string(getpid());
    }

    void TearDown() override
    {
        for (auto& name : written) {
            std::remove(OutPath(name).c_str());
        }
        std::remove(outDir.c_str());
    }

    std::string OutPath(const std::string& name)
    {
        return outDir + "/" + name;
    }

    std::string ReadOut(const std::string& name)
    {
        written.push_back(name);
        std::string failedReason;
        return FileUtil::ReadFileContent(OutPath(name), failedReason).value_or("");
    }

    std::string inputDir;
    std::string classDump;
    std::string stub;
    std::string config;
    std::string outDir;
    std::vector<std::string> written;
};

TEST_F(DriverTest, ClassAndStubBindings)
{
    int ret = ExecuteObjCBind({"objcbind", "--class-dump", classDump, "--stub", stub, "--config", config, "-o",
        OutPath("classes.rs"), "--stub-output", OutPath("symbols.rs")});
    EXPECT_EQ(ret, 0);

    auto classes = ReadOut("classes.rs");
    EXPECT_NE(classes.find("pub struct NSString(pub id);"), std::string::npos);
    EXPECT_NE(classes.find("pub unsafe fn doubleValue(&self) -> f64 {"), std::string::npos);
    EXPECT_NE(classes.find("crate::objc::objc_msgSend_stret as *const ()"), std::string::npos);
    EXPECT_NE(classes.find("pub unsafe fn from_str(s: &str) -> Option<Self> {"), std::string::npos);
    // Excluded by the configuration.
    EXPECT_EQ(classes.find("pub struct NSProxy(pub id);"), std::string::npos);

    auto symbols = ReadOut("symbols.rs");
    EXPECT_NE(symbols.find("// Library: /System/Library/Frameworks/Foundation.framework/Versions/C/Foundation"),
        std::string::npos);
    EXPECT_NE(symbols.find("    pub fn NSMakeRange(loc: NSUInteger, len: NSUInteger) -> NSRange;\n"),
        std::string::npos);
    EXPECT_NE(symbols.find("    pub fn CFRelease(cf: *const c_void);\n"), std::string::npos);
    EXPECT_NE(symbols.find("    pub static kCFAllocatorDefault: *const c_void;\n"), std::string::npos);
    EXPECT_EQ(symbols.find("OBJC_CLASS"), std::string::npos);
}

TEST_F(DriverTest, StubBindingsFollowClassBindingsWithoutStubOutput)
{
    int ret = ExecuteObjCBind({"objcbind", "--class-dump", classDump, "--stub", stub, "-o", OutPath("all.rs")});
    EXPECT_EQ(ret, 0);
    auto all = ReadOut("all.rs");
    auto classPos = all.find("pub struct NSString(pub id);");
    auto stubPos = all.find("// Auto-generated bindings from stub library exports");
    ASSERT_NE(classPos, std::string::npos);
    ASSERT_NE(stubPos, std::string::npos);
    EXPECT_LT(classPos, stubPos);
    // Without the configured signature CFRelease has no declaration.
    EXPECT_EQ(all.find("pub fn CFRelease("), std::string::npos);
}

TEST_F(DriverTest, ModelCacheReproducesOutput)
{
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--class-dump", classDump, "--stub", stub, "--emit-model",
        OutPath("model.objm"), "-o", OutPath("direct.rs")}), 0);
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--from-model", OutPath("model.objm"), "-o", OutPath("cached.rs")}), 0);
    written.push_back("model.objm");
    auto direct = ReadOut("direct.rs");
    EXPECT_FALSE(direct.empty());
    EXPECT_EQ(direct, ReadOut("cached.rs"));
}

TEST_F(DriverTest, UnreadableInputFails)
{
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--class-dump", inputDir + "/missing.classdump", "-o",
        OutPath("none.rs")}), 1);
    EXPECT_FALSE(FileUtil::FileExist(OutPath("none.rs")));

    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--from-model", classDump, "-o", OutPath("none.rs")}), 1);
    EXPECT_FALSE(FileUtil::FileExist(OutPath("none.rs")));
}

TEST_F(DriverTest, UnreadableClassDumpKeepsStubBindings)
{
    int ret = ExecuteObjCBind({"objcbind", "--class-dump", inputDir + "/missing.classdump", "--stub", stub, "-o",
        OutPath("classes.rs"), "--stub-output", OutPath("symbols.rs")});
    EXPECT_EQ(ret, 1);
    EXPECT_FALSE(FileUtil::FileExist(OutPath("classes.rs")));
    auto symbols = ReadOut("symbols.rs");
    EXPECT_NE(symbols.find("    pub fn NSMakeRange(loc: NSUInteger, len: NSUInteger) -> NSRange;\n"),
        std::string::npos);

    ret = ExecuteObjCBind({"objcbind", "--class-dump", inputDir + "/missing.classdump", "--stub", stub, "-o",
        OutPath("all.rs")});
    EXPECT_EQ(ret, 1);
    auto all = ReadOut("all.rs");
    EXPECT_EQ(all.find("pub struct"), std::string::npos);
    EXPECT_NE(all.find("pub fn NSLog(format: id, ...);"), std::string::npos);
}

TEST_F(DriverTest, UnrecognizedStubIsSkipped)
{
    int ret = ExecuteObjCBind({"objcbind", "--stub", inputDir + "/NotAStub.tbd", "--stub", stub,
        "--stub-output", OutPath("symbols.rs")});
    EXPECT_EQ(ret, 0);
    auto symbols = ReadOut("symbols.rs");
    EXPECT_NE(symbols.find("pub fn NSLog(format: id, ...);"), std::string::npos);
}

TEST_F(DriverTest, InvalidOptions)
{
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--no-such-option"}), 1);
    EXPECT_EQ(ExecuteObjCBind({"objcbind"}), 1);
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--class-dump", classDump, "--config",
        inputDir + "/missing.toml"}), 1);
}

TEST_F(DriverTest, HelpAndVersion)
{
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "--help"}), 0);
    EXPECT_EQ(ExecuteObjCBind({"objcbind", "-v"}), 0);

    // An unknown option is rejected before '--version' is looked at.
    Driver driver;
    EXPECT_FALSE(driver.ParseArgs({"objcbind", "--version", "--no-input-check"}));
    Driver versionDriver;
    ASSERT_TRUE(versionDriver.ParseArgs({"objcbind", "--version"}));
    EXPECT_TRUE(versionDriver.GetOptions().showVersion);
}
