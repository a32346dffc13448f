// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

#include "gtest/gtest.h"
#include "objcbind/Encoding/TypeEncoding.h"

#include <utility>
#include <vector>

using namespace ObjCBind::Encoding;

TEST(TypeEncodingTest, SingleCharacterCodes)
{
    std::vector<std::pair<char, TypeKind>> cases = {
        {'v', TypeKind::VOID}, {'B', TypeKind::BOOL}, {'c', TypeKind::INT8}, {'C', TypeKind::UINT8},
        {'s', TypeKind::INT16}, {'S', TypeKind::UINT16}, {'i', TypeKind::INT32}, {'I', TypeKind::UINT32},
        {'l', TypeKind::ISIZE}, {'L', TypeKind::USIZE}, {'q', TypeKind::INT64}, {'Q', TypeKind::UINT64},
        {'f', TypeKind::FLOAT}, {'d', TypeKind::DOUBLE}, {'@', TypeKind::RECEIVER}, {'#', TypeKind::CLASS},
        {':', TypeKind::SELECTOR}, {'*', TypeKind::CSTRING},
    };
    for (auto& [code, kind] : cases) {
        std::string input = std::string(1, code) + "16@0:8";
        auto res = DecodeOne(input);
        EXPECT_EQ(res.consumed, 1u) << code;
        EXPECT_EQ(res.type.GetKind(), kind) << code;
    }
}

TEST(TypeEncodingTest, EmptyInput)
{
    auto res = DecodeOne("");
    EXPECT_EQ(res.consumed, 0u);
    EXPECT_EQ(res.type, EncodedType::MakeUnresolved("empty"));
}

TEST(TypeEncodingTest, UnknownCharacterIsUnresolved)
{
    auto res = DecodeOne("r*");
    EXPECT_EQ(res.consumed, 1u);
    EXPECT_EQ(res.type, EncodedType::MakeUnresolved("r"));
}

TEST(TypeEncodingTest, PointerToVoid)
{
    auto res = DecodeOne("^v");
    EXPECT_EQ(res.consumed, 2u);
    EXPECT_EQ(res.type, EncodedType::MakePointer(EncodedType(TypeKind::VOID)));
    EXPECT_EQ(res.type.ToString(), "Pointer(Void)");
}

TEST(TypeEncodingTest, PointerAtEndOfInput)
{
    auto res = DecodeOne("^");
    EXPECT_EQ(res.consumed, 1u);
    EXPECT_EQ(res.type, EncodedType::MakePointer(EncodedType::MakeUnresolved("empty")));
}

TEST(TypeEncodingTest, PointerDepthIsBounded)
{
    auto deepest = DecodeOne(std::string(MAX_POINTER_DEPTH, '^') + "i");
    EXPECT_EQ(deepest.consumed, MAX_POINTER_DEPTH + 1);
    const EncodedType* type = &deepest.type;
    for (size_t i = 0; i < MAX_POINTER_DEPTH; ++i) {
        ASSERT_EQ(type->GetKind(), TypeKind::POINTER);
        type = type->GetPointee();
    }
    EXPECT_EQ(type->GetKind(), TypeKind::INT32);

    auto tooDeep = DecodeOne(std::string(MAX_POINTER_DEPTH + 1, '^') + "i@");
    EXPECT_EQ(tooDeep.type, EncodedType::MakeUnresolved("^^^^^^^^^"));
    EXPECT_EQ(tooDeep.consumed, MAX_POINTER_DEPTH + 2);
}

TEST(TypeEncodingTest, LongPointerRunOnlyAffectsItsOwnType)
{
    auto sig = DecodeSignature(std::string(1000000, '^') + "v16@0:8");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->returnType.GetKind(), TypeKind::UNRESOLVED);
    ASSERT_EQ(sig->argTypes.size(), 2u);
    EXPECT_EQ(sig->argTypes[0].GetKind(), TypeKind::RECEIVER);
    EXPECT_EQ(sig->argTypes[1].GetKind(), TypeKind::SELECTOR);
}

TEST(TypeEncodingTest, NestedAggregateUsesOuterName)
{
    std::string encoding = "{CGRect={CGPoint=dd}{CGSize=dd}}";
    auto res = DecodeOne(encoding);
    EXPECT_EQ(res.type, EncodedType::MakeAggregate("CGRect"));
    EXPECT_EQ(res.consumed, encoding.size());
}

TEST(TypeEncodingTest, AggregateWithoutFields)
{
    auto res = DecodeOne("{__CFString}@");
    EXPECT_EQ(res.type, EncodedType::MakeAggregate("__CFString"));
    EXPECT_EQ(res.consumed, 12u);
}

TEST(TypeEncodingTest, PointerToAggregate)
{
    std::string encoding = "^{_NSZone=}";
    auto res = DecodeOne(encoding);
    EXPECT_EQ(res.consumed, encoding.size());
    ASSERT_NE(res.type.GetPointee(), nullptr);
    EXPECT_EQ(*res.type.GetPointee(), EncodedType::MakeAggregate("_NSZone"));
}

TEST(TypeEncodingTest, UnterminatedAggregateIsCapped)
{
    auto res = DecodeOne("{NSVeryLongStructName=iiii");
    EXPECT_EQ(res.consumed, 1u);
    EXPECT_EQ(res.type, EncodedType::MakeUnresolved("{NSVeryLon"));

    auto shortRes = DecodeOne("{ab");
    EXPECT_EQ(shortRes.consumed, 1u);
    EXPECT_EQ(shortRes.type, EncodedType::MakeUnresolved("{ab"));
}

TEST(TypeEncodingTest, VoidMethodSignature)
{
    auto sig = DecodeSignature("v16@0:8");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->returnType.GetKind(), TypeKind::VOID);
    ASSERT_EQ(sig->argTypes.size(), 2u);
    EXPECT_EQ(sig->argTypes[0].GetKind(), TypeKind::RECEIVER);
    EXPECT_EQ(sig->argTypes[1].GetKind(), TypeKind::SELECTOR);
}

TEST(TypeEncodingTest, BoolMethodSignatureWithClassArgument)
{
    auto sig = DecodeSignature("B24@0:8#16");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->returnType.GetKind(), TypeKind::BOOL);
    ASSERT_EQ(sig->argTypes.size(), 3u);
    EXPECT_EQ(sig->argTypes[2].GetKind(), TypeKind::CLASS);
}

TEST(TypeEncodingTest, BracketsAndWhitespaceAreStripped)
{
    auto sig = DecodeSignature("  [{CGRect={CGPoint=dd}{CGSize=dd}}16@0:8]  ");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->returnType, EncodedType::MakeAggregate("CGRect"));
    EXPECT_EQ(sig->argTypes.size(), 2u);
}

TEST(TypeEncodingTest, RepeatedBracketsAreStripped)
{
    auto sig = DecodeSignature("[[v16@0:8]]");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->returnType.GetKind(), TypeKind::VOID);
    EXPECT_EQ(sig->argTypes.size(), 2u);
    EXPECT_FALSE(DecodeSignature("[[]]").has_value());
}

TEST(TypeEncodingTest, MultiDigitOffsetsAreSkipped)
{
    auto sig = DecodeSignature("@1024@0:8^{_NSRange=QQ}16q1000");
    ASSERT_TRUE(sig.has_value());
    ASSERT_EQ(sig->argTypes.size(), 4u);
    EXPECT_EQ(sig->argTypes[2].GetKind(), TypeKind::POINTER);
    EXPECT_EQ(sig->argTypes[3].GetKind(), TypeKind::INT64);
}

TEST(TypeEncodingTest, EmptySignatureIsRejected)
{
    EXPECT_FALSE(DecodeSignature("").has_value());
    EXPECT_FALSE(DecodeSignature("   ").has_value());
    EXPECT_FALSE(DecodeSignature("[]").has_value());
    EXPECT_FALSE(DecodeSignature("1624").has_value());
}

TEST(TypeEncodingTest, ShortSignatureIsReportedAsDecoded)
{
    auto sig = DecodeSignature("v8@0");
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->argTypes.size(), 1u);
}

TEST(TypeEncodingTest, DispatchKindFollowsReturnType)
{
    EXPECT_EQ(GetDispatchKind(EncodedType::MakeAggregate("CGRect")), DispatchKind::STRUCT_RETURN);
    EXPECT_EQ(GetDispatchKind(EncodedType(TypeKind::DOUBLE)), DispatchKind::FLOAT_RETURN);
    EXPECT_EQ(GetDispatchKind(EncodedType(TypeKind::FLOAT)), DispatchKind::FLOAT_RETURN);
    EXPECT_EQ(GetDispatchKind(EncodedType(TypeKind::INT64)), DispatchKind::STANDARD);
    EXPECT_EQ(GetDispatchKind(EncodedType::MakePointer(EncodedType::MakeAggregate("CGRect"))),
        DispatchKind::STANDARD);
}

TEST(TypeEncodingTest, CopyIsDeep)
{
    auto original = EncodedType::MakePointer(EncodedType::MakePointer(EncodedType(TypeKind::INT8)));
    EncodedType copy = original;
    EXPECT_EQ(copy, original);
    EXPECT_NE(copy.GetPointee(), original.GetPointee());
    EXPECT_EQ(copy.ToString(), "Pointer(Pointer(Int8))");
}

TEST(TypeEncodingTest, PrimitiveKinds)
{
    EXPECT_TRUE(DecodeOne("v").type.IsPrimitive());
    EXPECT_TRUE(DecodeOne("Q").type.IsPrimitive());
    EXPECT_TRUE(DecodeOne("d").type.IsPrimitive());
    EXPECT_FALSE(DecodeOne("@").type.IsPrimitive());
    EXPECT_FALSE(DecodeOne("^i").type.IsPrimitive());
    EXPECT_FALSE(DecodeOne("{CGPoint=dd}").type.IsPrimitive());
}
