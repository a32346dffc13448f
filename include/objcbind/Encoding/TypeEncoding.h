// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the decoder of Objective-C runtime type encodings, such as "v16@0:8" or
 * "{CGRect={CGPoint=dd}{CGSize=dd}}".
 */

#ifndef OBJCBIND_ENCODING_TYPEENCODING_H
#define OBJCBIND_ENCODING_TYPEENCODING_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ObjCBind::Encoding {
enum class TypeKind : uint8_t {
    VOID,
    BOOL,
    INT8,
    UINT8,
    INT16,
    UINT16,
    INT32,
    UINT32,
    INT64,
    UINT64,
    ISIZE, // 'l', platform-width signed
    USIZE, // 'L', platform-width unsigned
    FLOAT,
    DOUBLE,
    RECEIVER, // '@', id
    CLASS,    // '#'
    SELECTOR, // ':'
    CSTRING,  // '*'
    POINTER,
    AGGREGATE,
    UNRESOLVED,
};

/**
 * One decoded type. Pointer types exclusively own their pointee, aggregates carry their tag name and
 * unresolved types carry the raw fragment that could not be decoded.
 */
class EncodedType {
public:
    explicit EncodedType(TypeKind kind = TypeKind::VOID) : kind(kind)
    {
    }
    EncodedType(const EncodedType& other);
    EncodedType(EncodedType&& other) noexcept = default;
    EncodedType& operator=(const EncodedType& other);
    EncodedType& operator=(EncodedType&& other) noexcept = default;
    ~EncodedType() = default;

    static EncodedType MakePointer(EncodedType pointee);
    static EncodedType MakeAggregate(std::string name);
    static EncodedType MakeUnresolved(std::string raw);

    TypeKind GetKind() const
    {
        return kind;
    }
    /// Tag name of an aggregate, raw fragment of an unresolved type, empty otherwise.
    const std::string& GetText() const
    {
        return text;
    }
    const EncodedType* GetPointee() const
    {
        return pointee.get();
    }

    bool IsPrimitive() const;
    bool IsFloatingPoint() const
    {
        return kind == TypeKind::FLOAT || kind == TypeKind::DOUBLE;
    }

    /// Debug form, e.g. "Pointer(Aggregate(CGRect))".
    std::string ToString() const;

    bool operator==(const EncodedType& other) const;
    bool operator!=(const EncodedType& other) const
    {
        return !(*this == other);
    }

private:
    TypeKind kind;
    std::string text;
    std::unique_ptr<EncodedType> pointee;
};

struct DecodeResult {
    EncodedType type;
    size_t consumed;
};

/**
 * A decoded method encoding. By convention argTypes[0] is the receiver and argTypes[1] the selector.
 */
struct MethodSignature {
    EncodedType returnType;
    std::vector<EncodedType> argTypes;
};

/// The objc_msgSend family entry point a call must go through, chosen by the return type.
enum class DispatchKind : uint8_t { STANDARD, STRUCT_RETURN, FLOAT_RETURN };

/// Length of the prefix an unterminated aggregate keeps as its unresolved fragment.
constexpr size_t UNTERMINATED_AGGREGATE_CAP = 10;
/// Deepest pointer nesting that is decoded; a longer run of '^' becomes Unresolved("^^^^^^^^^").
constexpr size_t MAX_POINTER_DEPTH = 8;
constexpr auto EMPTY_INPUT_FRAGMENT = "empty";

/**
 * Decode the first type of \ref encoding.
 * @return the type and the number of bytes it occupies. Empty input yields Unresolved("empty") with 0 consumed.
 */
DecodeResult DecodeOne(std::string_view encoding);

/**
 * Decode a whole method encoding. Stack offsets (digit runs) are skipped; enclosing brackets and whitespace
 * are ignored.
 * @return std::nullopt when the cleaned input is empty or no type could be decoded.
 */
std::optional<MethodSignature> DecodeSignature(const std::string& raw);

DispatchKind GetDispatchKind(const EncodedType& returnType);
} // namespace ObjCBind::Encoding

#endif // OBJCBIND_ENCODING_TYPEENCODING_H
