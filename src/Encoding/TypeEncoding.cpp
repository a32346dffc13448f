// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the decoder of Objective-C runtime type encodings.
 */

#include "objcbind/Encoding/TypeEncoding.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>

#include "objcbind/Basic/Utils.h"

namespace ObjCBind::Encoding {
namespace {
constexpr char POINTER_PREFIX = '^';
constexpr char AGGREGATE_OPEN = '{';
constexpr char AGGREGATE_CLOSE = '}';
constexpr char AGGREGATE_FIELDS_SEP = '=';
constexpr auto SIGNATURE_DELIMITERS = "[]";

const std::unordered_map<char, TypeKind> SINGLE_CHAR_TYPES = {
    {'v', TypeKind::VOID},
    {'B', TypeKind::BOOL},
    {'c', TypeKind::INT8},
    {'C', TypeKind::UINT8},
    {'s', TypeKind::INT16},
    {'S', TypeKind::UINT16},
    {'i', TypeKind::INT32},
    {'I', TypeKind::UINT32},
    {'l', TypeKind::ISIZE},
    {'L', TypeKind::USIZE},
    {'q', TypeKind::INT64},
    {'Q', TypeKind::UINT64},
    {'f', TypeKind::FLOAT},
    {'d', TypeKind::DOUBLE},
    {'@', TypeKind::RECEIVER},
    {'#', TypeKind::CLASS},
    {':', TypeKind::SELECTOR},
    {'*', TypeKind::CSTRING},
};

const char* KindName(TypeKind kind)
{
    switch (kind) {
        case TypeKind::VOID:
            return "Void";
        case TypeKind::BOOL:
            return "Bool";
        case TypeKind::INT8:
            return "Int8";
        case TypeKind::UINT8:
            return "UInt8";
        case TypeKind::INT16:
            return "Int16";
        case TypeKind::UINT16:
            return "UInt16";
        case TypeKind::INT32:
            return "Int32";
        case TypeKind::UINT32:
            return "UInt32";
        case TypeKind::INT64:
            return "Int64";
        case TypeKind::UINT64:
            return "UInt64";
        case TypeKind::ISIZE:
            return "ISize";
        case TypeKind::USIZE:
            return "USize";
        case TypeKind::FLOAT:
            return "Float";
        case TypeKind::DOUBLE:
            return "Double";
        case TypeKind::RECEIVER:
            return "ReceiverRef";
        case TypeKind::CLASS:
            return "ClassRef";
        case TypeKind::SELECTOR:
            return "SelectorRef";
        case TypeKind::CSTRING:
            return "CStringPtr";
        case TypeKind::POINTER:
            return "Pointer";
        case TypeKind::AGGREGATE:
            return "Aggregate";
        case TypeKind::UNRESOLVED:
            return "Unresolved";
    }
    return "Unresolved";
}

// A run of pointer prefixes is decoded as one unit; a run deeper than MAX_POINTER_DEPTH stays unresolved.
DecodeResult DecodePointer(std::string_view encoding)
{
    size_t depth = encoding.find_first_not_of(POINTER_PREFIX);
    if (depth == std::string_view::npos) {
        depth = encoding.size();
    }
    auto inner = DecodeOne(encoding.substr(depth));
    size_t consumed = depth + inner.consumed;
    if (depth > MAX_POINTER_DEPTH) {
        return {EncodedType::MakeUnresolved(std::string(encoding.substr(0, MAX_POINTER_DEPTH + 1))), consumed};
    }
    EncodedType res = std::move(inner.type);
    for (size_t i = 0; i < depth; ++i) {
        res = EncodedType::MakePointer(std::move(res));
    }
    return {std::move(res), consumed};
}

DecodeResult DecodeAggregate(std::string_view encoding)
{
    // Nested aggregates are part of the field list, so the close brace has to be found by depth.
    size_t depth = 0;
    size_t closePos = std::string_view::npos;
    for (size_t i = 0; i < encoding.size(); ++i) {
        if (encoding[i] == AGGREGATE_OPEN) {
            ++depth;
        } else if (encoding[i] == AGGREGATE_CLOSE) {
            --depth;
            if (depth == 0) {
                closePos = i;
                break;
            }
        }
    }
    if (closePos == std::string_view::npos) {
        auto capped = encoding.substr(0, UNTERMINATED_AGGREGATE_CAP);
        return {EncodedType::MakeUnresolved(std::string(capped)), 1};
    }
    auto interior = encoding.substr(1, closePos - 1);
    auto name = interior.substr(0, interior.find(AGGREGATE_FIELDS_SEP));
    return {EncodedType::MakeAggregate(std::string(name)), closePos + 1};
}
} // namespace

EncodedType::EncodedType(const EncodedType& other)
    : kind(other.kind),
      text(other.text),
      pointee(other.pointee ? std::make_unique<EncodedType>(*other.pointee) : nullptr)
{
}

EncodedType& EncodedType::operator=(const EncodedType& other)
{
    if (this != &other) {
        kind = other.kind;
        text = other.text;
        pointee = other.pointee ? std::make_unique<EncodedType>(*other.pointee) : nullptr;
    }
    return *this;
}

EncodedType EncodedType::MakePointer(EncodedType pointee)
{
    EncodedType res(TypeKind::POINTER);
    res.pointee = std::make_unique<EncodedType>(std::move(pointee));
    return res;
}

EncodedType EncodedType::MakeAggregate(std::string name)
{
    EncodedType res(TypeKind::AGGREGATE);
    res.text = std::move(name);
    return res;
}

EncodedType EncodedType::MakeUnresolved(std::string raw)
{
    EncodedType res(TypeKind::UNRESOLVED);
    res.text = std::move(raw);
    return res;
}

bool EncodedType::IsPrimitive() const
{
    return kind <= TypeKind::DOUBLE;
}

std::string EncodedType::ToString() const
{
    switch (kind) {
        case TypeKind::POINTER:
            return std::string(KindName(kind)) + "(" + (pointee ? pointee->ToString() : "") + ")";
        case TypeKind::AGGREGATE:
        case TypeKind::UNRESOLVED:
            return std::string(KindName(kind)) + "(" + text + ")";
        default:
            return KindName(kind);
    }
}

bool EncodedType::operator==(const EncodedType& other) const
{
    if (kind != other.kind || text != other.text) {
        return false;
    }
    if (pointee == nullptr || other.pointee == nullptr) {
        return pointee == other.pointee;
    }
    return *pointee == *other.pointee;
}

DecodeResult DecodeOne(std::string_view encoding)
{
    if (encoding.empty()) {
        return {EncodedType::MakeUnresolved(EMPTY_INPUT_FRAGMENT), 0};
    }
    char head = encoding.front();
    if (auto found = SINGLE_CHAR_TYPES.find(head); found != SINGLE_CHAR_TYPES.end()) {
        return {EncodedType(found->second), 1};
    }
    if (head == POINTER_PREFIX) {
        return DecodePointer(encoding);
    }
    if (head == AGGREGATE_OPEN) {
        return DecodeAggregate(encoding);
    }
    return {EncodedType::MakeUnresolved(std::string(1, head)), 1};
}

std::optional<MethodSignature> DecodeSignature(const std::string& raw)
{
    std::string cleaned = Utils::Trim(raw);
    auto first = cleaned.find_first_not_of(SIGNATURE_DELIMITERS);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    cleaned = Utils::Trim(cleaned.substr(first, cleaned.find_last_not_of(SIGNATURE_DELIMITERS) - first + 1));
    if (cleaned.empty()) {
        return std::nullopt;
    }

    std::vector<EncodedType> types;
    std::string_view rest(cleaned);
    while (!rest.empty()) {
        // Digit runs are stack offsets and frame sizes.
        if (std::isdigit(static_cast<unsigned char>(rest.front()))) {
            size_t digits = 0;
            while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) {
                ++digits;
            }
            rest.remove_prefix(digits);
            continue;
        }
        auto decoded = DecodeOne(rest);
        rest.remove_prefix(std::max<size_t>(decoded.consumed, 1));
        types.emplace_back(std::move(decoded.type));
    }
    if (types.empty()) {
        return std::nullopt;
    }

    MethodSignature signature;
    signature.returnType = std::move(types.front());
    signature.argTypes.assign(
        std::make_move_iterator(types.begin() + 1), std::make_move_iterator(types.end()));
    return signature;
}

DispatchKind GetDispatchKind(const EncodedType& returnType)
{
    if (returnType.GetKind() == TypeKind::AGGREGATE) {
        return DispatchKind::STRUCT_RETURN;
    }
    if (returnType.IsFloatingPoint()) {
        return DispatchKind::FLOAT_RETURN;
    }
    return DispatchKind::STANDARD;
}
} // namespace ObjCBind::Encoding
