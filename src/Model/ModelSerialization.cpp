// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the serialization of the interface model.
 */

#include "objcbind/Model/ModelSerialization.h"

#include <algorithm>

#include "flatbuffers/InterfaceModelFormat_generated.h"
#include "objcbind/Basic/Print.h"
#include "objcbind/Utils/CheckUtils.h"
#include "objcbind/Utils/FileUtil.h"

using namespace ObjCBind;

namespace {
using TStringOffset = flatbuffers::Offset<flatbuffers::String>;
using TMethodOffset = flatbuffers::Offset<ModelFormat::Method>;
using TPropertyOffset = flatbuffers::Offset<ModelFormat::Property>;
using TClassOffset = flatbuffers::Offset<ModelFormat::Class>;
using TStubOffset = flatbuffers::Offset<ModelFormat::StubExports>;
using TStringVector = flatbuffers::Vector<TStringOffset>;

class ModelWriter {
public:
    std::vector<uint8_t> Write(const InterfaceModel& model)
    {
        std::vector<TClassOffset> classes;
        for (auto& record : model.classes) {
            classes.push_back(WriteClass(record));
        }
        std::vector<TStubOffset> stubs;
        for (auto& exports : model.stubs) {
            stubs.push_back(WriteStub(exports));
        }
        auto classVec = builder.CreateVector<TClassOffset>(classes);
        auto stubVec = builder.CreateVector<TStubOffset>(stubs);
        auto root = ModelFormat::CreateInterfaceModel(builder, MODEL_FORMAT_VERSION, classVec, stubVec);
        ModelFormat::FinishInterfaceModelBuffer(builder, root);

        auto size = static_cast<size_t>(builder.GetSize());
        std::vector<uint8_t> data;
        data.resize(size);
        uint8_t* buf = builder.GetBufferPointer();
        OBJCBIND_NULLPTR_CHECK(buf);
        std::copy(buf, buf + size, data.begin());
        return data;
    }

private:
    flatbuffers::FlatBufferBuilder builder;

    TClassOffset WriteClass(const ClassRecord& record)
    {
        std::vector<TMethodOffset> methods;
        for (auto& method : record.methods) {
            auto selector = builder.CreateString(method.selector);
            auto encoding = builder.CreateString(method.encoding);
            methods.push_back(ModelFormat::CreateMethod(builder, selector, encoding));
        }
        std::vector<TPropertyOffset> properties;
        for (auto& property : record.properties) {
            auto name = builder.CreateString(property.name);
            auto attributes = builder.CreateString(property.attributes);
            properties.push_back(ModelFormat::CreateProperty(builder, name, attributes));
        }
        auto name = builder.CreateString(record.name);
        // A null offset leaves the field absent: no superclass.
        TStringOffset superclass;
        if (record.superclass) {
            superclass = builder.CreateString(*record.superclass);
        }
        auto methodVec = builder.CreateVector<TMethodOffset>(methods);
        auto propertyVec = builder.CreateVector<TPropertyOffset>(properties);
        return ModelFormat::CreateClass(builder, name, superclass, methodVec, propertyVec);
    }

    TStubOffset WriteStub(const StubExportSet& exports)
    {
        auto installName = builder.CreateString(exports.installName);
        auto symbols = builder.CreateVectorOfStrings(exports.symbols);
        auto objcClasses = builder.CreateVectorOfStrings(exports.objcClasses);
        auto objcIvars = builder.CreateVectorOfStrings(exports.objcIvars);
        auto version = exports.version == StubVersion::V4 ? ModelFormat::StubVersion::V4 : ModelFormat::StubVersion::V3;
        return ModelFormat::CreateStubExports(builder, version, installName, symbols, objcClasses, objcIvars);
    }
};

std::string ReadString(const flatbuffers::String* str)
{
    return str == nullptr ? "" : str->str();
}

std::vector<std::string> ReadStrings(const TStringVector* strs)
{
    std::vector<std::string> res;
    if (strs == nullptr) {
        return res;
    }
    for (flatbuffers::uoffset_t i = 0; i < strs->size(); i++) {
        res.emplace_back(ReadString(strs->Get(i)));
    }
    return res;
}

ClassRecord LoadClass(const ModelFormat::Class& cls)
{
    ClassRecord record(ReadString(cls.name()));
    if (cls.superclass()) {
        record.superclass = cls.superclass()->str();
    }
    if (cls.methods()) {
        for (flatbuffers::uoffset_t i = 0; i < cls.methods()->size(); i++) {
            auto method = cls.methods()->Get(i);
            record.methods.push_back({ReadString(method->selector()), ReadString(method->encoding())});
        }
    }
    if (cls.properties()) {
        for (flatbuffers::uoffset_t i = 0; i < cls.properties()->size(); i++) {
            auto property = cls.properties()->Get(i);
            record.properties.push_back({ReadString(property->name()), ReadString(property->attributes())});
        }
    }
    return record;
}

StubExportSet LoadStub(const ModelFormat::StubExports& stub)
{
    StubExportSet exports;
    exports.version = stub.version() == ModelFormat::StubVersion::V4 ? StubVersion::V4 : StubVersion::V3;
    exports.installName = ReadString(stub.installName());
    exports.symbols = ReadStrings(stub.symbols());
    exports.objcClasses = ReadStrings(stub.objcClasses());
    exports.objcIvars = ReadStrings(stub.objcIvars());
    return exports;
}
} // namespace

std::vector<uint8_t> ObjCBind::WriteModel(const InterfaceModel& model)
{
    ModelWriter writer;
    return writer.Write(model);
}

std::optional<InterfaceModel> ObjCBind::LoadModel(const std::vector<uint8_t>& data)
{
    // We need to verify the size first.
    flatbuffers::Verifier verifier(data.data(), data.size(), FB_MAX_DEPTH, FB_MAX_TABLES);
    if (!ModelFormat::VerifyInterfaceModelBuffer(verifier)) {
        return std::nullopt;
    }
    auto root = ModelFormat::GetInterfaceModel(data.data());
    OBJCBIND_NULLPTR_CHECK(root);
    if (root->formatVersion() != MODEL_FORMAT_VERSION) {
        return std::nullopt;
    }

    InterfaceModel model;
    if (root->classes()) {
        for (flatbuffers::uoffset_t i = 0; i < root->classes()->size(); i++) {
            model.classes.push_back(LoadClass(*root->classes()->Get(i)));
        }
    }
    if (root->stubs()) {
        for (flatbuffers::uoffset_t i = 0; i < root->stubs()->size(); i++) {
            model.stubs.push_back(LoadStub(*root->stubs()->Get(i)));
        }
    }
    return model;
}

bool ObjCBind::SaveModelToFile(const InterfaceModel& model, const std::string& filePath)
{
    return FileUtil::WriteBufferToFile(filePath, WriteModel(model));
}

std::optional<InterfaceModel> ObjCBind::LoadModelFromFile(const std::string& filePath)
{
    std::vector<uint8_t> data;
    std::string failedReason;
    if (!FileUtil::ReadBinaryFileToBuffer(filePath, data, failedReason)) {
        Errorln("cannot read model file '", filePath, "': ", failedReason);
        return std::nullopt;
    }
    auto model = LoadModel(data);
    if (!model) {
        Errorln("'", filePath, "' is not a valid interface model file");
    }
    return model;
}
