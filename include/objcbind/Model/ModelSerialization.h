// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the serialization of the interface model, so that generation can be re-run without
 * parsing the inputs again.
 */

#ifndef OBJCBIND_MODEL_MODELSERIALIZATION_H
#define OBJCBIND_MODEL_MODELSERIALIZATION_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "objcbind/Model/InterfaceModel.h"

namespace ObjCBind {
constexpr int FB_MAX_DEPTH = 64;
constexpr int FB_MAX_TABLES = 2000000;
constexpr uint32_t MODEL_FORMAT_VERSION = 1;

std::vector<uint8_t> WriteModel(const InterfaceModel& model);

/**
 * The buffer is verified before it is read.
 * @return std::nullopt when the buffer is not a model or was written by another format version.
 */
std::optional<InterfaceModel> LoadModel(const std::vector<uint8_t>& data);

bool SaveModelToFile(const InterfaceModel& model, const std::string& filePath);
/// Reports unreadable and corrupt files with Errorln.
std::optional<InterfaceModel> LoadModelFromFile(const std::string& filePath);
} // namespace ObjCBind

#endif // OBJCBIND_MODEL_MODELSERIALIZATION_H
