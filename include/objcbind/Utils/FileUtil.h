// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares file util related apis.
 */

#ifndef OBJCBIND_UTILS_FILEUTIL_H
#define OBJCBIND_UTILS_FILEUTIL_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ObjCBind {
// Input documents (dumps, stub descriptors, model caches) larger than this are rejected.
const size_t FILE_LEN_LIMIT = 256ULL * 1024 * 1024; // 256 MB
const size_t BOM_ENCODING_LEN = 3;
const size_t DIR_PATH_MAX_LENGTH = 4096;

namespace FileUtil {
/**
 * Get the directory part of a path.
 * @param filePath String like "path/file.extension".
 * @return "path", or "." when there is no directory part.
 */
std::string GetDirPath(const std::string& filePath);

bool FileExist(const std::string& path);

/**
 * Get the size of the File.
 * @param Path to the file.
 * @return file size, 0 when the file can not be stated.
 */
size_t GetFileSize(const std::string& filePath);

/**
 * Create every missing directory of \ref directoryPath up to its last separator.
 * @return 0 on success.
 */
int32_t CreateDirs(const std::string& directoryPath);

/**
 * Read file and return its content. A UTF-8 byte order mark is dropped.
 * @param[in] filePath String like "path/file.extension".
 * @param[out] failedReason Why read file failed.
 * @return content
 */
std::optional<std::string> ReadFileContent(const std::string& filePath, std::string& failedReason);

/**
 * Read a binary file to buffer.
 * @param[in] filePath String like "path/file.objm".
 * @param[out] buffer File content.
 * @param[out] failedReason Why read file to buffer failed.
 * @return whether func invoked successfully.
 */
bool ReadBinaryFileToBuffer(const std::string& filePath, std::vector<uint8_t>& buffer, std::string& failedReason);

/**
 * Write data into file, creating the parent directories when needed.
 * @param filePath string like "path/to/file".
 * @param data string to be written into file.
 * @return whether func invoked successfully.
 */
bool WriteToFile(const std::string& filePath, const std::string& data);

/**
 * Write buffer into a binary file.
 * @return whether func invoked successfully.
 */
bool WriteBufferToFile(const std::string& filePath, const std::vector<uint8_t>& buffer);
} // namespace FileUtil
} // namespace ObjCBind

#endif // OBJCBIND_UTILS_FILEUTIL_H
