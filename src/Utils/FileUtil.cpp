// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements file util related apis.
 */

#include "objcbind/Utils/FileUtil.h"

#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "objcbind/Basic/Print.h"

namespace ObjCBind::FileUtil {
namespace {
constexpr char SLASH = '/';

std::optional<size_t> FindLastOfDirSplit(const std::string& filePath)
{
    auto pos = filePath.find_last_of(SLASH);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}
} // namespace

std::string GetDirPath(const std::string& filePath)
{
    auto posOpt = FindLastOfDirSplit(filePath);
    if (posOpt) {
        return posOpt.value() == 0 ? std::string(1, SLASH) : filePath.substr(0, posOpt.value());
    }
    return ".";
}

bool FileExist(const std::string& path)
{
    return access(path.c_str(), F_OK) == 0;
}

size_t GetFileSize(const std::string& filePath)
{
    // `tellg` does not report the size of the file.
    // Though it usually works, it may fail.
    struct stat statBuf;
    int rc = stat(filePath.c_str(), &statBuf);
    return rc == 0 ? static_cast<size_t>(statBuf.st_size) : 0;
}

int32_t CreateDirs(const std::string& directoryPath)
{
    size_t dirPathLen = directoryPath.length();
    if (dirPathLen > DIR_PATH_MAX_LENGTH) {
        Errorln("Failed to create directory: ", directoryPath, "\nthe path cannot be longer than ",
            DIR_PATH_MAX_LENGTH, " characters.");
        return -1;
    }
    std::string tmpDirPath;
    for (size_t i = 0; i < dirPathLen; ++i) {
        tmpDirPath += directoryPath[i];
        if (directoryPath[i] != SLASH || i == 0) {
            continue;
        }
        if (FileExist(tmpDirPath)) {
            continue;
        }
        // The path may be created by another process after the first access. The required folder exists
        // anyway in that case, so check the existence again before reporting a failure.
        int32_t ret = mkdir(tmpDirPath.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
        if (ret != 0 && !FileExist(tmpDirPath)) {
            return ret;
        }
    }
    return 0;
}

std::optional<std::string> ReadFileContent(const std::string& filePath, std::string& failedReason)
{
    failedReason.clear();
    if (!FileExist(filePath)) {
        failedReason = "file not exist";
        return std::nullopt;
    }
    std::ifstream is(filePath, std::ios::in | std::ios::binary);
    if (!is) {
        failedReason = "open file failed";
        return std::nullopt;
    }
    size_t len = GetFileSize(filePath);
    if (len >= FILE_LEN_LIMIT) {
        failedReason = "exceed the max file length: 256 MB";
        is.close();
        return std::nullopt;
    }
    std::string content;
    // Check BOM UTF-8 EF BB BF.
    if (len >= BOM_ENCODING_LEN) {
        content.resize(BOM_ENCODING_LEN);
        is.read(content.data(), BOM_ENCODING_LEN);
        // 0, 1, and 2 respectively indicate the three bytes of the byte order mark (BOM) in UTF-8.
        if (content[0] == '\xEF' && content[1] == '\xBB' && content[2] == '\xBF') {
            is.seekg(BOM_ENCODING_LEN, std::ifstream::beg);
            len -= BOM_ENCODING_LEN;
        } else {
            is.seekg(0, std::ifstream::beg);
        }
    }
    content.resize(len);
    is.read(content.data(), static_cast<std::streamsize>(len));
    size_t realLen = static_cast<size_t>(is.gcount());
    if (is.bad()) {
        failedReason = "only " + std::to_string(realLen) + " could be read";
    } else if (is.eof() || realLen < len) {
        content.resize(realLen);
    }
    is.close();
    if (!failedReason.empty()) {
        return std::nullopt;
    }
    return content;
}

bool ReadBinaryFileToBuffer(const std::string& filePath, std::vector<uint8_t>& buffer, std::string& failedReason)
{
    failedReason.clear();
    std::ifstream is(filePath, std::ifstream::in | std::ifstream::binary);
    if (!is.is_open()) {
        failedReason = "open file failed";
        return false;
    }
    size_t fileLength = GetFileSize(filePath);
    if (fileLength == 0) {
        failedReason = "empty binary file";
    }
    if (fileLength >= FILE_LEN_LIMIT) {
        failedReason = "exceed the max file length: 256 MB";
    }
    if (!failedReason.empty()) {
        is.close();
        return false;
    }
    buffer.resize(fileLength);
    is.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileLength));
    size_t realLen = static_cast<size_t>(is.gcount());
    if (is.bad()) {
        failedReason = "only " + std::to_string(realLen) + " could be read";
    } else if (is.eof() || realLen < fileLength) {
        buffer.resize(realLen);
    }
    is.close();
    return failedReason.empty();
}

bool WriteToFile(const std::string& filePath, const std::string& data)
{
    std::string baseDir = GetDirPath(filePath);
    if (!FileExist(baseDir)) {
        if (CreateDirs(baseDir + "/") != 0) {
            Errorln("Failed to create file " + filePath);
            return false;
        }
    }
    std::ofstream file(filePath, std::ios::out | std::ios::binary);
    if (!file.is_open()) {
        Errorln("Failed to open file " + filePath);
        return false;
    }

    file << data;

    bool didSucceed = !file.fail();
    if (!didSucceed) {
        Errorln("Failed to write to file " + filePath);
    }
    file.close();

    return didSucceed;
}

bool WriteBufferToFile(const std::string& filePath, const std::vector<uint8_t>& buffer)
{
    std::string baseDir = GetDirPath(filePath);
    if (!FileExist(baseDir)) {
        if (CreateDirs(baseDir + "/") != 0) {
            return false;
        }
    }
    std::ofstream outStream(filePath, std::ofstream::out | std::ofstream::binary);
    if (!outStream.is_open()) {
        return false;
    }
    auto length = buffer.size();
    outStream.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(length));
    bool success = !outStream.fail();
    outStream.close();
    return success;
}
} // namespace ObjCBind::FileUtil
