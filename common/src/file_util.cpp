/**
 * @file file_util.cpp
 * @brief PEM file reading and atomic writing
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/file_util.h"
#include "meshcert/common/errors.h"
#include <sys/stat.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace meshcert {

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CertError(ErrorKind::IOError, "Failed to open file: " + path + " (" + std::strerror(errno) + ")");
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw CertError(ErrorKind::IOError, "Failed to read file: " + path);
    }
    return contents;
}

void WriteFileAtomic(const std::string& path, const std::string& contents, unsigned int mode) {
    const std::string tmp_path = path + ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw CertError(ErrorKind::IOError, "Failed to create file: " + tmp_path);
        }
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        file.flush();
        if (!file) {
            throw CertError(ErrorKind::IOError, "Failed to write file: " + tmp_path);
        }
    }

    if (chmod(tmp_path.c_str(), static_cast<mode_t>(mode)) != 0) {
        std::remove(tmp_path.c_str());
        throw CertError(ErrorKind::IOError, "Failed to set permissions on " + tmp_path);
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw CertError(ErrorKind::IOError, "Failed to rename " + tmp_path + " to " + path +
                                            " (" + std::strerror(errno) + ")");
    }
}

bool FileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace meshcert
