/**
 * @file file_util.h
 * @brief PEM file reading and atomic writing
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_FILE_UTIL_H
#define MESHCERT_FILE_UTIL_H

#include <string>

namespace meshcert {

/**
 * @brief Read a whole file
 * @throws CertError IOError if the file cannot be opened or read
 */
std::string ReadFile(const std::string& path);

/**
 * @brief Replace a file's contents atomically
 *
 * Writes to "<path>.tmp" and renames it over the target so readers see
 * either the old or the new contents.
 *
 * @param mode Permission bits of the new file
 * @throws CertError IOError on failure
 */
void WriteFileAtomic(const std::string& path, const std::string& contents, unsigned int mode = 0644);

bool FileExists(const std::string& path);

} // namespace meshcert

#endif // MESHCERT_FILE_UTIL_H
