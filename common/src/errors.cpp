/**
 * @file errors.cpp
 * @brief Exception types raised by meshcert
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/errors.h"

namespace meshcert {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CAInitFail:
            return "CAInitFail";
        case ErrorKind::CAUnavailable:
            return "CAUnavailable";
        case ErrorKind::KeyMismatch:
            return "KeyMismatch";
        case ErrorKind::ChainInvalid:
            return "ChainInvalid";
        case ErrorKind::RootVerifyFailed:
            return "RootVerifyFailed";
        case ErrorKind::CertGenError:
            return "CertGenError";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::RootNotFound:
            return "RootNotFound";
        case ErrorKind::PropagationError:
            return "PropagationError";
    }
    return "Unknown";
}

CertError::CertError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message)
    , kind_(kind)
{}

} // namespace meshcert
