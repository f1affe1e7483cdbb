/**
 * @file errors.h
 * @brief Exception types raised by meshcert
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_ERRORS_H
#define MESHCERT_ERRORS_H

#include <stdexcept>
#include <string>

namespace meshcert {

/**
 * @brief Canonical failure kinds of the identity plane
 */
enum class ErrorKind {
    CAInitFail,        ///< CA bundle failed to load at startup
    CAUnavailable,     ///< CA has never been loaded
    KeyMismatch,       ///< Private key does not belong to the certificate
    ChainInvalid,      ///< Certificate chain does not verify against the root
    RootVerifyFailed,  ///< Resolved root does not terminate the signed chain
    CertGenError,      ///< Signing backend failure (timeout, rejection, transport)
    IOError,           ///< File read/write failure
    RootNotFound,      ///< No root configured for the requested signer
    PropagationError   ///< Trust anchors could not be pushed downstream
};

/**
 * @brief Stable name of an error kind (for logs)
 */
const char* ErrorKindName(ErrorKind kind);

/**
 * @brief Identity plane failure with a canonical kind
 */
class CertError : public std::runtime_error {
public:
    CertError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace meshcert

#endif // MESHCERT_ERRORS_H
