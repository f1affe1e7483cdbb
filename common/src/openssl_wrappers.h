/**
 * @file openssl_wrappers.h
 * @brief RAII wrappers for OpenSSL resources
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_OPENSSL_WRAPPERS_H
#define MESHCERT_OPENSSL_WRAPPERS_H

#include <memory>
#include <string>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace meshcert {
namespace crypto {
namespace internal {

// Custom deleters for OpenSSL types
struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); }
};

struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* p) const { if (p) EVP_PKEY_CTX_free(p); }
};

struct BIO_Deleter {
    void operator()(BIO* p) const { if (p) BIO_free(p); }
};

struct BIGNUM_Deleter {
    void operator()(BIGNUM* p) const { if (p) BN_free(p); }
};

struct X509_Deleter {
    void operator()(X509* p) const { if (p) X509_free(p); }
};

struct X509_REQ_Deleter {
    void operator()(X509_REQ* p) const { if (p) X509_REQ_free(p); }
};

struct X509_NAME_Deleter {
    void operator()(X509_NAME* p) const { if (p) X509_NAME_free(p); }
};

struct X509_EXTENSION_Deleter {
    void operator()(X509_EXTENSION* p) const { if (p) X509_EXTENSION_free(p); }
};

struct X509_STORE_Deleter {
    void operator()(X509_STORE* p) const { if (p) X509_STORE_free(p); }
};

struct X509_STORE_CTX_Deleter {
    void operator()(X509_STORE_CTX* p) const { if (p) X509_STORE_CTX_free(p); }
};

// Frees the stack only; the certificates stay owned by their Certificate objects
struct X509_STACK_Deleter {
    void operator()(STACK_OF(X509)* p) const { if (p) sk_X509_free(p); }
};

struct X509_EXTENSION_STACK_Deleter {
    void operator()(STACK_OF(X509_EXTENSION)* p) const {
        if (p) sk_X509_EXTENSION_pop_free(p, X509_EXTENSION_free);
    }
};

struct GENERAL_NAMES_Deleter {
    void operator()(GENERAL_NAMES* p) const { if (p) GENERAL_NAMES_free(p); }
};

// RAII wrappers using unique_ptr
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;
using X509_ptr = std::unique_ptr<X509, X509_Deleter>;
using X509_REQ_ptr = std::unique_ptr<X509_REQ, X509_REQ_Deleter>;
using X509_NAME_ptr = std::unique_ptr<X509_NAME, X509_NAME_Deleter>;
using X509_EXTENSION_ptr = std::unique_ptr<X509_EXTENSION, X509_EXTENSION_Deleter>;
using X509_STORE_ptr = std::unique_ptr<X509_STORE, X509_STORE_Deleter>;
using X509_STORE_CTX_ptr = std::unique_ptr<X509_STORE_CTX, X509_STORE_CTX_Deleter>;
using X509_STACK_ptr = std::unique_ptr<STACK_OF(X509), X509_STACK_Deleter>;
using X509_EXTENSION_STACK_ptr = std::unique_ptr<STACK_OF(X509_EXTENSION), X509_EXTENSION_STACK_Deleter>;
using GENERAL_NAMES_ptr = std::unique_ptr<GENERAL_NAMES, GENERAL_NAMES_Deleter>;

// Read the contents of a memory BIO
inline std::string BioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        return std::string();
    }
    return std::string(data, static_cast<size_t>(len));
}

// Oldest queued OpenSSL error, for exception messages. Clears the queue.
inline std::string LastOpenSSLError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

// Digest for X509_sign / X509_REQ_sign: Ed25519 signs without a separate hash
inline const EVP_MD* SigningDigestFor(EVP_PKEY* pkey) {
    if (EVP_PKEY_get_base_id(pkey) == EVP_PKEY_ED25519) {
        return nullptr;
    }
    return EVP_sha256();
}

} // namespace internal
} // namespace crypto
} // namespace meshcert

#endif // MESHCERT_OPENSSL_WRAPPERS_H
