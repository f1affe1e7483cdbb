/**
 * @file crypto_keys.cpp
 * @brief Private and public key wrapper implementations (OpenSSL 3.x)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <cstdio>

namespace meshcert {
namespace crypto {

using namespace internal;

// ============================================================================
// PrivateKey Implementation
// ============================================================================

class PrivateKey::Impl {
public:
    EVP_PKEY_ptr pkey;
};

PrivateKey::PrivateKey() : impl_(std::make_unique<Impl>()) {}

PrivateKey::~PrivateKey() = default;

PrivateKey::PrivateKey(PrivateKey&&) noexcept = default;
PrivateKey& PrivateKey::operator=(PrivateKey&&) noexcept = default;

PrivateKey PrivateKey::LoadFromFile(const std::string& path) {
    FILE* fp = fopen(path.c_str(), "r");
    if (!fp) {
        throw CryptoError("Failed to open private key file: " + path);
    }

    PrivateKey key;
    key.impl_->pkey.reset(PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr));
    fclose(fp);

    if (!key.impl_->pkey) {
        ERR_clear_error();
        throw CryptoError("Failed to parse private key from: " + path);
    }

    return key;
}

PrivateKey PrivateKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PrivateKey key;
    key.impl_->pkey.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));

    if (!key.impl_->pkey) {
        ERR_clear_error();
        throw CryptoError("Failed to parse private key from PEM");
    }

    return key;
}

PrivateKey PrivateKey::Generate(KeyType type) {
    if (RAND_status() != 1) {
        throw CryptoError("OpenSSL PRNG not properly seeded - insufficient entropy");
    }

    PrivateKey key;

    switch (type) {
        case KeyType::EcdsaP256:
            key.impl_->pkey.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"));
            break;
        case KeyType::Rsa2048:
            key.impl_->pkey.reset(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(2048)));
            break;
        case KeyType::Ed25519: {
            EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "ED25519", nullptr));
            if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
                throw CryptoError("Failed to initialize ED25519 keygen");
            }
            EVP_PKEY* raw = nullptr;
            if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
                throw CryptoError("Failed to generate ED25519 key pair");
            }
            key.impl_->pkey.reset(raw);
            break;
        }
    }

    if (!key.impl_->pkey) {
        throw CryptoError("Failed to generate key pair: " + LastOpenSSLError());
    }

    return key;
}

std::string PrivateKey::ToPEM() const {
    if (!impl_->pkey) {
        throw CryptoError("Cannot encode empty private key");
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PrivateKey(bio.get(), impl_->pkey.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
        throw CryptoError("Failed to write private key to PEM");
    }

    return BioToString(bio.get());
}

bool PrivateKey::IsEmpty() const {
    return !impl_->pkey;
}

void* PrivateKey::GetNativeHandle() const {
    return impl_->pkey.get();
}

// ============================================================================
// PublicKey Implementation
// ============================================================================

class PublicKey::Impl {
public:
    EVP_PKEY_ptr pkey;
};

PublicKey::PublicKey() : impl_(std::make_unique<Impl>()) {}

PublicKey::~PublicKey() = default;

PublicKey::PublicKey(PublicKey&&) noexcept = default;
PublicKey& PublicKey::operator=(PublicKey&&) noexcept = default;

PublicKey PublicKey::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    PublicKey key;
    key.impl_->pkey.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));

    if (!key.impl_->pkey) {
        ERR_clear_error();
        throw CryptoError("Failed to parse public key from PEM");
    }

    return key;
}

PublicKey PublicKey::FromPrivateKey(const PrivateKey& privkey) {
    EVP_PKEY* priv_pkey = static_cast<EVP_PKEY*>(privkey.GetNativeHandle());
    if (!priv_pkey) {
        throw CryptoError("Cannot derive public key from empty private key");
    }

    // Export and re-import the SubjectPublicKeyInfo so no private material is shared
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO for public key");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), priv_pkey)) {
        throw CryptoError("Failed to write public key");
    }

    return LoadFromPEM(BioToString(bio.get()));
}

std::string PublicKey::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_PUBKEY(bio.get(), impl_->pkey.get())) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return BioToString(bio.get());
}

void* PublicKey::GetNativeHandle() const {
    return impl_->pkey.get();
}

} // namespace crypto
} // namespace meshcert
