/**
 * @file crypto_certificate.cpp
 * @brief X.509 certificate wrapper implementation (OpenSSL 3.x)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/crypto.h"
#include "openssl_wrappers.h"
#include "x509_utils.h"
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <openssl/x509v3.h>
#include <fstream>
#include <iterator>

namespace meshcert {
namespace crypto {

using namespace internal;

class Certificate::Impl {
public:
    X509_ptr cert;
};

Certificate::Certificate() : impl_(std::make_unique<Impl>()) {}

Certificate::~Certificate() = default;

Certificate::Certificate(Certificate&&) noexcept = default;
Certificate& Certificate::operator=(Certificate&&) noexcept = default;

namespace {
    std::string ReadTextFile(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw CryptoError("Failed to open certificate file: " + path);
        }
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    X509* CheckedHandle(const Certificate& cert) {
        X509* x509 = static_cast<X509*>(cert.GetNativeHandle());
        if (!x509) {
            throw CryptoError("Certificate is empty");
        }
        return x509;
    }
}

Certificate Certificate::LoadFromFile(const std::string& path) {
    auto chain = LoadChainFromPEM(ReadTextFile(path));
    return std::move(chain.front());
}

Certificate Certificate::LoadFromPEM(const std::string& pem) {
    auto chain = LoadChainFromPEM(pem);
    return std::move(chain.front());
}

std::vector<Certificate> Certificate::LoadChainFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM data");
    }

    std::vector<Certificate> chain;

    while (true) {
        X509* x509 = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
        if (!x509) {
            break;  // No more certificates (or trailing garbage)
        }
        Certificate cert;
        cert.impl_->cert.reset(x509);
        chain.push_back(std::move(cert));
    }
    // The loop always ends on a PEM_R_NO_START_LINE error
    ERR_clear_error();

    if (chain.empty()) {
        throw CryptoError("No certificates found in PEM data");
    }

    return chain;
}

Certificate Certificate::LoadFromDER(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    Certificate cert;
    cert.impl_->cert.reset(d2i_X509(nullptr, &p, static_cast<long>(der.size())));

    if (!cert.impl_->cert) {
        ERR_clear_error();
        throw CryptoError("Failed to parse certificate from DER");
    }

    return cert;
}

std::string Certificate::CreateChainPEM(const std::vector<Certificate>& chain) {
    std::string result;
    for (const auto& cert : chain) {
        result += cert.ToPEM();
    }
    return result;
}

std::vector<uint8_t> Certificate::ToDER() const {
    unsigned char* der = nullptr;
    int len = i2d_X509(CheckedHandle(*this), &der);

    if (len < 0) {
        throw CryptoError("Failed to encode certificate to DER");
    }

    std::vector<uint8_t> result(der, der + len);
    OPENSSL_free(der);

    return result;
}

std::string Certificate::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509(bio.get(), CheckedHandle(*this))) {
        throw CryptoError("Failed to write certificate to PEM");
    }

    return BioToString(bio.get());
}

Certificate Certificate::Clone() const {
    Certificate copy;
    copy.impl_->cert.reset(X509_dup(CheckedHandle(*this)));
    if (!copy.impl_->cert) {
        throw CryptoError("Failed to duplicate certificate");
    }
    return copy;
}

PublicKey Certificate::GetPublicKey() const {
    EVP_PKEY* pkey = X509_get0_pubkey(CheckedHandle(*this));
    if (!pkey) {
        throw CryptoError("Failed to extract public key from certificate");
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || !PEM_write_bio_PUBKEY(bio.get(), pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return PublicKey::LoadFromPEM(BioToString(bio.get()));
}

bool Certificate::MatchesPrivateKey(const PrivateKey& key) const {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(key.GetNativeHandle());
    if (!pkey) {
        return false;
    }

    int result = X509_check_private_key(CheckedHandle(*this), pkey);
    ERR_clear_error();
    return result == 1;
}

bool Certificate::IsSignedBy(const Certificate& issuer) const {
    EVP_PKEY* issuer_key = X509_get0_pubkey(CheckedHandle(issuer));
    if (!issuer_key) {
        return false;
    }

    int result = X509_verify(CheckedHandle(*this), issuer_key);
    ERR_clear_error();
    return result == 1;
}

void Certificate::VerifyChainWithIntermediates(
    const std::vector<Certificate>& intermediates,
    const std::vector<Certificate>& roots,
    int64_t trusted_time
) const {
    if (roots.empty()) {
        throw CryptoError("Chain validation failed: no trust anchors");
    }

    X509_STORE_ptr store(X509_STORE_new());
    if (!store) {
        throw CryptoError("Failed to create X509 store");
    }

    for (const auto& root : roots) {
        // X509_STORE_add_cert takes its own reference
        if (X509_STORE_add_cert(store.get(), CheckedHandle(root)) != 1) {
            // Duplicate anchors are reported as errors; they are harmless
            ERR_clear_error();
        }
    }

    X509_STACK_ptr untrusted(sk_X509_new_null());
    if (!untrusted) {
        throw CryptoError("Failed to allocate certificate stack");
    }
    for (const auto& intermediate : intermediates) {
        sk_X509_push(untrusted.get(), CheckedHandle(intermediate));
    }

    X509_STORE_CTX_ptr ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), CheckedHandle(*this), untrusted.get()) != 1) {
        throw CryptoError("Failed to initialize certificate verification context");
    }

    X509_VERIFY_PARAM* param = X509_STORE_CTX_get0_param(ctx.get());
    X509_VERIFY_PARAM_set_flags(param, X509_V_FLAG_PARTIAL_CHAIN);
    X509_VERIFY_PARAM_set_time(param, static_cast<time_t>(trusted_time));

    if (X509_verify_cert(ctx.get()) != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        ERR_clear_error();
        throw CryptoError(std::string("Chain validation failed: ") + X509_verify_cert_error_string(err));
    }
}

std::string Certificate::GetSubject() const {
    return NameToString(X509_get_subject_name(CheckedHandle(*this)));
}

std::string Certificate::GetIssuer() const {
    return NameToString(X509_get_issuer_name(CheckedHandle(*this)));
}

std::string Certificate::GetSerialNumber() const {
    const ASN1_INTEGER* serial = X509_get0_serialNumber(CheckedHandle(*this));
    BIGNUM_ptr bn(ASN1_INTEGER_to_BN(serial, nullptr));
    if (!bn) {
        throw CryptoError("Failed to read certificate serial number");
    }

    char* hex = BN_bn2hex(bn.get());
    if (!hex) {
        throw CryptoError("Failed to encode certificate serial number");
    }
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

std::pair<int64_t, int64_t> Certificate::GetValidityPeriod() const {
    X509* x509 = CheckedHandle(*this);
    return {AsnTimeToEpoch(X509_get0_notBefore(x509)), AsnTimeToEpoch(X509_get0_notAfter(x509))};
}

int64_t Certificate::GetNotBefore() const {
    return AsnTimeToEpoch(X509_get0_notBefore(CheckedHandle(*this)));
}

int64_t Certificate::GetNotAfter() const {
    return AsnTimeToEpoch(X509_get0_notAfter(CheckedHandle(*this)));
}

std::vector<std::string> Certificate::GetSubjectAltNames() const {
    GENERAL_NAMES_ptr names(static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(CheckedHandle(*this), NID_subject_alt_name, nullptr, nullptr)));
    return GeneralNamesToStrings(names.get());
}

bool Certificate::IsCA() const {
    return X509_check_ca(CheckedHandle(*this)) > 0;
}

bool Certificate::IsSelfSigned() const {
    X509* x509 = CheckedHandle(*this);
    if (X509_NAME_cmp(X509_get_subject_name(x509), X509_get_issuer_name(x509)) != 0) {
        return false;
    }
    return IsSignedBy(*this);
}

void* Certificate::GetNativeHandle() const {
    return impl_->cert.get();
}

std::string FindRootCertFromCertificateChain(const std::string& chain_pem) {
    auto chain = Certificate::LoadChainFromPEM(chain_pem);

    const Certificate& last = chain.back();
    if (!last.IsSelfSigned()) {
        throw CryptoError("Certificate chain does not end in a self-signed root (last subject: " +
                          last.GetSubject() + ")");
    }

    return last.ToPEM();
}

std::vector<std::string> NormalizeCertificatesPEM(const std::string& pem) {
    std::vector<std::string> result;
    for (const auto& cert : Certificate::LoadChainFromPEM(pem)) {
        result.push_back(cert.ToPEM());
    }
    return result;
}

} // namespace crypto
} // namespace meshcert
