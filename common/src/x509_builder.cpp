/**
 * @file x509_builder.cpp
 * @brief X.509 v3 certificate issuance
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/crypto.h"
#include "openssl_wrappers.h"
#include "x509_utils.h"
#include <openssl/bn.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <ctime>

namespace meshcert {
namespace crypto {

using namespace internal;

namespace {

// Serial numbers are 128 random bits, positive
constexpr int SERIAL_NUMBER_BITS = 127;

void AddExtension(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
    X509_EXTENSION_ptr ext(X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str()));
    if (!ext) {
        throw CryptoError("Failed to create extension " + std::string(OBJ_nid2sn(nid)) + "=" + value +
                          ": " + LastOpenSSLError());
    }
    if (X509_add_ext(cert, ext.get(), -1) != 1) {
        throw CryptoError("Failed to add extension " + std::string(OBJ_nid2sn(nid)));
    }
}

void SetRandomSerial(X509* cert) {
    BIGNUM_ptr serial(BN_new());
    if (!serial || BN_rand(serial.get(), SERIAL_NUMBER_BITS, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1) {
        throw CryptoError("Failed to generate certificate serial number");
    }
    if (!BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert))) {
        throw CryptoError("Failed to set certificate serial number");
    }
}

} // anonymous namespace

Certificate CreateCertificate(
    const CertificateOptions& options,
    const PublicKey& subject_pubkey,
    const PrivateKey& signing_key,
    const Certificate* issuer_cert
) {
    if (options.not_after <= options.not_before) {
        throw CryptoError("Certificate validity period is empty");
    }
    if (!options.is_ca && options.dns_names.empty()) {
        throw CryptoError("Leaf certificates require at least one subject alternative name");
    }

    EVP_PKEY* pub_pkey = static_cast<EVP_PKEY*>(subject_pubkey.GetNativeHandle());
    EVP_PKEY* priv_pkey = static_cast<EVP_PKEY*>(signing_key.GetNativeHandle());
    if (!pub_pkey || !priv_pkey) {
        throw CryptoError("Missing subject or signing key");
    }

    X509_ptr cert(X509_new());
    if (!cert) {
        throw CryptoError("Failed to create X509 structure");
    }

    // X509 v3
    X509_set_version(cert.get(), 2);
    SetRandomSerial(cert.get());

    if (!ASN1_TIME_set(X509_getm_notBefore(cert.get()), static_cast<time_t>(options.not_before)) ||
        !ASN1_TIME_set(X509_getm_notAfter(cert.get()), static_cast<time_t>(options.not_after))) {
        throw CryptoError("Failed to set certificate validity period");
    }

    auto subject = BuildSubjectName(options);
    X509_set_subject_name(cert.get(), subject.get());

    X509* issuer_x509 = nullptr;
    if (issuer_cert != nullptr) {
        issuer_x509 = static_cast<X509*>(issuer_cert->GetNativeHandle());
        X509_set_issuer_name(cert.get(), X509_get_subject_name(issuer_x509));
    } else {
        X509_set_issuer_name(cert.get(), subject.get());
    }

    if (X509_set_pubkey(cert.get(), pub_pkey) != 1) {
        throw CryptoError("Failed to set certificate public key");
    }

    // Self-signed certificates are their own issuer for key identifier lookups
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer_x509 ? issuer_x509 : cert.get(), cert.get(), nullptr, nullptr, 0);

    if (options.is_ca) {
        AddExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:TRUE");
        AddExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature,keyCertSign,cRLSign");
    } else {
        AddExtension(cert.get(), &ctx, NID_basic_constraints, "critical,CA:FALSE");
        AddExtension(cert.get(), &ctx, NID_key_usage, "critical,digitalSignature,keyEncipherment");
        AddExtension(cert.get(), &ctx, NID_ext_key_usage, "serverAuth,clientAuth");
    }

    AddExtension(cert.get(), &ctx, NID_subject_key_identifier, "hash");
    if (issuer_x509 != nullptr) {
        AddExtension(cert.get(), &ctx, NID_authority_key_identifier, "keyid:always");
    }

    if (!options.dns_names.empty()) {
        // Critical when the subject is empty (RFC 5280 4.2.1.6)
        const bool empty_subject = X509_NAME_entry_count(subject.get()) == 0;
        AddExtension(cert.get(), &ctx, NID_subject_alt_name,
                     (empty_subject ? "critical," : "") + SubjectAltNameValue(options.dns_names));
    }

    if (X509_sign(cert.get(), priv_pkey, SigningDigestFor(priv_pkey)) <= 0) {
        throw CryptoError("Failed to sign certificate: " + LastOpenSSLError());
    }

    // Round-trip through DER so the returned object carries the cached encoding
    unsigned char* der = nullptr;
    int len = i2d_X509(cert.get(), &der);
    if (len < 0) {
        throw CryptoError("Failed to encode certificate");
    }
    std::vector<uint8_t> der_vec(der, der + len);
    OPENSSL_free(der);

    return Certificate::LoadFromDER(der_vec);
}

Certificate CreateCACertificate(
    const PrivateKey& signing_key,
    const PublicKey& subject_pubkey,
    const std::string& org,
    std::chrono::seconds ttl,
    const Certificate* issuer_cert
) {
    const int64_t now = static_cast<int64_t>(time(nullptr));

    CertificateOptions options;
    options.common_name = org;
    options.org = org;
    options.is_ca = true;
    options.not_before = now;
    options.not_after = now + ttl.count();

    return CreateCertificate(options, subject_pubkey, signing_key, issuer_cert);
}

} // namespace crypto
} // namespace meshcert
