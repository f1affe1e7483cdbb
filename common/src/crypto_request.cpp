/**
 * @file crypto_request.cpp
 * @brief PKCS#10 certificate signing request wrapper
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/crypto.h"
#include "openssl_wrappers.h"
#include "x509_utils.h"
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace meshcert {
namespace crypto {

using namespace internal;

class CertificateRequest::Impl {
public:
    X509_REQ_ptr req;
};

CertificateRequest::CertificateRequest() : impl_(std::make_unique<Impl>()) {}

CertificateRequest::~CertificateRequest() = default;

CertificateRequest::CertificateRequest(CertificateRequest&&) noexcept = default;
CertificateRequest& CertificateRequest::operator=(CertificateRequest&&) noexcept = default;

namespace {
    X509_REQ* CheckedHandle(const CertificateRequest& req) {
        X509_REQ* x509_req = static_cast<X509_REQ*>(req.GetNativeHandle());
        if (!x509_req) {
            throw CryptoError("Certificate request is empty");
        }
        return x509_req;
    }

    void PushExtension(STACK_OF(X509_EXTENSION)* exts, int nid, const std::string& value) {
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, nullptr, nid, value.c_str());
        if (!ext) {
            throw CryptoError("Failed to create request extension " + std::string(OBJ_nid2sn(nid)) +
                              ": " + LastOpenSSLError());
        }
        sk_X509_EXTENSION_push(exts, ext);
    }
}

CertificateRequest CertificateRequest::Create(const PrivateKey& key, const CertificateOptions& options) {
    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(key.GetNativeHandle());
    if (!pkey) {
        throw CryptoError("Cannot create request with empty private key");
    }

    CertificateRequest request;
    request.impl_->req.reset(X509_REQ_new());
    X509_REQ* req = request.impl_->req.get();
    if (!req) {
        throw CryptoError("Failed to create X509_REQ structure");
    }

    // PKCS#10 version 1 is encoded as 0
    X509_REQ_set_version(req, 0);

    auto subject = BuildSubjectName(options);
    if (X509_REQ_set_subject_name(req, subject.get()) != 1) {
        throw CryptoError("Failed to set request subject");
    }
    if (X509_REQ_set_pubkey(req, pkey) != 1) {
        throw CryptoError("Failed to set request public key");
    }

    X509_EXTENSION_STACK_ptr exts(sk_X509_EXTENSION_new_null());
    if (!exts) {
        throw CryptoError("Failed to allocate extension stack");
    }
    if (!options.dns_names.empty()) {
        PushExtension(exts.get(), NID_subject_alt_name, SubjectAltNameValue(options.dns_names));
    }
    if (options.is_ca) {
        PushExtension(exts.get(), NID_basic_constraints, "critical,CA:TRUE");
    }
    if (sk_X509_EXTENSION_num(exts.get()) > 0 && X509_REQ_add_extensions(req, exts.get()) != 1) {
        throw CryptoError("Failed to add request extensions");
    }

    if (X509_REQ_sign(req, pkey, SigningDigestFor(pkey)) <= 0) {
        throw CryptoError("Failed to sign certificate request: " + LastOpenSSLError());
    }

    return request;
}

CertificateRequest CertificateRequest::LoadFromPEM(const std::string& pem) {
    BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoError("Failed to create BIO from PEM");
    }

    CertificateRequest request;
    request.impl_->req.reset(PEM_read_bio_X509_REQ(bio.get(), nullptr, nullptr, nullptr));
    if (!request.impl_->req) {
        ERR_clear_error();
        throw CryptoError("Failed to parse certificate request from PEM");
    }

    // Proof of possession
    EVP_PKEY* pkey = X509_REQ_get0_pubkey(request.impl_->req.get());
    if (!pkey || X509_REQ_verify(request.impl_->req.get(), pkey) != 1) {
        ERR_clear_error();
        throw CryptoError("Certificate request signature is invalid");
    }

    return request;
}

std::string CertificateRequest::ToPEM() const {
    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw CryptoError("Failed to create BIO");
    }

    if (!PEM_write_bio_X509_REQ(bio.get(), CheckedHandle(*this))) {
        throw CryptoError("Failed to write certificate request to PEM");
    }

    return BioToString(bio.get());
}

PublicKey CertificateRequest::GetPublicKey() const {
    EVP_PKEY* pkey = X509_REQ_get0_pubkey(CheckedHandle(*this));
    if (!pkey) {
        throw CryptoError("Certificate request has no public key");
    }

    BIO_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || !PEM_write_bio_PUBKEY(bio.get(), pkey)) {
        throw CryptoError("Failed to write public key to PEM");
    }

    return PublicKey::LoadFromPEM(BioToString(bio.get()));
}

std::string CertificateRequest::GetSubject() const {
    return NameToString(X509_REQ_get_subject_name(CheckedHandle(*this)));
}

std::vector<std::string> CertificateRequest::GetSubjectAltNames() const {
    X509_EXTENSION_STACK_ptr exts(X509_REQ_get_extensions(CheckedHandle(*this)));
    if (!exts) {
        return {};
    }

    GENERAL_NAMES_ptr names(static_cast<GENERAL_NAMES*>(
        X509V3_get_d2i(exts.get(), NID_subject_alt_name, nullptr, nullptr)));
    return GeneralNamesToStrings(names.get());
}

bool CertificateRequest::RequestsCA() const {
    X509_EXTENSION_STACK_ptr exts(X509_REQ_get_extensions(CheckedHandle(*this)));
    if (!exts) {
        return false;
    }

    BASIC_CONSTRAINTS* bc = static_cast<BASIC_CONSTRAINTS*>(
        X509V3_get_d2i(exts.get(), NID_basic_constraints, nullptr, nullptr));
    if (!bc) {
        return false;
    }
    const bool is_ca = bc->ca != 0;
    BASIC_CONSTRAINTS_free(bc);
    return is_ca;
}

void* CertificateRequest::GetNativeHandle() const {
    return impl_->req.get();
}

} // namespace crypto
} // namespace meshcert
