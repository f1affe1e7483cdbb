/**
 * @file ca_provider.cpp
 * @brief In-process signing CA loaded from a cert/key file pair
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/ca/ca_provider.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <glog/logging.h>
#include <ctime>

namespace meshcert {
namespace ca {

using crypto::CryptoError;

// ============================================================================
// CertificateAuthority
// ============================================================================

CertificateAuthority::CertificateAuthority(std::string raw_cert, std::string raw_key,
                                           std::string root_pem, std::chrono::seconds backdate)
    : raw_cert_(std::move(raw_cert))
    , raw_key_(std::move(raw_key))
    , root_pem_(std::move(root_pem))
    , backdate_(backdate)
{
    try {
        auto certs = crypto::Certificate::LoadChainFromPEM(raw_cert_);
        if (certs.size() != 1) {
            throw CertError(ErrorKind::CAInitFail,
                            "expected 1 CA certificate, found " + std::to_string(certs.size()));
        }
        certificate_ = std::move(certs.front());
        private_key_ = crypto::PrivateKey::LoadFromPEM(raw_key_);
    } catch (const CryptoError& e) {
        throw CertError(ErrorKind::CAInitFail, std::string("failed to parse CA: ") + e.what());
    }

    if (!certificate_.IsCA()) {
        throw CertError(ErrorKind::CAInitFail, "certificate is not a CA: " + certificate_.GetSubject());
    }
    if (!certificate_.MatchesPrivateKey(private_key_)) {
        throw CertError(ErrorKind::CAInitFail, "CA key does not match CA certificate");
    }
}

crypto::Certificate CertificateAuthority::Sign(const crypto::PublicKey& subject_pubkey,
                                               const std::vector<std::string>& names,
                                               std::chrono::seconds ttl,
                                               bool for_ca) const {
    const int64_t now = static_cast<int64_t>(time(nullptr));

    crypto::CertificateOptions options;
    options.dns_names = names;
    options.is_ca = for_ca;
    options.not_before = now - backdate_.count();
    options.not_after = now + ttl.count();

    return crypto::CreateCertificate(options, subject_pubkey, private_key_, &certificate_);
}

const std::string& CertificateAuthority::RootPem() const {
    return root_pem_.empty() ? raw_cert_ : root_pem_;
}

std::string CertificateAuthority::ChainPem() const {
    return root_pem_.empty() ? std::string() : certificate_.ToPEM();
}

// ============================================================================
// CaProvider
// ============================================================================

CaProvider::CaProvider(std::string cert_file, std::string key_file, std::string root_file,
                       std::chrono::seconds backdate)
    : cert_file_(std::move(cert_file))
    , key_file_(std::move(key_file))
    , root_file_(std::move(root_file))
    , backdate_(backdate)
{}

std::unique_ptr<CaProvider> CaProvider::ForSigner(const std::string& signer_root,
                                                  const std::string& signer_name) {
    const std::string dir = signer_root + "/" + signer_name + "/";
    return std::make_unique<CaProvider>(dir + "ca-cert.pem", dir + "ca-key.pem");
}

std::shared_ptr<const CertificateAuthority> CaProvider::Cached() const {
    std::lock_guard<std::mutex> lock(value_mutex_);
    return current_;
}

std::shared_ptr<const CertificateAuthority> CaProvider::Parse(const std::string& cert_pem,
                                                              const std::string& key_pem) const {
    std::string root_pem;
    if (!root_file_.empty()) {
        root_pem = ReadFile(root_file_);
    }
    return std::make_shared<const CertificateAuthority>(cert_pem, key_pem, root_pem, backdate_);
}

void CaProvider::Load() {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    std::shared_ptr<const CertificateAuthority> fresh;
    try {
        fresh = Parse(ReadFile(cert_file_), ReadFile(key_file_));
    } catch (const CertError& e) {
        throw CertError(ErrorKind::CAInitFail, "error loading CA from " + cert_file_ + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(value_mutex_);
    current_ = std::move(fresh);
    LOG(INFO) << "Loaded CA " << current_->CaCertificate().GetSubject() << " from " << cert_file_;
}

std::shared_ptr<const CertificateAuthority> CaProvider::CurrentCA() {
    std::string cert_pem;
    std::string key_pem;
    try {
        cert_pem = ReadFile(cert_file_);
        key_pem = ReadFile(key_file_);
    } catch (const CertError& e) {
        if (!Cached()) {
            throw CertError(ErrorKind::CAUnavailable, e.what());
        }
        throw CertError(ErrorKind::CAInitFail, std::string("error reading CA files: ") + e.what());
    }

    auto cached = Cached();
    if (cached && cached->RawCert() == cert_pem && cached->RawKey() == key_pem) {
        return cached;
    }

    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    // Another caller may have finished the reload while we waited
    cached = Cached();
    if (cached && cached->RawCert() == cert_pem && cached->RawKey() == key_pem) {
        return cached;
    }

    std::shared_ptr<const CertificateAuthority> fresh;
    try {
        fresh = Parse(cert_pem, key_pem);
    } catch (const CertError& e) {
        if (!cached) {
            throw CertError(ErrorKind::CAUnavailable, e.what());
        }
        LOG(WARNING) << "CA files at " << cert_file_ << " changed but failed to load: " << e.what();
        throw CertError(ErrorKind::CAInitFail, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(value_mutex_);
        current_ = fresh;
    }
    LOG(INFO) << "Reloaded CA " << fresh->CaCertificate().GetSubject() << " (serial "
              << fresh->CaCertificate().GetSerialNumber() << ")";
    return fresh;
}

bool CaProvider::IsLoaded() const {
    return Cached() != nullptr;
}

void GenerateSelfSignedCA(const std::string& cert_file, const std::string& key_file,
                          const std::string& org, std::chrono::seconds ttl) {
    auto key = crypto::PrivateKey::Generate(crypto::KeyType::EcdsaP256);
    auto pubkey = crypto::PublicKey::FromPrivateKey(key);
    auto cert = crypto::CreateCACertificate(key, pubkey, org, ttl);

    WriteFileAtomic(key_file, key.ToPEM(), 0600);
    WriteFileAtomic(cert_file, cert.ToPEM(), 0644);

    LOG(INFO) << "Generated self-signed CA " << cert.GetSubject() << " at " << cert_file;
}

} // namespace ca
} // namespace meshcert
