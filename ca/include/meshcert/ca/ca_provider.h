/**
 * @file ca_provider.h
 * @brief In-process signing CA loaded from a cert/key file pair
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CA_PROVIDER_H
#define MESHCERT_CA_PROVIDER_H

#include "meshcert/common/crypto.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace meshcert {
namespace ca {

/// Clock skew tolerance subtracted from NotBefore of issued certificates
constexpr std::chrono::seconds DEFAULT_BACKDATE{300};

/**
 * @brief Signing CA descriptor
 *
 * Raw file bytes and the parsed certificate/key always describe the same
 * material. A descriptor is never modified; a reload creates a new one.
 */
class CertificateAuthority {
public:
    /**
     * @brief Parse a CA from PEM bytes
     *
     * @param raw_cert CA certificate PEM, exactly one certificate
     * @param raw_key CA private key PEM
     * @param root_pem Root of the CA when the CA is an intermediate, else empty
     * @param backdate Subtracted from NotBefore of issued certificates
     * @throws CertError CAInitFail on parse failure or key mismatch
     */
    CertificateAuthority(std::string raw_cert, std::string raw_key, std::string root_pem,
                         std::chrono::seconds backdate = DEFAULT_BACKDATE);

    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    /**
     * @brief Sign a certificate for a subject key
     *
     * Validity is [now - backdate, now + ttl].
     *
     * @param subject_pubkey Key to certify
     * @param names SubjectAltNames
     * @param ttl Requested lifetime
     * @param for_ca Issue a CA certificate
     * @throws CryptoError on signing failure
     */
    crypto::Certificate Sign(const crypto::PublicKey& subject_pubkey,
                             const std::vector<std::string>& names,
                             std::chrono::seconds ttl,
                             bool for_ca) const;

    /**
     * @brief Root of trust for certificates issued by this CA
     *
     * The configured root for an intermediate, the CA certificate itself otherwise.
     */
    const std::string& RootPem() const;

    /**
     * @brief Certificates between issued leaves and the root (empty for a root CA)
     */
    std::string ChainPem() const;

    const std::string& RawCert() const { return raw_cert_; }
    const std::string& RawKey() const { return raw_key_; }
    const crypto::Certificate& CaCertificate() const { return certificate_; }
    std::chrono::seconds Backdate() const { return backdate_; }

private:
    std::string raw_cert_;
    std::string raw_key_;
    std::string root_pem_;
    crypto::Certificate certificate_;
    crypto::PrivateKey private_key_;
    std::chrono::seconds backdate_;
};

/**
 * @brief Lazily reloading holder of the current CA
 *
 * CurrentCA() re-reads the cert and key files on every call and rebuilds
 * the descriptor only when their bytes differ from the cached ones. At most
 * one reload runs at a time; concurrent callers wait for it and then see
 * the fresh descriptor.
 */
class CaProvider {
public:
    CaProvider(std::string cert_file, std::string key_file, std::string root_file = "",
               std::chrono::seconds backdate = DEFAULT_BACKDATE);

    /**
     * @brief Provider for a per-signer CA directory
     *
     * Reads "<signer_root>/<signer_name>/ca-cert.pem" and "ca-key.pem".
     */
    static std::unique_ptr<CaProvider> ForSigner(const std::string& signer_root,
                                                 const std::string& signer_name);

    /**
     * @brief Load the CA unconditionally
     * @throws CertError CAInitFail if the files cannot be read or parsed
     */
    void Load();

    /**
     * @brief Current CA, reloaded when the files changed
     *
     * @throws CertError CAUnavailable if no CA could ever be loaded
     * @throws CertError CAInitFail if changed files cannot be loaded
     */
    std::shared_ptr<const CertificateAuthority> CurrentCA();

    bool IsLoaded() const;

    const std::string& CertFile() const { return cert_file_; }
    const std::string& KeyFile() const { return key_file_; }

private:
    std::shared_ptr<const CertificateAuthority> Cached() const;
    std::shared_ptr<const CertificateAuthority> Parse(const std::string& cert_pem,
                                                      const std::string& key_pem) const;

    std::string cert_file_;
    std::string key_file_;
    std::string root_file_;
    std::chrono::seconds backdate_;

    mutable std::mutex value_mutex_;
    std::shared_ptr<const CertificateAuthority> current_;

    // Serializes reloads
    std::mutex reload_mutex_;
};

/**
 * @brief Create a self-signed ECDSA P-256 root CA and write it to disk
 *
 * The key file is written with mode 0600.
 *
 * @throws CertError IOError on write failure
 */
void GenerateSelfSignedCA(const std::string& cert_file, const std::string& key_file,
                          const std::string& org, std::chrono::seconds ttl);

} // namespace ca
} // namespace meshcert

#endif // MESHCERT_CA_PROVIDER_H
