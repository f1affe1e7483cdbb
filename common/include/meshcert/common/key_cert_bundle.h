/**
 * @file key_cert_bundle.h
 * @brief Immutable identity bundle: key, leaf, chain and trust roots
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_KEY_CERT_BUNDLE_H
#define MESHCERT_KEY_CERT_BUNDLE_H

#include <cstdint>
#include <memory>
#include <string>

namespace meshcert {

/**
 * @brief Snapshot of one identity
 *
 * Holds the private key, the leaf certificate, the intermediates between the
 * leaf and the root, and the trust bundle (one or more roots). A bundle is
 * verified when it is constructed and never changes afterwards; rotation
 * replaces it with a new instance.
 *
 * Example:
 * @code
 * auto bundle = KeyCertBundle::Create(key_pem, cert_chain_pem, root_pem);
 * LOG(INFO) << "serial " << bundle->SerialNumber()
 *           << " expires " << bundle->NotAfter();
 * @endcode
 */
class KeyCertBundle {
public:
    /**
     * @brief Build and verify a bundle from a combined chain
     *
     * @param key_pem PEM private key
     * @param cert_chain_pem Leaf followed by zero or more intermediates
     * @param root_pem Trust roots (may be empty)
     * @return Verified bundle
     * @throws CertError KeyMismatch if the key does not belong to the leaf
     * @throws CertError ChainInvalid if parsing or chain validation fails
     */
    static std::shared_ptr<const KeyCertBundle> Create(
        const std::string& key_pem,
        const std::string& cert_chain_pem,
        const std::string& root_pem
    );

    /**
     * @brief Read key, certificate chain and root files and build a bundle
     *
     * @param key_file PEM private key
     * @param cert_file Leaf followed by intermediates
     * @param ca_file Trust roots; an empty path means no root
     * @throws CertError IOError if a file cannot be read, otherwise as Create()
     */
    static std::shared_ptr<const KeyCertBundle> LoadFromFiles(
        const std::string& key_file,
        const std::string& cert_file,
        const std::string& ca_file
    );

    /**
     * @brief Check that a private key belongs to a certificate
     * @throws CertError KeyMismatch or ChainInvalid
     */
    static void VerifyKeyCertPair(const std::string& key_pem, const std::string& cert_pem);

    /**
     * @brief Derive a bundle with the same identity and a different trust bundle
     * @throws CertError ChainInvalid if the identity does not chain to new_root_pem
     */
    std::shared_ptr<const KeyCertBundle> WithRoot(const std::string& new_root_pem) const;

    /**
     * @brief Re-run the construction checks
     *
     * Key match first, then chain validation against RootPem() at the
     * current time when a root is present.
     *
     * @throws CertError KeyMismatch or ChainInvalid
     */
    void Verify() const;

    const std::string& CertPem() const { return cert_pem_; }
    const std::string& KeyPem() const { return key_pem_; }
    const std::string& ChainPem() const { return chain_pem_; }
    const std::string& RootPem() const { return root_pem_; }

    /**
     * @brief Leaf followed by the intermediates (what a TLS server presents)
     */
    std::string CertChainPem() const { return cert_pem_ + chain_pem_; }

    int64_t NotBefore() const { return not_before_; }
    int64_t NotAfter() const { return not_after_; }
    const std::string& SerialNumber() const { return serial_number_; }
    const std::string& Subject() const { return subject_; }

private:
    KeyCertBundle() = default;

    std::string cert_pem_;
    std::string key_pem_;
    std::string chain_pem_;
    std::string root_pem_;

    int64_t not_before_ = 0;
    int64_t not_after_ = 0;
    std::string serial_number_;
    std::string subject_;
};

using KeyCertBundlePtr = std::shared_ptr<const KeyCertBundle>;

} // namespace meshcert

#endif // MESHCERT_KEY_CERT_BUNDLE_H
