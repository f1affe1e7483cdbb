/**
 * @file crypto.h
 * @brief Key, certificate and certificate request wrappers (OpenSSL 3.x)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CRYPTO_H
#define MESHCERT_CRYPTO_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace meshcert {
namespace crypto {

/**
 * @brief Low-level cryptographic failure (parse, encode, sign)
 */
class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Key type for generation
 */
enum class KeyType {
    EcdsaP256,  // Default for workload and control plane identities
    Rsa2048,    // For peers that cannot negotiate ECDSA
    Ed25519
};

class PublicKey;

/**
 * @brief Private key wrapper
 */
class PrivateKey {
public:
    PrivateKey();
    ~PrivateKey();

    PrivateKey(PrivateKey&&) noexcept;
    PrivateKey& operator=(PrivateKey&&) noexcept;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /**
     * @brief Load private key from PEM file
     * @param path Path to PEM-encoded private key
     * @return Loaded private key
     * @throws CryptoError on read or parse error
     */
    static PrivateKey LoadFromFile(const std::string& path);

    /**
     * @brief Load private key from PEM buffer
     * @param pem PEM-encoded private key (PKCS#8, SEC1 or PKCS#1)
     * @return Loaded private key
     * @throws CryptoError on parse error
     */
    static PrivateKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Generate new key pair
     * @param type Key algorithm
     * @return Generated private key
     * @throws CryptoError on generation error
     */
    static PrivateKey Generate(KeyType type = KeyType::EcdsaP256);

    /**
     * @brief Export to PEM format (PKCS#8)
     * @return PEM-encoded private key
     */
    std::string ToPEM() const;

    bool IsEmpty() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Public key wrapper
 */
class PublicKey {
public:
    PublicKey();
    ~PublicKey();

    PublicKey(PublicKey&&) noexcept;
    PublicKey& operator=(PublicKey&&) noexcept;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    /**
     * @brief Load public key from PEM buffer
     * @param pem PEM-encoded SubjectPublicKeyInfo
     * @return Loaded public key
     * @throws CryptoError on parse error
     */
    static PublicKey LoadFromPEM(const std::string& pem);

    /**
     * @brief Derive public key from private key
     * @param privkey Private key
     * @return Corresponding public key
     */
    static PublicKey FromPrivateKey(const PrivateKey& privkey);

    std::string ToPEM() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief X.509 certificate wrapper
 */
class Certificate {
public:
    Certificate();
    ~Certificate();

    Certificate(Certificate&&) noexcept;
    Certificate& operator=(Certificate&&) noexcept;
    Certificate(const Certificate&) = delete;
    Certificate& operator=(const Certificate&) = delete;

    /**
     * @brief Load the first certificate of a PEM file
     * @param path Path to PEM file
     * @return Loaded certificate
     * @throws CryptoError on read or parse error
     */
    static Certificate LoadFromFile(const std::string& path);

    /**
     * @brief Load the first certificate of a PEM buffer
     * @param pem PEM data
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromPEM(const std::string& pem);

    /**
     * @brief Load all certificates from a PEM buffer
     *
     * Certificates are returned in file order, which for chains is
     * [leaf, intermediate(s)..., root].
     *
     * @param pem PEM string containing one or more certificates
     * @return Certificates in order
     * @throws CryptoError if no certificate can be parsed
     */
    static std::vector<Certificate> LoadChainFromPEM(const std::string& pem);

    /**
     * @brief Load certificate from DER buffer
     * @param der DER-encoded certificate
     * @return Loaded certificate
     * @throws CryptoError on parse error
     */
    static Certificate LoadFromDER(const std::vector<uint8_t>& der);

    /**
     * @brief Create PEM bundle from certificates
     * @param chain Certificates to bundle, in order
     * @return Concatenated PEM
     */
    static std::string CreateChainPEM(const std::vector<Certificate>& chain);

    std::vector<uint8_t> ToDER() const;
    std::string ToPEM() const;

    Certificate Clone() const;

    PublicKey GetPublicKey() const;

    /**
     * @brief Check that a private key belongs to this certificate
     * @param key Candidate private key
     * @return true if the key's public component is the certificate's key
     */
    bool MatchesPrivateKey(const PrivateKey& key) const;

    /**
     * @brief Verify this certificate's signature with the issuer's key
     * @param issuer Issuer certificate
     * @return true if signature is valid
     */
    bool IsSignedBy(const Certificate& issuer) const;

    /**
     * @brief Verify certificate chain up to one of the trusted roots
     *
     * Uses the OpenSSL verifier. Roots are treated as trust anchors even if
     * they are not self-signed (partial chains are accepted), so a plugged-in
     * intermediate can serve as the trust bundle.
     *
     * @param intermediates Untrusted intermediate certificates
     * @param roots Trust anchors
     * @param trusted_time Unix epoch seconds used for validity checks
     * @throws CryptoError with the verifier's reason on failure
     */
    void VerifyChainWithIntermediates(
        const std::vector<Certificate>& intermediates,
        const std::vector<Certificate>& roots,
        int64_t trusted_time
    ) const;

    std::string GetSubject() const;
    std::string GetIssuer() const;

    /**
     * @brief Serial number as upper-case hex
     */
    std::string GetSerialNumber() const;

    /**
     * @brief Get certificate validity period
     * @return Pair of (notBefore, notAfter) in Unix epoch seconds
     */
    std::pair<int64_t, int64_t> GetValidityPeriod() const;

    int64_t GetNotBefore() const;
    int64_t GetNotAfter() const;

    /**
     * @brief DNS and URI entries of the SubjectAltName extension
     */
    std::vector<std::string> GetSubjectAltNames() const;

    /**
     * @brief Basic Constraints CA flag
     */
    bool IsCA() const;

    /**
     * @brief Subject equals issuer and the signature verifies with own key
     */
    bool IsSelfSigned() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Subject and extension settings for CSRs and issued certificates
 */
struct CertificateOptions {
    std::string common_name;               ///< Subject CN (defaults to first SAN)
    std::string org;                       ///< Subject O
    std::vector<std::string> dns_names;    ///< SANs; "spiffe://" entries become URIs
    bool is_ca = false;                    ///< Issue a CA certificate
    int64_t not_before = 0;                ///< Unix epoch seconds
    int64_t not_after = 0;                 ///< Unix epoch seconds
};

/**
 * @brief PKCS#10 certificate signing request
 */
class CertificateRequest {
public:
    CertificateRequest();
    ~CertificateRequest();

    CertificateRequest(CertificateRequest&&) noexcept;
    CertificateRequest& operator=(CertificateRequest&&) noexcept;
    CertificateRequest(const CertificateRequest&) = delete;
    CertificateRequest& operator=(const CertificateRequest&) = delete;

    /**
     * @brief Build and sign a CSR
     *
     * Validity fields of the options are ignored; the signer decides them.
     *
     * @param key Subject private key, signs the request
     * @param options Subject and SubjectAltName settings
     * @return Signed request
     * @throws CryptoError on failure
     */
    static CertificateRequest Create(const PrivateKey& key, const CertificateOptions& options);

    /**
     * @brief Parse a PEM CSR and check its self-signature
     * @throws CryptoError if parsing or signature verification fails
     */
    static CertificateRequest LoadFromPEM(const std::string& pem);

    std::string ToPEM() const;

    PublicKey GetPublicKey() const;
    std::string GetSubject() const;
    std::vector<std::string> GetSubjectAltNames() const;

    /**
     * @brief Whether the request asks for Basic Constraints CA:TRUE
     */
    bool RequestsCA() const;

    void* GetNativeHandle() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Issue an X.509 v3 certificate
 *
 * Leaf certificates get keyUsage digitalSignature+keyEncipherment,
 * extendedKeyUsage serverAuth+clientAuth and a critical SubjectAltName.
 * CA certificates get basicConstraints CA:TRUE and keyCertSign+cRLSign.
 * A random 128-bit serial is assigned.
 *
 * @param options Subject, SANs and validity
 * @param subject_pubkey Public key to certify
 * @param signing_key Issuer private key
 * @param issuer_cert Issuer certificate (nullptr for self-signed)
 * @return Signed certificate
 * @throws CryptoError on failure
 */
Certificate CreateCertificate(
    const CertificateOptions& options,
    const PublicKey& subject_pubkey,
    const PrivateKey& signing_key,
    const Certificate* issuer_cert = nullptr
);

/**
 * @brief Create a CA certificate (self-signed root or intermediate)
 * @param signing_key Issuer private key (subject's own key for a root)
 * @param subject_pubkey Public key of the new CA
 * @param org Organization, also used as CN
 * @param ttl Validity starting now
 * @param issuer_cert Parent CA (nullptr for a self-signed root)
 * @return CA certificate
 */
Certificate CreateCACertificate(
    const PrivateKey& signing_key,
    const PublicKey& subject_pubkey,
    const std::string& org,
    std::chrono::seconds ttl,
    const Certificate* issuer_cert = nullptr
);

/**
 * @brief Return the root certificate terminating a PEM chain
 *
 * The last certificate of the chain must be self-signed.
 *
 * @param chain_pem Chain in leaf-to-root order
 * @return PEM of the root certificate
 * @throws CryptoError if the chain is empty or does not end in a root
 */
std::string FindRootCertFromCertificateChain(const std::string& chain_pem);

/**
 * @brief Re-encode every certificate of a PEM buffer
 *
 * Strips comments, whitespace variations and non-certificate blocks so PEM
 * texts can be compared by content.
 */
std::vector<std::string> NormalizeCertificatesPEM(const std::string& pem);

} // namespace crypto
} // namespace meshcert

#endif // MESHCERT_CRYPTO_H
