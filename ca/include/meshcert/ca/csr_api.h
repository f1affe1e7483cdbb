/**
 * @file csr_api.h
 * @brief Certificate signing request API (Kubernetes CSR object semantics)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CSR_API_H
#define MESHCERT_CSR_API_H

#include "meshcert/ca/ca_provider.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace meshcert {
namespace ca {

/// Signer used when a request names none
constexpr const char* DEFAULT_CSR_SIGNER = "kubernetes.io/legacy-unknown";

/// Key usages requested for workload and control plane certificates
const std::vector<std::string>& DefaultKeyUsages();

/**
 * @brief A CSR object to create
 */
struct CsrSpec {
    std::string request_pem;
    std::string signer_name;
    std::vector<std::string> usages;
    int64_t expiration_seconds = 0;      ///< Requested lifetime, 0 lets the signer decide
    bool is_ca = false;
};

/**
 * @brief Observed state of a CSR object
 */
struct CsrStatus {
    bool approved = false;
    bool denied = false;
    bool failed = false;
    std::string reason;
    std::string certificate_pem;         ///< Leaf followed by the signer's chain, once issued
};

/**
 * @brief Client of a CSR API (a Kubernetes cluster or an in-process signer)
 *
 * Implementations throw on transport or API failure.
 */
class CsrApiClient {
public:
    virtual ~CsrApiClient() = default;

    /**
     * @brief Create a CSR object
     * @return Name of the created object
     */
    virtual std::string Create(const CsrSpec& spec) = 0;

    virtual void Approve(const std::string& name, const std::string& message) = 0;

    virtual CsrStatus Get(const std::string& name) = 0;

    virtual void Delete(const std::string& name) = 0;
};

struct CsrSigningOptions {
    std::string signer_name = DEFAULT_CSR_SIGNER;
    std::vector<std::string> usages = DefaultKeyUsages();
    std::chrono::seconds requested_lifetime{0};
    bool is_ca = false;
    bool approve = true;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Submit a CSR and wait for the signed certificate
 *
 * Creates the object, approves it when asked to, polls until a certificate
 * is issued, then deletes the object. The object is deleted on failure too.
 *
 * @param client CSR API
 * @param csr_pem PEM-encoded request
 * @param options Signer, usages, approval and polling settings
 * @return Signed certificate chain PEM (leaf first)
 * @throws CertError CertGenError on timeout, denial, failure or API error
 */
std::string SignCsrWithApi(CsrApiClient& client, const std::string& csr_pem,
                           const CsrSigningOptions& options);

/**
 * @brief In-process CSR API backed by per-signer CA directories
 *
 * A request for signer S is signed by the CA in "<signer_root>/S/" once it
 * is approved. The issued certificate is followed by the CA certificate.
 * Unknown signers and unparsable requests mark the object failed.
 */
class LocalCsrSigner : public CsrApiClient {
public:
    explicit LocalCsrSigner(std::string signer_root);

    std::string Create(const CsrSpec& spec) override;
    void Approve(const std::string& name, const std::string& message) override;
    CsrStatus Get(const std::string& name) override;
    void Delete(const std::string& name) override;

    size_t PendingCount() const;

private:
    struct Entry {
        CsrSpec spec;
        CsrStatus status;
    };

    void SignLocked(Entry& entry);
    CaProvider& ProviderForLocked(const std::string& signer_name);

    std::string signer_root_;

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::map<std::string, Entry> requests_;
    std::map<std::string, std::unique_ptr<CaProvider>> providers_;
};

} // namespace ca
} // namespace meshcert

#endif // MESHCERT_CSR_API_H
