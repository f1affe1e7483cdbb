/**
 * @file cert_provider.h
 * @brief Identity issuers: self-signed CA, Kubernetes CSR, external RA, mounted files
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CERT_PROVIDER_H
#define MESHCERT_CERT_PROVIDER_H

#include "meshcert/ca/ca_provider.h"
#include "meshcert/ca/csr_api.h"
#include "meshcert/common/config.h"
#include "meshcert/common/key_cert_bundle.h"
#include "meshcert/common/mesh_config.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace meshcert {
namespace ca {

/**
 * @brief Source of fresh identity bundles
 *
 * Issue() is called from the rotation loops and must be thread-safe.
 */
class CertProvider {
public:
    virtual ~CertProvider() = default;

    /**
     * @brief Produce a new verified bundle
     *
     * @param names DNS names (and spiffe:// URIs) to certify
     * @param ttl Requested validity
     * @param for_ca Request a CA certificate
     * @return New bundle, never null
     * @throws CertError on failure; nothing is published by the caller then
     */
    virtual KeyCertBundlePtr Issue(const std::vector<std::string>& names,
                                   std::chrono::seconds ttl,
                                   bool for_ca) = 0;

    /**
     * @brief Current root of trust of the backend
     *
     * Polled to detect root rotation. Returns an empty string when the root
     * cannot be determined right now.
     */
    virtual std::string GetRootCertPem() = 0;

    virtual const char* Name() const = 0;
};

/**
 * @brief Signs locally with the process's own CA
 */
class SelfSignedProvider : public CertProvider {
public:
    explicit SelfSignedProvider(std::shared_ptr<CaProvider> ca_provider);

    /// @throws CertError CAUnavailable if the CA has never been loaded
    KeyCertBundlePtr Issue(const std::vector<std::string>& names,
                           std::chrono::seconds ttl,
                           bool for_ca) override;
    std::string GetRootCertPem() override;
    const char* Name() const override { return "SelfSigned"; }

private:
    std::shared_ptr<CaProvider> ca_provider_;
};

struct KubernetesCsrOptions {
    std::string signer_name;                 ///< Empty selects DEFAULT_CSR_SIGNER
    std::string signer_domain;
    std::string ca_cert_file;                ///< Root when no signer is configured
    bool approve = true;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief Issues through a cluster CSR API with a named signer
 *
 * The root comes from the mesh config entry of the signer, or from the
 * configured CA file when no signer is set.
 */
class KubernetesCsrProvider : public CertProvider {
public:
    KubernetesCsrProvider(CsrApiClient& client, const MeshRootCatalog& roots,
                          KubernetesCsrOptions options);

    /// @throws CertError CertGenError, RootNotFound or IOError
    KeyCertBundlePtr Issue(const std::vector<std::string>& names,
                           std::chrono::seconds ttl,
                           bool for_ca) override;
    std::string GetRootCertPem() override;
    const char* Name() const override { return "KubernetesCSR"; }

    /**
     * @brief Signer name sent with requests ("domain/signer" when a domain is set)
     */
    std::string QualifiedSigner() const;

private:
    std::string ResolveRoot() const;

    CsrApiClient& client_;
    const MeshRootCatalog& roots_;
    KubernetesCsrOptions options_;
};

struct ExternalRaOptions {
    std::string signer_name;
    std::string signer_domain;
    std::string ca_cert_file;                ///< RA root; skips root resolution when set
    std::string cert_chain_file;             ///< RA intermediates appended to issued chains
    bool approve = true;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds timeout{30000};
    std::chrono::seconds max_ttl{0};         ///< 0 disables the check
    bool allow_ca = false;
    RootPreference root_preference = RootPreference::MeshConfig;
};

/**
 * @brief Forwards CSRs to an external registration authority
 *
 * Without a configured RA root, the root is resolved from the signed chain
 * (its self-signed tail) and from the mesh config entry of the signer, in
 * the configured order of preference. The chosen root must verify the
 * returned chain.
 */
class ExternalRaProvider : public CertProvider {
public:
    ExternalRaProvider(CsrApiClient& client, const MeshRootCatalog& roots,
                       ExternalRaOptions options);

    /// @throws CertError CertGenError, RootVerifyFailed or IOError
    KeyCertBundlePtr Issue(const std::vector<std::string>& names,
                           std::chrono::seconds ttl,
                           bool for_ca) override;
    std::string GetRootCertPem() override;
    const char* Name() const override { return "ExternalRA"; }

    std::string QualifiedSigner() const;

    /**
     * @brief Pick the root terminating a signed chain
     *
     * @param cert_chain_pem Leaf followed by the RA chain
     * @return Root PEM that verifies the chain
     * @throws CertError RootVerifyFailed if no candidate verifies the chain
     */
    std::string ResolveRoot(const std::string& cert_chain_pem) const;

private:
    void PreSignCheck(const std::vector<std::string>& names, std::chrono::seconds ttl, bool for_ca) const;

    CsrApiClient& client_;
    const MeshRootCatalog& roots_;
    ExternalRaOptions options_;

    mutable std::mutex root_mutex_;
    std::string last_root_;
};

/**
 * @brief Reads an identity provisioned by someone else from disk
 *
 * Names, TTL and the CA flag are ignored.
 */
class FileMountedProvider : public CertProvider {
public:
    FileMountedProvider(std::string key_file, std::string cert_file, std::string root_file);

    /// @throws CertError IOError, KeyMismatch or ChainInvalid
    KeyCertBundlePtr Issue(const std::vector<std::string>& names,
                           std::chrono::seconds ttl,
                           bool for_ca) override;
    std::string GetRootCertPem() override;
    const char* Name() const override { return "FileMounted"; }

    const std::string& KeyFile() const { return key_file_; }
    const std::string& CertFile() const { return cert_file_; }
    const std::string& RootFile() const { return root_file_; }

private:
    std::string key_file_;
    std::string cert_file_;
    std::string root_file_;
};

/**
 * @brief Collaborators a provider may need
 *
 * The CSR-based providers need a CSR client; when csr_client is null and a
 * local signer root is configured, the factory creates a LocalCsrSigner.
 * A null root_catalog is replaced by an empty catalog. Created objects are
 * owned by the returned handle.
 */
struct ProviderDependencies {
    CsrApiClient* csr_client = nullptr;
    const MeshRootCatalog* root_catalog = nullptr;
};

/**
 * @brief A provider together with anything created for it
 */
struct ProviderHandle {
    std::shared_ptr<CaProvider> ca_provider;           ///< SelfSigned only
    std::unique_ptr<CsrApiClient> owned_csr_client;    ///< LocalCsrSigner created by the factory
    std::unique_ptr<MeshRootCatalog> owned_catalog;
    std::unique_ptr<CertProvider> provider;
};

/**
 * @brief Build the provider selected by the configuration
 *
 * For SelfSigned the CA is loaded eagerly (generated first when
 * generate_if_missing is set and the files are absent).
 *
 * @throws CertError CAInitFail if the self-signed CA cannot be loaded
 * @throws ConfigError if a required collaborator is missing
 */
ProviderHandle CreateCertProvider(const AgentConfig& config, const ProviderDependencies& deps);

} // namespace ca
} // namespace meshcert

#endif // MESHCERT_CERT_PROVIDER_H
