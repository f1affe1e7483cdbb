/**
 * @file cert_provider.cpp
 * @brief Self-signed and file-mounted providers, provider factory
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/ca/cert_provider.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <glog/logging.h>

namespace meshcert {
namespace ca {

// ============================================================================
// SelfSignedProvider
// ============================================================================

SelfSignedProvider::SelfSignedProvider(std::shared_ptr<CaProvider> ca_provider)
    : ca_provider_(std::move(ca_provider)) {}

KeyCertBundlePtr SelfSignedProvider::Issue(const std::vector<std::string>& names,
                                           std::chrono::seconds ttl,
                                           bool for_ca) {
    auto ca = ca_provider_->CurrentCA();

    std::string cert_chain;
    std::string key_pem;
    try {
        auto key = crypto::PrivateKey::Generate(crypto::KeyType::EcdsaP256);
        auto cert = ca->Sign(crypto::PublicKey::FromPrivateKey(key), names, ttl, for_ca);
        cert_chain = cert.ToPEM() + ca->ChainPem();
        key_pem = key.ToPEM();
    } catch (const crypto::CryptoError& e) {
        throw CertError(ErrorKind::CertGenError, std::string("failed to sign certificate: ") + e.what());
    }

    return KeyCertBundle::Create(key_pem, cert_chain, ca->RootPem());
}

std::string SelfSignedProvider::GetRootCertPem() {
    try {
        return ca_provider_->CurrentCA()->RootPem();
    } catch (const CertError& e) {
        LOG(WARNING) << "Cannot read self-signed CA root: " << e.what();
        return std::string();
    }
}

// ============================================================================
// FileMountedProvider
// ============================================================================

FileMountedProvider::FileMountedProvider(std::string key_file, std::string cert_file,
                                         std::string root_file)
    : key_file_(std::move(key_file))
    , cert_file_(std::move(cert_file))
    , root_file_(std::move(root_file)) {}

KeyCertBundlePtr FileMountedProvider::Issue(const std::vector<std::string>& /*names*/,
                                            std::chrono::seconds /*ttl*/,
                                            bool /*for_ca*/) {
    return KeyCertBundle::LoadFromFiles(key_file_, cert_file_, root_file_);
}

std::string FileMountedProvider::GetRootCertPem() {
    if (root_file_.empty()) {
        return std::string();
    }
    try {
        return ReadFile(root_file_);
    } catch (const CertError& e) {
        LOG(WARNING) << "Cannot read mounted root: " << e.what();
        return std::string();
    }
}

// ============================================================================
// Factory
// ============================================================================

namespace {

std::shared_ptr<CaProvider> LoadSelfSignedCA(const SelfSignedConfig& config) {
    if (config.generate_if_missing && !FileExists(config.ca_cert_file) && !FileExists(config.ca_key_file)) {
        LOG(INFO) << "No CA at " << config.ca_cert_file << ", generating a self-signed root";
        try {
            GenerateSelfSignedCA(config.ca_cert_file, config.ca_key_file, config.org,
                                 std::chrono::hours(24 * 365 * 10));
        } catch (const std::exception& e) {
            throw CertError(ErrorKind::CAInitFail, std::string("failed to generate CA: ") + e.what());
        }
    }

    auto ca_provider = std::make_shared<CaProvider>(config.ca_cert_file, config.ca_key_file,
                                                    config.root_cert_file,
                                                    std::chrono::seconds(config.backdate_seconds));
    ca_provider->Load();
    return ca_provider;
}

CsrApiClient& CsrClientFor(ProviderHandle& handle, const ProviderDependencies& deps,
                           const std::string& local_signer_root) {
    if (deps.csr_client != nullptr) {
        return *deps.csr_client;
    }
    if (local_signer_root.empty()) {
        throw ConfigError("CSR provider needs a CSR API client or local_signer_root");
    }
    LOG(INFO) << "Using in-process CSR signer rooted at " << local_signer_root;
    handle.owned_csr_client = std::make_unique<LocalCsrSigner>(local_signer_root);
    return *handle.owned_csr_client;
}

const MeshRootCatalog& CatalogFor(ProviderHandle& handle, const ProviderDependencies& deps) {
    if (deps.root_catalog != nullptr) {
        return *deps.root_catalog;
    }
    handle.owned_catalog = std::make_unique<MeshRootCatalog>();
    return *handle.owned_catalog;
}

} // anonymous namespace

ProviderHandle CreateCertProvider(const AgentConfig& config, const ProviderDependencies& deps) {
    ProviderHandle handle;

    switch (config.provider) {
        case ProviderType::SelfSigned: {
            handle.ca_provider = LoadSelfSignedCA(config.self_signed);
            handle.provider = std::make_unique<SelfSignedProvider>(handle.ca_provider);
            break;
        }
        case ProviderType::KubernetesCSR: {
            const auto& k8s = config.kubernetes_csr;
            KubernetesCsrOptions options;
            options.signer_name = k8s.signer_name;
            options.signer_domain = k8s.signer_domain;
            options.ca_cert_file = k8s.ca_cert_file;
            options.approve = k8s.approve;
            options.poll_interval = std::chrono::milliseconds(k8s.poll_interval_ms);
            options.timeout = std::chrono::seconds(k8s.timeout_seconds);

            CsrApiClient& client = CsrClientFor(handle, deps, k8s.local_signer_root);
            const MeshRootCatalog& catalog = CatalogFor(handle, deps);
            handle.provider = std::make_unique<KubernetesCsrProvider>(client, catalog, std::move(options));
            break;
        }
        case ProviderType::ExternalRA: {
            const auto& ra = config.external_ra;
            ExternalRaOptions options;
            options.signer_name = ra.signer_name;
            options.signer_domain = ra.signer_domain;
            options.ca_cert_file = ra.ca_cert_file;
            options.cert_chain_file = ra.cert_chain_file;
            options.approve = ra.approve;
            options.poll_interval = std::chrono::milliseconds(ra.poll_interval_ms);
            options.timeout = std::chrono::seconds(ra.timeout_seconds);
            options.max_ttl = std::chrono::seconds(ra.max_ttl_seconds);
            options.allow_ca = ra.allow_ca;
            options.root_preference = ra.root_preference;

            CsrApiClient& client = CsrClientFor(handle, deps, ra.local_signer_root);
            const MeshRootCatalog& catalog = CatalogFor(handle, deps);
            handle.provider = std::make_unique<ExternalRaProvider>(client, catalog, std::move(options));
            break;
        }
        case ProviderType::FileMounted: {
            const auto& files = config.file_mounted;
            handle.provider = std::make_unique<FileMountedProvider>(files.key_file, files.cert_file,
                                                                    files.root_file);
            break;
        }
    }

    LOG(INFO) << "Certificate provider: " << handle.provider->Name();
    return handle;
}

} // namespace ca
} // namespace meshcert
