/**
 * @file csr_providers.cpp
 * @brief Providers that obtain certificates through a CSR API
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/ca/cert_provider.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <glog/logging.h>
#include <ctime>

namespace meshcert {
namespace ca {

namespace {

struct SignedIdentity {
    std::string key_pem;
    std::string cert_chain_pem;
};

SignedIdentity RequestCertificate(CsrApiClient& client, const std::vector<std::string>& names,
                                  std::chrono::seconds ttl, bool for_ca, CsrSigningOptions options) {
    SignedIdentity identity;
    std::string csr_pem;
    try {
        auto key = crypto::PrivateKey::Generate(crypto::KeyType::EcdsaP256);
        crypto::CertificateOptions csr_options;
        csr_options.dns_names = names;
        csr_options.is_ca = for_ca;
        csr_pem = crypto::CertificateRequest::Create(key, csr_options).ToPEM();
        identity.key_pem = key.ToPEM();
    } catch (const crypto::CryptoError& e) {
        throw CertError(ErrorKind::CertGenError, std::string("failed to build CSR: ") + e.what());
    }

    options.requested_lifetime = ttl;
    options.is_ca = for_ca;
    identity.cert_chain_pem = SignCsrWithApi(client, csr_pem, options);
    return identity;
}

} // anonymous namespace

// ============================================================================
// KubernetesCsrProvider
// ============================================================================

KubernetesCsrProvider::KubernetesCsrProvider(CsrApiClient& client, const MeshRootCatalog& roots,
                                             KubernetesCsrOptions options)
    : client_(client)
    , roots_(roots)
    , options_(std::move(options)) {}

std::string KubernetesCsrProvider::QualifiedSigner() const {
    if (options_.signer_name.empty()) {
        return DEFAULT_CSR_SIGNER;
    }
    if (options_.signer_domain.empty()) {
        return options_.signer_name;
    }
    return options_.signer_domain + "/" + options_.signer_name;
}

std::string KubernetesCsrProvider::ResolveRoot() const {
    if (!options_.signer_name.empty()) {
        return roots_.GetRootCertFromMeshConfig(QualifiedSigner());
    }
    if (!options_.ca_cert_file.empty()) {
        return ReadFile(options_.ca_cert_file);
    }
    throw CertError(ErrorKind::RootNotFound, "no signer and no CA certificate file configured");
}

KeyCertBundlePtr KubernetesCsrProvider::Issue(const std::vector<std::string>& names,
                                              std::chrono::seconds ttl,
                                              bool for_ca) {
    // Fail before creating a CSR object when the root cannot be found
    std::string root_pem = ResolveRoot();

    CsrSigningOptions signing;
    signing.signer_name = QualifiedSigner();
    signing.approve = options_.approve;
    signing.poll_interval = options_.poll_interval;
    signing.timeout = options_.timeout;

    LOG(INFO) << "Requesting certificate for " << names.size() << " names from signer "
              << signing.signer_name;
    auto identity = RequestCertificate(client_, names, ttl, for_ca, signing);

    return KeyCertBundle::Create(identity.key_pem, identity.cert_chain_pem, root_pem);
}

std::string KubernetesCsrProvider::GetRootCertPem() {
    try {
        return ResolveRoot();
    } catch (const CertError& e) {
        LOG(WARNING) << "Cannot resolve root for signer " << QualifiedSigner() << ": " << e.what();
        return std::string();
    }
}

// ============================================================================
// ExternalRaProvider
// ============================================================================

ExternalRaProvider::ExternalRaProvider(CsrApiClient& client, const MeshRootCatalog& roots,
                                       ExternalRaOptions options)
    : client_(client)
    , roots_(roots)
    , options_(std::move(options)) {}

std::string ExternalRaProvider::QualifiedSigner() const {
    if (options_.signer_name.empty()) {
        return DEFAULT_CSR_SIGNER;
    }
    return options_.signer_domain + "/" + options_.signer_name;
}

void ExternalRaProvider::PreSignCheck(const std::vector<std::string>& names,
                                      std::chrono::seconds ttl, bool for_ca) const {
    if (names.empty()) {
        throw CertError(ErrorKind::CertGenError, "no subject names requested");
    }
    if (options_.max_ttl.count() > 0 && ttl > options_.max_ttl) {
        throw CertError(ErrorKind::CertGenError,
                        "requested TTL " + std::to_string(ttl.count()) + "s exceeds the maximum of " +
                        std::to_string(options_.max_ttl.count()) + "s");
    }
    if (for_ca && !options_.allow_ca) {
        throw CertError(ErrorKind::CertGenError, "CA certificates are not issued through this RA");
    }
    if (options_.signer_domain.empty() && !options_.signer_name.empty()) {
        throw CertError(ErrorKind::CertGenError,
                        "signer domain is required for signer " + options_.signer_name);
    }
}

std::string ExternalRaProvider::ResolveRoot(const std::string& cert_chain_pem) const {
    std::string from_chain;
    try {
        from_chain = crypto::FindRootCertFromCertificateChain(cert_chain_pem);
    } catch (const crypto::CryptoError& e) {
        VLOG(1) << "No root in signed chain: " << e.what();
    }

    std::string from_mesh;
    try {
        from_mesh = roots_.GetRootCertFromMeshConfig(QualifiedSigner());
    } catch (const CertError& e) {
        VLOG(1) << "No mesh config root: " << e.what();
    }

    std::string chosen;
    const char* origin = nullptr;
    if (options_.root_preference == RootPreference::MeshConfig) {
        chosen = !from_mesh.empty() ? from_mesh : from_chain;
        origin = !from_mesh.empty() ? "mesh config" : "signed chain";
    } else {
        chosen = !from_chain.empty() ? from_chain : from_mesh;
        origin = !from_chain.empty() ? "signed chain" : "mesh config";
    }

    if (chosen.empty()) {
        throw CertError(ErrorKind::RootVerifyFailed,
                        "no root found in signed chain or mesh config for signer " + QualifiedSigner());
    }

    try {
        auto chain = crypto::Certificate::LoadChainFromPEM(cert_chain_pem);
        std::vector<crypto::Certificate> intermediates;
        for (size_t i = 1; i < chain.size(); i++) {
            intermediates.push_back(std::move(chain[i]));
        }
        auto roots = crypto::Certificate::LoadChainFromPEM(chosen);
        chain.front().VerifyChainWithIntermediates(intermediates, roots, static_cast<int64_t>(time(nullptr)));
    } catch (const crypto::CryptoError& e) {
        throw CertError(ErrorKind::RootVerifyFailed,
                        std::string("root cert from ") + origin + " does not verify the signed chain: " + e.what());
    }

    return chosen;
}

KeyCertBundlePtr ExternalRaProvider::Issue(const std::vector<std::string>& names,
                                           std::chrono::seconds ttl,
                                           bool for_ca) {
    PreSignCheck(names, ttl, for_ca);

    CsrSigningOptions signing;
    signing.signer_name = QualifiedSigner();
    signing.approve = options_.approve;
    signing.poll_interval = options_.poll_interval;
    signing.timeout = options_.timeout;

    auto identity = RequestCertificate(client_, names, ttl, for_ca, signing);

    std::string cert_chain = identity.cert_chain_pem;
    if (!options_.cert_chain_file.empty()) {
        cert_chain += ReadFile(options_.cert_chain_file);
    }

    std::string root_pem;
    if (!options_.ca_cert_file.empty()) {
        root_pem = ReadFile(options_.ca_cert_file);
    } else {
        root_pem = ResolveRoot(cert_chain);
    }

    auto bundle = KeyCertBundle::Create(identity.key_pem, cert_chain, root_pem);
    {
        std::lock_guard<std::mutex> lock(root_mutex_);
        last_root_ = root_pem;
    }
    return bundle;
}

std::string ExternalRaProvider::GetRootCertPem() {
    if (!options_.ca_cert_file.empty()) {
        try {
            return ReadFile(options_.ca_cert_file);
        } catch (const CertError& e) {
            LOG(WARNING) << "Cannot read RA root: " << e.what();
            return std::string();
        }
    }

    if (options_.root_preference == RootPreference::MeshConfig && !roots_.Empty()) {
        try {
            return roots_.GetRootCertFromMeshConfig(QualifiedSigner());
        } catch (const CertError& e) {
            VLOG(1) << "No mesh config root for " << QualifiedSigner() << ": " << e.what();
        }
    }

    std::lock_guard<std::mutex> lock(root_mutex_);
    return last_root_;
}

} // namespace ca
} // namespace meshcert
