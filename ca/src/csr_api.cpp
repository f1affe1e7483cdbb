/**
 * @file csr_api.cpp
 * @brief CSR submission and the in-process CSR signer
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/ca/csr_api.h"
#include "meshcert/common/errors.h"
#include <glog/logging.h>
#include <thread>

namespace meshcert {
namespace ca {

const std::vector<std::string>& DefaultKeyUsages() {
    static const std::vector<std::string> usages = {
        "digital signature",
        "key encipherment",
        "server auth",
        "client auth",
    };
    return usages;
}

namespace {

void DeleteQuietly(CsrApiClient& client, const std::string& name) {
    try {
        client.Delete(name);
    } catch (const std::exception& e) {
        LOG(WARNING) << "Failed to delete CSR " << name << ": " << e.what();
    }
}

std::string WaitForCertificate(CsrApiClient& client, const std::string& name,
                               const CsrSigningOptions& options) {
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;

    while (true) {
        CsrStatus status = client.Get(name);
        if (status.denied) {
            throw CertError(ErrorKind::CertGenError, "CSR " + name + " was denied: " + status.reason);
        }
        if (status.failed) {
            throw CertError(ErrorKind::CertGenError, "CSR " + name + " failed: " + status.reason);
        }
        if (!status.certificate_pem.empty()) {
            return status.certificate_pem;
        }

        if (std::chrono::steady_clock::now() + options.poll_interval > deadline) {
            throw CertError(ErrorKind::CertGenError,
                            "timed out waiting for CSR " + name + " to be signed by " + options.signer_name);
        }
        std::this_thread::sleep_for(options.poll_interval);
    }
}

} // anonymous namespace

std::string SignCsrWithApi(CsrApiClient& client, const std::string& csr_pem,
                           const CsrSigningOptions& options) {
    CsrSpec spec;
    spec.request_pem = csr_pem;
    spec.signer_name = options.signer_name;
    spec.usages = options.usages;
    spec.expiration_seconds = options.requested_lifetime.count();
    spec.is_ca = options.is_ca;

    std::string name;
    try {
        name = client.Create(spec);
    } catch (const std::exception& e) {
        throw CertError(ErrorKind::CertGenError, std::string("failed to create CSR: ") + e.what());
    }
    VLOG(1) << "Created CSR " << name << " for signer " << options.signer_name;

    std::string cert_chain;
    try {
        if (options.approve) {
            client.Approve(name, "Automatically approved by meshcert");
        }
        cert_chain = WaitForCertificate(client, name, options);
    } catch (const CertError&) {
        DeleteQuietly(client, name);
        throw;
    } catch (const std::exception& e) {
        DeleteQuietly(client, name);
        throw CertError(ErrorKind::CertGenError, "CSR API error for " + name + ": " + e.what());
    }

    DeleteQuietly(client, name);
    return cert_chain;
}

// ============================================================================
// LocalCsrSigner
// ============================================================================

LocalCsrSigner::LocalCsrSigner(std::string signer_root)
    : signer_root_(std::move(signer_root)) {}

std::string LocalCsrSigner::Create(const CsrSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = "csr-" + std::to_string(next_id_++);
    requests_[name] = Entry{spec, CsrStatus{}};
    return name;
}

void LocalCsrSigner::Approve(const std::string& name, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(name);
    if (it == requests_.end()) {
        throw std::runtime_error("CSR not found: " + name);
    }

    Entry& entry = it->second;
    entry.status.approved = true;
    entry.status.reason = message;
    SignLocked(entry);
}

CsrStatus LocalCsrSigner::Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(name);
    if (it == requests_.end()) {
        throw std::runtime_error("CSR not found: " + name);
    }
    return it->second.status;
}

void LocalCsrSigner::Delete(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.erase(name);
}

size_t LocalCsrSigner::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

CaProvider& LocalCsrSigner::ProviderForLocked(const std::string& signer_name) {
    auto it = providers_.find(signer_name);
    if (it == providers_.end()) {
        it = providers_.emplace(signer_name, CaProvider::ForSigner(signer_root_, signer_name)).first;
    }
    return *it->second;
}

void LocalCsrSigner::SignLocked(Entry& entry) {
    try {
        auto request = crypto::CertificateRequest::LoadFromPEM(entry.spec.request_pem);
        auto ca = ProviderForLocked(entry.spec.signer_name).CurrentCA();

        std::chrono::seconds ttl(entry.spec.expiration_seconds);
        if (ttl.count() <= 0) {
            ttl = std::chrono::hours(24);
        }

        auto leaf = ca->Sign(request.GetPublicKey(), request.GetSubjectAltNames(), ttl,
                             entry.spec.is_ca || request.RequestsCA());
        entry.status.certificate_pem = leaf.ToPEM() + ca->RawCert();
        VLOG(1) << "Signed CSR for " << leaf.GetSubject() << " with signer " << entry.spec.signer_name;
    } catch (const std::exception& e) {
        LOG(WARNING) << "Local signer " << entry.spec.signer_name << " failed: " << e.what();
        entry.status.failed = true;
        entry.status.reason = e.what();
    }
}

} // namespace ca
} // namespace meshcert
