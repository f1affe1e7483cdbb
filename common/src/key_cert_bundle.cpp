/**
 * @file key_cert_bundle.cpp
 * @brief Immutable identity bundle
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/key_cert_bundle.h"
#include "meshcert/common/crypto.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <ctime>
#include <vector>

namespace meshcert {

using crypto::Certificate;
using crypto::CryptoError;
using crypto::PrivateKey;

namespace {

void CheckKeyMatches(const Certificate& leaf, const PrivateKey& key) {
    if (!leaf.MatchesPrivateKey(key)) {
        throw CertError(ErrorKind::KeyMismatch,
                        "private key does not match certificate " + leaf.GetSubject());
    }
}

void CheckChain(const Certificate& leaf, const std::vector<Certificate>& intermediates,
                const std::string& root_pem) {
    std::vector<Certificate> roots;
    try {
        roots = Certificate::LoadChainFromPEM(root_pem);
        leaf.VerifyChainWithIntermediates(intermediates, roots, static_cast<int64_t>(time(nullptr)));
    } catch (const CryptoError& e) {
        throw CertError(ErrorKind::ChainInvalid, e.what());
    }
}

} // anonymous namespace

std::shared_ptr<const KeyCertBundle> KeyCertBundle::Create(
    const std::string& key_pem,
    const std::string& cert_chain_pem,
    const std::string& root_pem
) {
    std::vector<Certificate> certs;
    PrivateKey key;
    try {
        certs = Certificate::LoadChainFromPEM(cert_chain_pem);
        key = PrivateKey::LoadFromPEM(key_pem);
    } catch (const CryptoError& e) {
        throw CertError(ErrorKind::ChainInvalid, std::string("failed to parse bundle: ") + e.what());
    }

    const Certificate& leaf = certs.front();
    CheckKeyMatches(leaf, key);

    std::vector<Certificate> intermediates;
    for (size_t i = 1; i < certs.size(); i++) {
        intermediates.push_back(std::move(certs[i]));
    }

    if (!root_pem.empty()) {
        CheckChain(leaf, intermediates, root_pem);
    }

    std::shared_ptr<KeyCertBundle> bundle(new KeyCertBundle());
    bundle->key_pem_ = key_pem;
    bundle->cert_pem_ = leaf.ToPEM();
    bundle->chain_pem_ = Certificate::CreateChainPEM(intermediates);
    bundle->root_pem_ = root_pem;
    bundle->not_before_ = leaf.GetNotBefore();
    bundle->not_after_ = leaf.GetNotAfter();
    bundle->serial_number_ = leaf.GetSerialNumber();
    bundle->subject_ = leaf.GetSubject();
    return bundle;
}

std::shared_ptr<const KeyCertBundle> KeyCertBundle::LoadFromFiles(
    const std::string& key_file,
    const std::string& cert_file,
    const std::string& ca_file
) {
    std::string key_pem = ReadFile(key_file);
    std::string cert_pem = ReadFile(cert_file);
    std::string root_pem = ca_file.empty() ? std::string() : ReadFile(ca_file);

    return Create(key_pem, cert_pem, root_pem);
}

void KeyCertBundle::VerifyKeyCertPair(const std::string& key_pem, const std::string& cert_pem) {
    try {
        auto cert = Certificate::LoadFromPEM(cert_pem);
        auto key = PrivateKey::LoadFromPEM(key_pem);
        CheckKeyMatches(cert, key);
    } catch (const CryptoError& e) {
        throw CertError(ErrorKind::ChainInvalid, std::string("failed to parse key pair: ") + e.what());
    }
}

std::shared_ptr<const KeyCertBundle> KeyCertBundle::WithRoot(const std::string& new_root_pem) const {
    return Create(key_pem_, CertChainPem(), new_root_pem);
}

void KeyCertBundle::Verify() const {
    VerifyKeyCertPair(key_pem_, cert_pem_);

    if (root_pem_.empty()) {
        return;
    }

    try {
        auto leaf = Certificate::LoadFromPEM(cert_pem_);
        std::vector<Certificate> intermediates;
        if (!chain_pem_.empty()) {
            intermediates = Certificate::LoadChainFromPEM(chain_pem_);
        }
        CheckChain(leaf, intermediates, root_pem_);
    } catch (const CryptoError& e) {
        throw CertError(ErrorKind::ChainInvalid, e.what());
    }
}

} // namespace meshcert
