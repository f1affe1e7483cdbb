/**
 * @file tls_context_provider.cpp
 * @brief Server TLS context that follows the published identity
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/tls_context_provider.h"
#include "meshcert/common/crypto.h"
#include <glog/logging.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace meshcert {
namespace rotation {

namespace {

std::string LastOpenSSLError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

void Check(int ret, const char* what) {
    if (ret != 1) {
        throw crypto::CryptoError(std::string(what) + ": " + LastOpenSSLError());
    }
}

} // anonymous namespace

std::shared_ptr<SSL_CTX> TlsContextProvider::BuildContext(const KeyCertBundle& bundle,
                                                          bool require_client_cert) {
    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
    if (!ctx) {
        throw crypto::CryptoError("SSL_CTX_new failed: " + LastOpenSSLError());
    }
    Check(SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION), "SSL_CTX_set_min_proto_version");

    auto leaf = crypto::Certificate::LoadFromPEM(bundle.CertPem());
    Check(SSL_CTX_use_certificate(ctx.get(), static_cast<X509*>(leaf.GetNativeHandle())),
          "SSL_CTX_use_certificate");

    if (!bundle.ChainPem().empty()) {
        for (const auto& cert : crypto::Certificate::LoadChainFromPEM(bundle.ChainPem())) {
            Check(static_cast<int>(SSL_CTX_add1_chain_cert(ctx.get(), static_cast<X509*>(cert.GetNativeHandle()))),
                  "SSL_CTX_add1_chain_cert");
        }
    }

    auto key = crypto::PrivateKey::LoadFromPEM(bundle.KeyPem());
    Check(SSL_CTX_use_PrivateKey(ctx.get(), static_cast<EVP_PKEY*>(key.GetNativeHandle())),
          "SSL_CTX_use_PrivateKey");
    Check(SSL_CTX_check_private_key(ctx.get()), "SSL_CTX_check_private_key");

    if (!bundle.RootPem().empty()) {
        X509_STORE* store = SSL_CTX_get_cert_store(ctx.get());
        for (const auto& root : crypto::Certificate::LoadChainFromPEM(bundle.RootPem())) {
            Check(X509_STORE_add_cert(store, static_cast<X509*>(root.GetNativeHandle())),
                  "X509_STORE_add_cert");
        }
        if (require_client_cert) {
            SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
        }
    }

    return ctx;
}

TlsContextProvider::TlsContextProvider(BundleWatcher& watcher, bool require_client_cert)
    : watcher_(watcher)
    , require_client_cert_(require_client_cert) {
    if (auto bundle = watcher_.Get()) {
        current_ = BuildContext(*bundle, require_client_cert_);
        serial_ = bundle->SerialNumber();
        reloads_ = 1;
    }
    subscription_ = watcher_.Subscribe([this](const KeyCertBundlePtr& b) { OnBundle(b); });
}

TlsContextProvider::~TlsContextProvider() {
    watcher_.Unsubscribe(subscription_);
}

void TlsContextProvider::OnBundle(const KeyCertBundlePtr& bundle) {
    std::shared_ptr<SSL_CTX> ctx;
    try {
        ctx = BuildContext(*bundle, require_client_cert_);
    } catch (const crypto::CryptoError& e) {
        LOG(ERROR) << "Cannot build TLS context for serial " << bundle->SerialNumber()
                   << ", keeping the previous one: " << e.what();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(ctx);
    serial_ = bundle->SerialNumber();
    ++reloads_;
    LOG(INFO) << "TLS context reloaded with serial " << serial_;
}

std::shared_ptr<SSL_CTX> TlsContextProvider::GetContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::string TlsContextProvider::CurrentSerial() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serial_;
}

uint64_t TlsContextProvider::ReloadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reloads_;
}

} // namespace rotation
} // namespace meshcert
