/**
 * @file tls_context_provider.h
 * @brief Server TLS context that follows the published identity
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_TLS_CONTEXT_PROVIDER_H
#define MESHCERT_TLS_CONTEXT_PROVIDER_H

#include "meshcert/rotation/bundle_watcher.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

typedef struct ssl_ctx_st SSL_CTX;

namespace meshcert {
namespace rotation {

/**
 * @brief Rebuilds an SSL_CTX on every publish
 *
 * Connections hold the SSL_CTX they were accepted with (SSL_new takes a
 * reference), so swapping the context never disturbs them; only new
 * connections pick up the new identity. When a bundle cannot be turned into
 * a context, the error is logged and the previous context is kept.
 *
 * Example:
 * @code
 * TlsContextProvider tls(watcher);
 * SSL* ssl = SSL_new(tls.GetContext().get());
 * @endcode
 */
class TlsContextProvider {
public:
    /**
     * @param watcher Source of identities
     * @param require_client_cert Request and verify peer certificates against the roots
     * @throws CryptoError if the watcher's current bundle cannot be loaded
     */
    explicit TlsContextProvider(BundleWatcher& watcher, bool require_client_cert = true);
    ~TlsContextProvider();

    TlsContextProvider(const TlsContextProvider&) = delete;
    TlsContextProvider& operator=(const TlsContextProvider&) = delete;

    /**
     * @brief Context for the next accepted connection (null before the first bundle)
     */
    std::shared_ptr<SSL_CTX> GetContext() const;

    /**
     * @brief Serial of the certificate in the current context
     */
    std::string CurrentSerial() const;

    /**
     * @brief Number of successful context rebuilds
     */
    uint64_t ReloadCount() const;

    /**
     * @brief Build a server context from a bundle
     * @throws CryptoError on any OpenSSL failure
     */
    static std::shared_ptr<SSL_CTX> BuildContext(const KeyCertBundle& bundle, bool require_client_cert);

private:
    void OnBundle(const KeyCertBundlePtr& bundle);

    BundleWatcher& watcher_;
    const bool require_client_cert_;
    BundleWatcher::SubscriptionId subscription_;

    mutable std::mutex mutex_;
    std::shared_ptr<SSL_CTX> current_;
    std::string serial_;
    uint64_t reloads_ = 0;
};

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_TLS_CONTEXT_PROVIDER_H
