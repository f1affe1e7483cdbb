/**
 * @file bundle_watcher.h
 * @brief Holder of the current identity bundle with change notification
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_BUNDLE_WATCHER_H
#define MESHCERT_BUNDLE_WATCHER_H

#include "meshcert/common/key_cert_bundle.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace meshcert {
namespace rotation {

/**
 * @brief Single owner of the current KeyCertBundle
 *
 * Starts Empty and becomes Populated with the first publish; it never goes
 * back to Empty. A publish swaps the bundle pointer under a short lock, so
 * readers see either the old or the new bundle and never wait for
 * verification or subscribers. Publishes are serialized; subscribers run
 * synchronously on the publishing thread, in registration order, after the
 * swap.
 *
 * Subscribers must not publish from inside their callback.
 */
class BundleWatcher {
public:
    using Callback = std::function<void(const KeyCertBundlePtr&)>;
    using SubscriptionId = uint64_t;

    BundleWatcher() = default;
    BundleWatcher(const BundleWatcher&) = delete;
    BundleWatcher& operator=(const BundleWatcher&) = delete;

    /**
     * @brief Build, verify and publish a bundle
     *
     * @param key_pem PEM private key
     * @param cert_chain_pem Leaf followed by intermediates
     * @param root_pem Trust roots
     * @return The published bundle
     * @throws CertError KeyMismatch or ChainInvalid; the current bundle is kept
     */
    KeyCertBundlePtr SetAndNotify(const std::string& key_pem,
                                  const std::string& cert_chain_pem,
                                  const std::string& root_pem);

    /**
     * @brief Publish an already verified bundle
     * @throws std::invalid_argument if bundle is null
     */
    void Publish(KeyCertBundlePtr bundle);

    /**
     * @brief Read key, chain and root files, then publish
     * @throws CertError IOError, KeyMismatch or ChainInvalid; the current bundle is kept
     */
    KeyCertBundlePtr SetFromFilesAndNotify(const std::string& key_file,
                                           const std::string& cert_file,
                                           const std::string& ca_file);

    /**
     * @brief Latest published bundle, null while Empty
     */
    KeyCertBundlePtr Get() const;

    /**
     * @brief Trust roots of the latest bundle (empty while Empty)
     */
    std::string GetCABundle() const;

    bool IsEmpty() const;

    /**
     * @brief Number of publishes so far
     */
    uint64_t Generation() const;

    SubscriptionId Subscribe(Callback callback);

    /**
     * @brief Remove a subscription
     *
     * Safe to call from inside a callback; a publish already in progress may
     * still deliver to the removed subscriber.
     */
    void Unsubscribe(SubscriptionId id);

    size_t SubscriberCount() const;

private:
    // Guards current_ and generation_
    mutable std::mutex state_mutex_;
    KeyCertBundlePtr current_;
    uint64_t generation_ = 0;

    // Serializes publishers
    std::mutex publish_mutex_;

    mutable std::mutex subscribers_mutex_;
    SubscriptionId next_id_ = 1;
    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
};

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_BUNDLE_WATCHER_H
