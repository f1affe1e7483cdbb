/**
 * @file bundle_watcher.cpp
 * @brief Holder of the current identity bundle with change notification
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/bundle_watcher.h"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>

namespace meshcert {
namespace rotation {

KeyCertBundlePtr BundleWatcher::SetAndNotify(const std::string& key_pem,
                                             const std::string& cert_chain_pem,
                                             const std::string& root_pem) {
    auto bundle = KeyCertBundle::Create(key_pem, cert_chain_pem, root_pem);
    Publish(bundle);
    return bundle;
}

KeyCertBundlePtr BundleWatcher::SetFromFilesAndNotify(const std::string& key_file,
                                                      const std::string& cert_file,
                                                      const std::string& ca_file) {
    auto bundle = KeyCertBundle::LoadFromFiles(key_file, cert_file, ca_file);
    Publish(bundle);
    return bundle;
}

void BundleWatcher::Publish(KeyCertBundlePtr bundle) {
    if (!bundle) {
        throw std::invalid_argument("cannot publish an empty bundle");
    }

    std::lock_guard<std::mutex> publish_lock(publish_mutex_);

    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_ = bundle;
        generation = ++generation_;
    }

    LOG(INFO) << "Published identity bundle #" << generation << ": subject " << bundle->Subject()
              << ", serial " << bundle->SerialNumber() << ", valid " << bundle->NotBefore()
              << " to " << bundle->NotAfter();

    std::vector<std::pair<SubscriptionId, Callback>> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers = subscribers_;
    }

    for (const auto& subscriber : subscribers) {
        try {
            subscriber.second(bundle);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Bundle subscriber " << subscriber.first << " failed: " << e.what();
        }
    }
}

KeyCertBundlePtr BundleWatcher::Get() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_;
}

std::string BundleWatcher::GetCABundle() const {
    auto bundle = Get();
    return bundle ? bundle->RootPem() : std::string();
}

bool BundleWatcher::IsEmpty() const {
    return Get() == nullptr;
}

uint64_t BundleWatcher::Generation() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return generation_;
}

BundleWatcher::SubscriptionId BundleWatcher::Subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace_back(id, std::move(callback));
    return id;
}

void BundleWatcher::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [id](const std::pair<SubscriptionId, Callback>& s) {
                                          return s.first == id;
                                      }),
                       subscribers_.end());
}

size_t BundleWatcher::SubscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

} // namespace rotation
} // namespace meshcert
