/**
 * @file rotation_scheduler.cpp
 * @brief Re-issues the identity before it expires and when the root changes
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/rotation_scheduler.h"
#include "meshcert/common/errors.h"
#include <glog/logging.h>
#include <algorithm>

namespace meshcert {
namespace rotation {

using std::chrono::milliseconds;

std::chrono::milliseconds ComputeWaitTime(int64_t not_before, int64_t not_after,
                                          std::chrono::system_clock::time_point now,
                                          double ratio,
                                          std::chrono::seconds min_grace) {
    using std::chrono::duration_cast;
    using std::chrono::system_clock;

    const system_clock::time_point start{std::chrono::seconds(not_before)};
    const system_clock::time_point end{std::chrono::seconds(not_after)};

    const auto lifetime = duration_cast<milliseconds>(end - start);
    const auto elapsed = duration_cast<milliseconds>(now - start);

    const auto by_ratio = milliseconds(static_cast<int64_t>(static_cast<double>(lifetime.count()) * ratio)) - elapsed;
    const auto by_grace = duration_cast<milliseconds>(end - min_grace - now);

    return std::max(milliseconds(0), std::min(by_ratio, by_grace));
}

RotationScheduler::RotationScheduler(ca::CertProvider& provider, BundleWatcher& watcher,
                                     RotationOptions options, TrustAnchorAggregator* aggregator)
    : provider_(provider)
    , watcher_(watcher)
    , options_(std::move(options))
    , aggregator_(aggregator) {}

RotationScheduler::~RotationScheduler() {
    Stop();
}

void RotationScheduler::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        stop_ = false;
    }

    subscription_ = watcher_.Subscribe([this](const KeyCertBundlePtr&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++publish_count_;
        }
        cv_.notify_all();
    });

    std::string root;
    try {
        root = provider_.GetRootCertPem();
    } catch (const std::exception& e) {
        LOG(WARNING) << "Cannot read initial root from " << provider_.Name() << ": " << e.what();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_root_.empty()) {
            last_root_ = root;
        }
    }

    LOG(INFO) << "Starting certificate rotation with provider " << provider_.Name()
              << " (grace ratio " << options_.grace_period_ratio << ", root poll every "
              << options_.root_poll_interval.count() << "s)";

    rotation_thread_ = std::thread(&RotationScheduler::RotationLoop, this);
    root_poll_thread_ = std::thread(&RotationScheduler::RootPollLoop, this);
}

void RotationScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();

    if (rotation_thread_.joinable()) {
        rotation_thread_.join();
    }
    if (root_poll_thread_.joinable()) {
        root_poll_thread_.join();
    }
    watcher_.Unsubscribe(subscription_);

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    LOG(INFO) << "Certificate rotation stopped";
}

void RotationScheduler::TriggerRotation() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rotation_requested_ = true;
    }
    cv_.notify_all();
}

void RotationScheduler::TriggerRootCheck() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        root_check_requested_ = true;
    }
    cv_.notify_all();
}

void RotationScheduler::TriggerTrustRefresh() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

std::chrono::milliseconds RotationScheduler::NextWaitTime() const {
    auto bundle = watcher_.Get();
    if (!bundle) {
        return milliseconds(0);
    }
    return ComputeWaitTime(bundle->NotBefore(), bundle->NotAfter(), std::chrono::system_clock::now(),
                           options_.grace_period_ratio, options_.min_grace_period);
}

uint64_t RotationScheduler::SuccessCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return successes_;
}

uint64_t RotationScheduler::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

KeyCertBundlePtr RotationScheduler::WithAggregateRoot(const KeyCertBundlePtr& bundle) {
    if (aggregator_ == nullptr || !aggregator_->MultiRootMesh() || bundle->RootPem().empty()) {
        return bundle;
    }

    TrustAnchorUpdate update;
    update.source = options_.anchor_source;
    update.certs.push_back(bundle->RootPem());
    try {
        aggregator_->Update(update);
    } catch (const CertError& e) {
        if (e.kind() != ErrorKind::PropagationError) {
            LOG(ERROR) << "Issued root rejected by trust anchor aggregation: " << e.what();
            return bundle;
        }
        // The local aggregate is updated even when propagation fails
        LOG(WARNING) << e.what();
    }

    const std::string trust_bundle = aggregator_->TrustBundlePem();
    if (trust_bundle.empty() || trust_bundle == bundle->RootPem()) {
        return bundle;
    }
    return bundle->WithRoot(trust_bundle);
}

KeyCertBundlePtr RotationScheduler::RotateNow() {
    std::lock_guard<std::mutex> rotate_lock(rotate_mutex_);

    try {
        auto issued = provider_.Issue(options_.names, options_.ttl, options_.for_ca);
        const std::string issued_root = issued->RootPem();

        auto bundle = WithAggregateRoot(issued);
        watcher_.Publish(bundle);

        std::lock_guard<std::mutex> lock(mutex_);
        if (!issued_root.empty()) {
            last_root_ = issued_root;
        }
        ++successes_;
        return bundle;
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;
        throw;
    }
}

void RotationScheduler::RefreshTrustBundle() {
    std::lock_guard<std::mutex> rotate_lock(rotate_mutex_);

    auto current = watcher_.Get();
    if (!current || aggregator_ == nullptr || !aggregator_->MultiRootMesh()) {
        return;
    }

    const std::string trust_bundle = aggregator_->TrustBundlePem();
    if (trust_bundle.empty() || trust_bundle == current->RootPem()) {
        return;
    }

    LOG(INFO) << "Re-publishing identity with updated trust bundle";
    watcher_.Publish(current->WithRoot(trust_bundle));
}

void RotationScheduler::RotationLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool backoff = false;

    while (!stop_) {
        if (refresh_requested_ && !rotation_requested_) {
            refresh_requested_ = false;
            lock.unlock();
            try {
                RefreshTrustBundle();
            } catch (const std::exception& e) {
                LOG(ERROR) << "Trust bundle refresh failed: " << e.what();
            }
            lock.lock();
            continue;
        }

        milliseconds wait(0);
        if (!rotation_requested_) {
            wait = NextWaitTime();
            if (backoff) {
                wait = std::max(wait, milliseconds(options_.retry_backoff));
            }
        }

        if (wait > milliseconds(0)) {
            VLOG(1) << "Next rotation in " << wait.count() << "ms";
            const uint64_t seen = publish_count_;
            const bool woken = cv_.wait_for(lock, wait, [this, seen] {
                return stop_ || rotation_requested_ || refresh_requested_ || publish_count_ != seen;
            });
            if (stop_) {
                break;
            }
            if (woken && !rotation_requested_) {
                if (publish_count_ != seen) {
                    // Someone else published; recompute from the new bundle
                    backoff = false;
                }
                continue;
            }
        }

        rotation_requested_ = false;
        refresh_requested_ = false;
        lock.unlock();

        bool rotated = false;
        try {
            auto bundle = RotateNow();
            LOG(INFO) << "Rotated certificate, new serial " << bundle->SerialNumber();
            rotated = true;
        } catch (const std::exception& e) {
            LOG(ERROR) << "Certificate rotation with " << provider_.Name() << " failed: " << e.what()
                       << "; retrying in " << options_.retry_backoff.count() << "ms";
        }

        if (rotated && NextWaitTime() == milliseconds(0)) {
            LOG(WARNING) << "Issued certificate is already due for rotation (TTL too short for the "
                         << "grace period); backing off";
            rotated = false;
        }

        lock.lock();
        backoff = !rotated;
    }
}

void RotationScheduler::CheckRoot() {
    std::string root;
    try {
        root = provider_.GetRootCertPem();
    } catch (const std::exception& e) {
        LOG(WARNING) << "Root poll with " << provider_.Name() << " failed: " << e.what();
        return;
    }
    if (root.empty()) {
        return;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_root_.empty()) {
            last_root_ = root;
        } else if (last_root_ != root) {
            last_root_ = root;
            changed = true;
        }
    }

    if (changed) {
        LOG(INFO) << "Root of trust of " << provider_.Name() << " changed, re-issuing certificate";
        TriggerRotation();
    }
}

void RotationScheduler::RootPollLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_) {
        cv_.wait_for(lock, options_.root_poll_interval, [this] {
            return stop_ || root_check_requested_;
        });
        if (stop_) {
            break;
        }
        root_check_requested_ = false;

        lock.unlock();
        CheckRoot();
        lock.lock();
    }
}

} // namespace rotation
} // namespace meshcert
