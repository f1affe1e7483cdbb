/**
 * @file rotation_scheduler.h
 * @brief Re-issues the identity before it expires and when the root changes
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_ROTATION_SCHEDULER_H
#define MESHCERT_ROTATION_SCHEDULER_H

#include "meshcert/ca/cert_provider.h"
#include "meshcert/rotation/bundle_watcher.h"
#include "meshcert/rotation/trust_anchor_aggregator.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meshcert {
namespace rotation {

struct RotationOptions {
    std::vector<std::string> names;
    std::chrono::seconds ttl{24 * 3600};
    bool for_ca = false;

    double grace_period_ratio = 0.5;                   ///< Fraction of the lifetime after which to rotate
    std::chrono::seconds min_grace_period{0};          ///< Rotate at least this long before NotAfter
    std::chrono::milliseconds retry_backoff{10000};    ///< Minimum delay after a failed attempt
    std::chrono::seconds root_poll_interval{60};

    TrustAnchorSource anchor_source = TrustAnchorSource::SelfManagedCA;
};

/**
 * @brief Time until a certificate is due for rotation
 *
 * max(0, min(lifetime * ratio - elapsed, not_after - min_grace - now)),
 * with lifetime = not_after - not_before and elapsed = now - not_before.
 *
 * @param not_before Unix epoch seconds
 * @param not_after Unix epoch seconds
 * @param now Current time
 * @param ratio Grace period ratio in (0, 1]
 * @param min_grace Lower bound on the remaining validity at rotation
 */
std::chrono::milliseconds ComputeWaitTime(int64_t not_before, int64_t not_after,
                                          std::chrono::system_clock::time_point now,
                                          double ratio,
                                          std::chrono::seconds min_grace = std::chrono::seconds(0));

/**
 * @brief Rotation and root polling loops for one identity
 *
 * The rotation loop sleeps until the published bundle is due, asks the
 * provider for a new one and publishes it. It wakes early on Stop(),
 * TriggerRotation(), or when a newer bundle is published by someone else
 * (the wait is then recomputed). Failed attempts are logged and retried no
 * sooner than retry_backoff later.
 *
 * The root polling loop compares the provider's root with the last one seen
 * every root_poll_interval and triggers a rotation when it changed.
 *
 * With an aggregator in multi-root mode, every issued root is reported under
 * anchor_source and the published bundle carries the aggregate trust bundle.
 */
class RotationScheduler {
public:
    RotationScheduler(ca::CertProvider& provider, BundleWatcher& watcher, RotationOptions options,
                      TrustAnchorAggregator* aggregator = nullptr);
    ~RotationScheduler();

    RotationScheduler(const RotationScheduler&) = delete;
    RotationScheduler& operator=(const RotationScheduler&) = delete;

    void Start();

    /**
     * @brief Stop both loops and join them
     */
    void Stop();

    /**
     * @brief Ask the rotation loop to re-issue now
     */
    void TriggerRotation();

    /**
     * @brief Ask the root polling loop to check now
     */
    void TriggerRootCheck();

    /**
     * @brief Issue and publish synchronously
     * @return The published bundle
     * @throws CertError on failure; nothing is published
     */
    KeyCertBundlePtr RotateNow();

    /**
     * @brief Re-publish the current identity with the aggregate trust bundle
     *
     * Does nothing when no bundle is published or the trust bundle is unchanged.
     * Must not be called from an aggregator listener; use TriggerTrustRefresh().
     */
    void RefreshTrustBundle();

    /**
     * @brief Ask the rotation loop to run RefreshTrustBundle()
     */
    void TriggerTrustRefresh();

    /**
     * @brief Wait until the current bundle is due (zero when Empty)
     */
    std::chrono::milliseconds NextWaitTime() const;

    uint64_t SuccessCount() const;
    uint64_t FailureCount() const;

private:
    void RotationLoop();
    void RootPollLoop();
    void CheckRoot();
    KeyCertBundlePtr WithAggregateRoot(const KeyCertBundlePtr& bundle);

    ca::CertProvider& provider_;
    BundleWatcher& watcher_;
    RotationOptions options_;
    TrustAnchorAggregator* aggregator_;

    BundleWatcher::SubscriptionId subscription_ = 0;

    // Serializes issuing
    std::mutex rotate_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_ = false;
    bool rotation_requested_ = false;
    bool root_check_requested_ = false;
    bool refresh_requested_ = false;
    uint64_t publish_count_ = 0;
    uint64_t successes_ = 0;
    uint64_t failures_ = 0;
    std::string last_root_;

    std::thread rotation_thread_;
    std::thread root_poll_thread_;
};

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_ROTATION_SCHEDULER_H
