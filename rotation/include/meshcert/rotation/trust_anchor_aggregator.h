/**
 * @file trust_anchor_aggregator.h
 * @brief Merges trust roots from several sources into one trust bundle
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_TRUST_ANCHOR_AGGREGATOR_H
#define MESHCERT_TRUST_ANCHOR_AGGREGATOR_H

#include "meshcert/common/mesh_config.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace meshcert {
namespace rotation {

/**
 * @brief Origin of a set of trust anchors
 *
 * The declaration order is the order of sources in the aggregate bundle.
 */
enum class TrustAnchorSource {
    SelfManagedCA,
    Kubernetes,
    ExternalRA,
    FileMounted,
    MeshConfig
};

const char* TrustAnchorSourceName(TrustAnchorSource source);

struct TrustAnchorUpdate {
    TrustAnchorSource source = TrustAnchorSource::SelfManagedCA;
    std::vector<std::string> certs;     ///< PEM roots; a PEM may hold several certificates
};

/**
 * @brief Pushes the aggregate trust anchors to connected proxies
 *
 * Implementations throw on failure.
 */
class TrustAnchorPropagator {
public:
    virtual ~TrustAnchorPropagator() = default;

    virtual void PropagateTrustAnchors(const std::vector<std::string>& anchors) = 0;
};

/**
 * @brief Union of the trust anchors of every source
 *
 * Each source's contribution is replaced as a whole by its next update; an
 * update with no certificates removes the source. The aggregate is
 * deduplicated by normalized PEM and ordered by source, then by content, so
 * equal inputs always give byte-identical output.
 */
class TrustAnchorAggregator {
public:
    using Listener = std::function<void(const std::vector<std::string>&)>;

    explicit TrustAnchorAggregator(bool multi_root_mesh = false,
                                   TrustAnchorPropagator* propagator = nullptr);

    /**
     * @brief Replace one source's anchors
     *
     * Listeners run whenever the aggregate changed. In multi-root mode the
     * propagator is called whenever the aggregate differs from the last one
     * it accepted, so a failed push is retried by the next update.
     *
     * @throws CertError ChainInvalid if a PEM does not parse as a CA certificate
     *         (no state is changed)
     * @throws CertError PropagationError if the propagator fails (the local
     *         aggregate is already updated)
     */
    void Update(const TrustAnchorUpdate& update);

    std::vector<std::string> GetTrustAnchors() const;

    /**
     * @brief Aggregate as one concatenated PEM
     */
    std::string TrustBundlePem() const;

    std::vector<std::string> SourceAnchors(TrustAnchorSource source) const;

    /**
     * @brief Switch multi-root mode
     *
     * Enabling it pushes the current aggregate if the propagator has not
     * accepted it yet.
     *
     * @throws CertError PropagationError if that push fails
     */
    void SetMultiRootMesh(bool enabled);
    bool MultiRootMesh() const;

    void AddListener(Listener listener);

private:
    std::vector<std::string> ComputeAggregateLocked() const;
    // Caller holds update_mutex_
    void PropagatePending();

    TrustAnchorPropagator* propagator_;

    // Serializes Update() so propagation sees aggregates in order
    std::mutex update_mutex_;

    mutable std::mutex state_mutex_;
    bool multi_root_mesh_;
    std::map<TrustAnchorSource, std::vector<std::string>> sources_;
    std::vector<std::string> aggregate_;
    std::vector<std::string> propagated_;   ///< Last aggregate the propagator accepted
    std::vector<Listener> listeners_;
};

/**
 * @brief Feed mesh config pushes into the aggregator
 *
 * The mesh config's PEM roots become the MeshConfig source and its
 * multi_root_mesh flag switches multi-root mode. With force_multi_root set the
 * mode stays on whatever the mesh config says. Applies the watcher's current
 * config immediately. Failures of later pushes are logged.
 */
void BindMeshConfigAnchors(MeshConfigWatcher& watcher, TrustAnchorAggregator& aggregator,
                           bool force_multi_root = false);

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_TRUST_ANCHOR_AGGREGATOR_H
