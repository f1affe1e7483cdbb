/**
 * @file trust_anchor_aggregator.cpp
 * @brief Merges trust roots from several sources into one trust bundle
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/trust_anchor_aggregator.h"
#include "meshcert/common/crypto.h"
#include "meshcert/common/errors.h"
#include <glog/logging.h>
#include <algorithm>
#include <set>

namespace meshcert {
namespace rotation {

const char* TrustAnchorSourceName(TrustAnchorSource source) {
    switch (source) {
        case TrustAnchorSource::SelfManagedCA:
            return "SelfManagedCA";
        case TrustAnchorSource::Kubernetes:
            return "Kubernetes";
        case TrustAnchorSource::ExternalRA:
            return "ExternalRA";
        case TrustAnchorSource::FileMounted:
            return "FileMounted";
        case TrustAnchorSource::MeshConfig:
            return "MeshConfig";
    }
    return "Unknown";
}

namespace {

// Split, parse and re-encode; every certificate must be a CA
std::vector<std::string> NormalizeAnchors(const TrustAnchorUpdate& update) {
    std::vector<std::string> anchors;

    for (const auto& pem : update.certs) {
        std::vector<crypto::Certificate> certs;
        try {
            certs = crypto::Certificate::LoadChainFromPEM(pem);
        } catch (const crypto::CryptoError& e) {
            throw CertError(ErrorKind::ChainInvalid,
                            std::string("invalid trust anchor from ") + TrustAnchorSourceName(update.source) +
                            ": " + e.what());
        }

        for (const auto& cert : certs) {
            if (!cert.IsCA()) {
                throw CertError(ErrorKind::ChainInvalid,
                                "trust anchor " + cert.GetSubject() + " from " +
                                TrustAnchorSourceName(update.source) + " is not a CA certificate");
            }
            anchors.push_back(cert.ToPEM());
        }
    }

    std::sort(anchors.begin(), anchors.end());
    anchors.erase(std::unique(anchors.begin(), anchors.end()), anchors.end());
    return anchors;
}

} // anonymous namespace

TrustAnchorAggregator::TrustAnchorAggregator(bool multi_root_mesh, TrustAnchorPropagator* propagator)
    : propagator_(propagator)
    , multi_root_mesh_(multi_root_mesh) {}

std::vector<std::string> TrustAnchorAggregator::ComputeAggregateLocked() const {
    std::vector<std::string> aggregate;
    std::set<std::string> seen;

    for (const auto& source : sources_) {
        for (const auto& anchor : source.second) {
            if (seen.insert(anchor).second) {
                aggregate.push_back(anchor);
            }
        }
    }
    return aggregate;
}

void TrustAnchorAggregator::Update(const TrustAnchorUpdate& update) {
    // Validate before taking any lock; a bad update changes nothing
    std::vector<std::string> anchors = NormalizeAnchors(update);

    std::lock_guard<std::mutex> update_lock(update_mutex_);

    std::vector<std::string> aggregate;
    std::vector<Listener> listeners;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (anchors.empty()) {
            sources_.erase(update.source);
        } else {
            sources_[update.source] = std::move(anchors);
        }

        aggregate = ComputeAggregateLocked();
        changed = aggregate != aggregate_;
        if (changed) {
            aggregate_ = aggregate;
            listeners = listeners_;
        }
    }

    if (changed) {
        LOG(INFO) << "Trust anchors updated from " << TrustAnchorSourceName(update.source) << ": "
                  << aggregate.size() << " anchors in aggregate";
        for (const auto& listener : listeners) {
            listener(aggregate);
        }
    } else {
        VLOG(1) << "Trust anchors from " << TrustAnchorSourceName(update.source) << " unchanged";
    }

    PropagatePending();
}

void TrustAnchorAggregator::PropagatePending() {
    std::vector<std::string> aggregate;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!multi_root_mesh_ || propagator_ == nullptr || aggregate_ == propagated_) {
            return;
        }
        aggregate = aggregate_;
    }

    try {
        propagator_->PropagateTrustAnchors(aggregate);
    } catch (const std::exception& e) {
        throw CertError(ErrorKind::PropagationError,
                        std::string("failed to propagate trust anchors: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    propagated_ = std::move(aggregate);
}

std::vector<std::string> TrustAnchorAggregator::GetTrustAnchors() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return aggregate_;
}

std::string TrustAnchorAggregator::TrustBundlePem() const {
    std::string bundle;
    for (const auto& anchor : GetTrustAnchors()) {
        bundle += anchor;
    }
    return bundle;
}

std::vector<std::string> TrustAnchorAggregator::SourceAnchors(TrustAnchorSource source) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = sources_.find(source);
    if (it == sources_.end()) {
        return {};
    }
    return it->second;
}

void TrustAnchorAggregator::SetMultiRootMesh(bool enabled) {
    std::lock_guard<std::mutex> update_lock(update_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (multi_root_mesh_ != enabled) {
            LOG(INFO) << "Multi-root mesh " << (enabled ? "enabled" : "disabled");
        }
        multi_root_mesh_ = enabled;
    }
    PropagatePending();
}

bool TrustAnchorAggregator::MultiRootMesh() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return multi_root_mesh_;
}

void TrustAnchorAggregator::AddListener(Listener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listeners_.push_back(std::move(listener));
}

void BindMeshConfigAnchors(MeshConfigWatcher& watcher, TrustAnchorAggregator& aggregator,
                           bool force_multi_root) {
    auto apply = [&aggregator, force_multi_root](const config::MeshConfig& mesh_config) {
        try {
            aggregator.SetMultiRootMesh(force_multi_root || mesh_config.multi_root_mesh());
        } catch (const CertError& e) {
            LOG(ERROR) << "Trust anchor propagation failed: " << e.what();
        }

        TrustAnchorUpdate update;
        update.source = TrustAnchorSource::MeshConfig;
        update.certs = RootsFromMeshConfig(mesh_config);
        try {
            aggregator.Update(update);
        } catch (const CertError& e) {
            LOG(ERROR) << "Mesh config trust anchors rejected: " << e.what();
        }
    };

    apply(watcher.Get());
    watcher.AddHandler(apply);
}

} // namespace rotation
} // namespace meshcert
