/**
 * @file trust_anchor_aggregator_test.cpp
 * @brief Unit tests for trust anchor aggregation across sources
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "meshcert/rotation/trust_anchor_aggregator.h"
#include "meshcert/common/errors.h"
#include "test_ca.h"
#include <memory>
#include <stdexcept>

using namespace meshcert;
using namespace meshcert::rotation;
using meshcert::test::TestCA;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Throw;

namespace {

class MockPropagator : public TrustAnchorPropagator {
public:
    MOCK_METHOD(void, PropagateTrustAnchors, (const std::vector<std::string>& anchors), (override));
};

TrustAnchorUpdate MakeUpdate(TrustAnchorSource source, std::vector<std::string> certs) {
    TrustAnchorUpdate update;
    update.source = source;
    update.certs = std::move(certs);
    return update;
}

} // anonymous namespace

class TrustAnchorAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ca_a = std::make_unique<TestCA>("a.local");
        ca_b = std::make_unique<TestCA>("b.local");
        ca_c = std::make_unique<TestCA>("c.local");
    }

    std::unique_ptr<TestCA> ca_a;
    std::unique_ptr<TestCA> ca_b;
    std::unique_ptr<TestCA> ca_c;
};

// ============================================================================
// Aggregation Tests
// ============================================================================

TEST_F(TrustAnchorAggregatorTest, UnionOfSources) {
    TrustAnchorAggregator aggregator;
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_b->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::SelfManagedCA, {ca_a->RootPem()}));

    // Ordered by source, not by arrival
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem(), ca_b->RootPem()));
    EXPECT_EQ(aggregator.TrustBundlePem(), ca_a->RootPem() + ca_b->RootPem());
}

TEST_F(TrustAnchorAggregatorTest, UpdateReplacesSource) {
    TrustAnchorAggregator aggregator;
    aggregator.Update(MakeUpdate(TrustAnchorSource::ExternalRA, {ca_a->RootPem(), ca_b->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::ExternalRA, {ca_c->RootPem()}));

    EXPECT_THAT(aggregator.SourceAnchors(TrustAnchorSource::ExternalRA), ElementsAre(ca_c->RootPem()));
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_c->RootPem()));
}

TEST_F(TrustAnchorAggregatorTest, EmptyUpdateRemovesSource) {
    TrustAnchorAggregator aggregator;
    aggregator.Update(MakeUpdate(TrustAnchorSource::Kubernetes, {ca_a->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_b->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::Kubernetes, {}));

    EXPECT_TRUE(aggregator.SourceAnchors(TrustAnchorSource::Kubernetes).empty());
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_b->RootPem()));
}

TEST_F(TrustAnchorAggregatorTest, DeduplicatesAcrossSources) {
    TrustAnchorAggregator aggregator;
    aggregator.Update(MakeUpdate(TrustAnchorSource::SelfManagedCA, {ca_a->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem() + ca_a->RootPem()}));

    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem()));
    EXPECT_THAT(aggregator.SourceAnchors(TrustAnchorSource::MeshConfig), ElementsAre(ca_a->RootPem()));
}

TEST_F(TrustAnchorAggregatorTest, OutputIndependentOfInputOrder) {
    TrustAnchorAggregator first;
    first.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem(), ca_b->RootPem()}));
    TrustAnchorAggregator second;
    second.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_b->RootPem() + ca_a->RootPem()}));

    EXPECT_EQ(first.TrustBundlePem(), second.TrustBundlePem());
}

TEST_F(TrustAnchorAggregatorTest, InvalidAnchorChangesNothing) {
    TrustAnchorAggregator aggregator;
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()}));

    auto leaf = ca_b->Issue(std::chrono::hours(1));
    for (const std::string& bad : {std::string("not a certificate"), leaf->CertPem()}) {
        try {
            aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_b->RootPem(), bad}));
            FAIL() << "Expected ChainInvalid";
        } catch (const CertError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::ChainInvalid);
        }
    }
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem()));
}

// ============================================================================
// Listener and Propagation Tests
// ============================================================================

TEST_F(TrustAnchorAggregatorTest, ListenersOnlyOnChange) {
    TrustAnchorAggregator aggregator;
    int calls = 0;
    aggregator.AddListener([&calls](const std::vector<std::string>&) { calls++; });

    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()}));
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()}));
    // Same root from another source leaves the aggregate unchanged
    aggregator.Update(MakeUpdate(TrustAnchorSource::SelfManagedCA, {ca_a->RootPem()}));

    EXPECT_EQ(calls, 1);
}

TEST_F(TrustAnchorAggregatorTest, PropagatesOnlyInMultiRootMode) {
    ::testing::StrictMock<MockPropagator> propagator;
    TrustAnchorAggregator aggregator(false, &propagator);

    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()}));

    // Enabling the mode pushes the aggregate collected so far
    EXPECT_CALL(propagator, PropagateTrustAnchors(ElementsAre(ca_a->RootPem()))).Times(1);
    aggregator.SetMultiRootMesh(true);

    EXPECT_CALL(propagator, PropagateTrustAnchors(ElementsAre(ca_a->RootPem(), ca_b->RootPem()))).Times(1);
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem(), ca_b->RootPem()}));

    // Already accepted; nothing more to push
    aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem(), ca_b->RootPem()}));
}

TEST_F(TrustAnchorAggregatorTest, PropagationFailureKeepsLocalState) {
    MockPropagator propagator;
    EXPECT_CALL(propagator, PropagateTrustAnchors(_)).WillOnce(Throw(std::runtime_error("proxy gone")));
    TrustAnchorAggregator aggregator(true, &propagator);

    try {
        aggregator.Update(MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()}));
        FAIL() << "Expected PropagationError";
    } catch (const CertError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PropagationError);
    }
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem()));
}

TEST_F(TrustAnchorAggregatorTest, FailedPropagationRetriedOnNextUpdate) {
    MockPropagator propagator;
    TrustAnchorAggregator aggregator(true, &propagator);
    auto update = MakeUpdate(TrustAnchorSource::MeshConfig, {ca_a->RootPem()});

    {
        ::testing::InSequence seq;
        EXPECT_CALL(propagator, PropagateTrustAnchors(ElementsAre(ca_a->RootPem())))
            .WillOnce(Throw(std::runtime_error("proxy gone")));
        EXPECT_CALL(propagator, PropagateTrustAnchors(ElementsAre(ca_a->RootPem()))).Times(1);
    }

    EXPECT_THROW(aggregator.Update(update), CertError);
    // Same input, but the proxies never got it
    EXPECT_NO_THROW(aggregator.Update(update));
    // Now accepted
    EXPECT_NO_THROW(aggregator.Update(update));
}

TEST_F(TrustAnchorAggregatorTest, FailedPropagationRetriedWhenModeReenabled) {
    MockPropagator propagator;
    TrustAnchorAggregator aggregator(true, &propagator);

    EXPECT_CALL(propagator, PropagateTrustAnchors(_))
        .WillOnce(Throw(std::runtime_error("proxy gone")))
        .WillOnce(::testing::Return());

    EXPECT_THROW(aggregator.Update(MakeUpdate(TrustAnchorSource::Kubernetes, {ca_a->RootPem()})), CertError);
    aggregator.SetMultiRootMesh(false);
    EXPECT_NO_THROW(aggregator.SetMultiRootMesh(true));
}

TEST_F(TrustAnchorAggregatorTest, MeshConfigBinding) {
    MeshConfigWatcher watcher;
    TrustAnchorAggregator aggregator;
    BindMeshConfigAnchors(watcher, aggregator);
    EXPECT_TRUE(aggregator.GetTrustAnchors().empty());

    config::MeshConfig update;
    auto* entry = update.add_ca_certificates();
    entry->set_pem(ca_a->RootPem());
    entry->add_cert_signers("signer1");
    update.set_multi_root_mesh(true);
    watcher.Update(update);

    EXPECT_TRUE(aggregator.MultiRootMesh());
    EXPECT_THAT(aggregator.SourceAnchors(TrustAnchorSource::MeshConfig), ElementsAre(ca_a->RootPem()));

    // A bad push is logged and leaves the anchors alone
    config::MeshConfig bad;
    bad.add_ca_certificates()->set_pem("garbage");
    EXPECT_NO_THROW(watcher.Update(bad));
    EXPECT_FALSE(aggregator.MultiRootMesh());
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem()));
}

TEST_F(TrustAnchorAggregatorTest, ForcedMultiRootSurvivesMeshConfigPush) {
    MeshConfigWatcher watcher;
    TrustAnchorAggregator aggregator(true);
    BindMeshConfigAnchors(watcher, aggregator, true);
    EXPECT_TRUE(aggregator.MultiRootMesh());

    config::MeshConfig update;
    update.add_ca_certificates()->set_pem(ca_a->RootPem());
    update.set_multi_root_mesh(false);
    watcher.Update(update);

    EXPECT_TRUE(aggregator.MultiRootMesh());
    EXPECT_THAT(aggregator.GetTrustAnchors(), ElementsAre(ca_a->RootPem()));
}
