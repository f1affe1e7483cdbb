/**
 * @file certificate_test.cpp
 * @brief Unit tests for certificate creation, parsing and chain checks
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "meshcert/common/crypto.h"
#include <chrono>
#include <ctime>

using namespace meshcert::crypto;
using ::testing::Contains;
using ::testing::ElementsAre;

// ============================================================================
// Test Fixture
// ============================================================================

class CertificateTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_key = PrivateKey::Generate(KeyType::EcdsaP256);
        root_cert = CreateCACertificate(root_key, PublicKey::FromPrivateKey(root_key),
                                        "cluster.local", std::chrono::hours(24 * 365));

        intermediate_key = PrivateKey::Generate(KeyType::EcdsaP256);
        intermediate_cert = CreateCACertificate(root_key, PublicKey::FromPrivateKey(intermediate_key),
                                                "intermediate.cluster.local", std::chrono::hours(24 * 30),
                                                &root_cert);

        leaf_key = PrivateKey::Generate(KeyType::EcdsaP256);
        CertificateOptions options;
        options.dns_names = {"istiod.istio-system.svc", "spiffe://cluster.local/ns/default/sa/app"};
        const int64_t now = Now();
        options.not_before = now - 60;
        options.not_after = now + 3600;
        leaf_cert = CreateCertificate(options, PublicKey::FromPrivateKey(leaf_key), intermediate_key,
                                      &intermediate_cert);
    }

    int64_t Now() const { return static_cast<int64_t>(time(nullptr)); }

    PrivateKey root_key;
    Certificate root_cert;
    PrivateKey intermediate_key;
    Certificate intermediate_cert;
    PrivateKey leaf_key;
    Certificate leaf_cert;
};

// ============================================================================
// Creation Tests
// ============================================================================

TEST_F(CertificateTest, RootIsSelfSignedCA) {
    EXPECT_TRUE(root_cert.IsCA());
    EXPECT_TRUE(root_cert.IsSelfSigned());
    EXPECT_EQ(root_cert.GetSubject(), root_cert.GetIssuer());
}

TEST_F(CertificateTest, IntermediateSignedByRoot) {
    EXPECT_TRUE(intermediate_cert.IsCA());
    EXPECT_FALSE(intermediate_cert.IsSelfSigned());
    EXPECT_TRUE(intermediate_cert.IsSignedBy(root_cert));
}

TEST_F(CertificateTest, LeafCarriesSubjectAltNames) {
    EXPECT_FALSE(leaf_cert.IsCA());
    auto sans = leaf_cert.GetSubjectAltNames();
    EXPECT_THAT(sans, Contains("istiod.istio-system.svc"));
    EXPECT_THAT(sans, Contains("spiffe://cluster.local/ns/default/sa/app"));
}

TEST_F(CertificateTest, LeafValidityFollowsOptions) {
    auto validity = leaf_cert.GetValidityPeriod();
    EXPECT_EQ(validity.first, leaf_cert.GetNotBefore());
    EXPECT_EQ(validity.second, leaf_cert.GetNotAfter());
    EXPECT_EQ(validity.second - validity.first, 3660);
}

TEST_F(CertificateTest, LeafWithoutNamesRejected) {
    CertificateOptions options;
    options.not_before = Now();
    options.not_after = Now() + 60;

    EXPECT_THROW(CreateCertificate(options, PublicKey::FromPrivateKey(leaf_key), root_key, &root_cert),
                 CryptoError);
}

TEST_F(CertificateTest, SerialNumbersAreUnique) {
    auto other = CreateCACertificate(root_key, PublicKey::FromPrivateKey(root_key), "cluster.local",
                                     std::chrono::hours(1));
    EXPECT_FALSE(root_cert.GetSerialNumber().empty());
    EXPECT_NE(other.GetSerialNumber(), root_cert.GetSerialNumber());
}

TEST_F(CertificateTest, KeyMatching) {
    EXPECT_TRUE(leaf_cert.MatchesPrivateKey(leaf_key));
    EXPECT_FALSE(leaf_cert.MatchesPrivateKey(root_key));
}

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(CertificateTest, PEMRoundTrip) {
    auto loaded = Certificate::LoadFromPEM(leaf_cert.ToPEM());
    EXPECT_EQ(loaded.ToDER(), leaf_cert.ToDER());
    EXPECT_EQ(loaded.GetSerialNumber(), leaf_cert.GetSerialNumber());
}

TEST_F(CertificateTest, LoadChainKeepsOrder) {
    std::string pem = leaf_cert.ToPEM() + intermediate_cert.ToPEM() + root_cert.ToPEM();

    auto chain = Certificate::LoadChainFromPEM(pem);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0].GetSerialNumber(), leaf_cert.GetSerialNumber());
    EXPECT_EQ(chain[2].GetSerialNumber(), root_cert.GetSerialNumber());
}

TEST_F(CertificateTest, LoadInvalidPEMThrows) {
    EXPECT_THROW(Certificate::LoadFromPEM("not a certificate"), CryptoError);
    EXPECT_THROW(Certificate::LoadChainFromPEM(""), CryptoError);
}

TEST_F(CertificateTest, LoadFromDERInvalidData) {
    std::vector<uint8_t> invalid_der = {0x01, 0x02, 0x03};
    EXPECT_THROW(Certificate::LoadFromDER(invalid_der), CryptoError);
}

TEST_F(CertificateTest, NormalizeStripsSurroundingText) {
    std::string messy = "# root of trust\n" + root_cert.ToPEM() + "\n\ntrailing garbage\n";

    auto normalized = NormalizeCertificatesPEM(messy);
    EXPECT_THAT(normalized, ElementsAre(root_cert.ToPEM()));
}

// ============================================================================
// Chain Verification Tests
// ============================================================================

TEST_F(CertificateTest, ChainVerifiesAgainstRoot) {
    std::vector<Certificate> intermediates;
    intermediates.push_back(intermediate_cert.Clone());
    std::vector<Certificate> roots;
    roots.push_back(root_cert.Clone());

    EXPECT_NO_THROW(leaf_cert.VerifyChainWithIntermediates(intermediates, roots, Now()));
}

TEST_F(CertificateTest, ChainVerifiesAgainstIntermediateAnchor) {
    std::vector<Certificate> roots;
    roots.push_back(intermediate_cert.Clone());

    EXPECT_NO_THROW(leaf_cert.VerifyChainWithIntermediates({}, roots, Now()));
}

TEST_F(CertificateTest, ChainFailsWithUnrelatedRoot) {
    auto other_key = PrivateKey::Generate(KeyType::EcdsaP256);
    std::vector<Certificate> roots;
    roots.push_back(CreateCACertificate(other_key, PublicKey::FromPrivateKey(other_key), "other.local",
                                        std::chrono::hours(1)));
    std::vector<Certificate> intermediates;
    intermediates.push_back(intermediate_cert.Clone());

    EXPECT_THROW(leaf_cert.VerifyChainWithIntermediates(intermediates, roots, Now()), CryptoError);
}

TEST_F(CertificateTest, ChainFailsAfterExpiry) {
    std::vector<Certificate> intermediates;
    intermediates.push_back(intermediate_cert.Clone());
    std::vector<Certificate> roots;
    roots.push_back(root_cert.Clone());

    EXPECT_THROW(leaf_cert.VerifyChainWithIntermediates(intermediates, roots, Now() + 7200), CryptoError);
}

TEST_F(CertificateTest, FindRootFromChain) {
    std::string pem = leaf_cert.ToPEM() + intermediate_cert.ToPEM() + root_cert.ToPEM();
    EXPECT_EQ(FindRootCertFromCertificateChain(pem), root_cert.ToPEM());
}

TEST_F(CertificateTest, FindRootRequiresSelfSignedTail) {
    std::string pem = leaf_cert.ToPEM() + intermediate_cert.ToPEM();
    EXPECT_THROW(FindRootCertFromCertificateChain(pem), CryptoError);
}

// ============================================================================
// Certificate Request Tests
// ============================================================================

TEST_F(CertificateTest, RequestRoundTrip) {
    CertificateOptions options;
    options.dns_names = {"app.default.svc"};
    auto request = CertificateRequest::Create(leaf_key, options);

    auto loaded = CertificateRequest::LoadFromPEM(request.ToPEM());
    EXPECT_THAT(loaded.GetSubjectAltNames(), ElementsAre("app.default.svc"));
    EXPECT_FALSE(loaded.RequestsCA());
    EXPECT_EQ(loaded.GetPublicKey().ToPEM(), PublicKey::FromPrivateKey(leaf_key).ToPEM());
}

TEST_F(CertificateTest, RequestForCA) {
    CertificateOptions options;
    options.dns_names = {"ca.cluster.local"};
    options.is_ca = true;

    auto request = CertificateRequest::LoadFromPEM(CertificateRequest::Create(leaf_key, options).ToPEM());
    EXPECT_TRUE(request.RequestsCA());
}

TEST_F(CertificateTest, RequestInvalidPEMThrows) {
    EXPECT_THROW(CertificateRequest::LoadFromPEM("-----BEGIN CERTIFICATE REQUEST-----\n"), CryptoError);
}
