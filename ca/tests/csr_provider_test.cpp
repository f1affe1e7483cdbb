/**
 * @file csr_provider_test.cpp
 * @brief Unit tests for CSR based providers (Kubernetes CSR API, external RA)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "meshcert/ca/cert_provider.h"
#include "meshcert/ca/csr_api.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>

using namespace meshcert;
using namespace meshcert::ca;
using namespace meshcert::crypto;
using ::testing::_;
using ::testing::AllOf;
using ::testing::AtLeast;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

class MockCsrApiClient : public CsrApiClient {
public:
    MOCK_METHOD(std::string, Create, (const CsrSpec& spec), (override));
    MOCK_METHOD(void, Approve, (const std::string& name, const std::string& message), (override));
    MOCK_METHOD(CsrStatus, Get, (const std::string& name), (override));
    MOCK_METHOD(void, Delete, (const std::string& name), (override));
};

constexpr const char* kSignerDomain = "clusterissuers.cert-manager.io";
constexpr const char* kSignerName = "istio-ca";

ErrorKind KindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const CertError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a CertError";
    return ErrorKind::IOError;
}

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class CsrProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/meshcert_csr_XXXXXX";
        char* dir = mkdtemp(dir_template);
        ASSERT_NE(dir, nullptr);
        temp_dir = dir;

        // Per-signer CA for the in-process CSR API
        signer_dir = temp_dir + "/" + kSignerDomain + "/" + kSignerName;
        std::filesystem::create_directories(signer_dir);
        GenerateSelfSignedCA(signer_dir + "/ca-cert.pem", signer_dir + "/ca-key.pem", "signer.local",
                             std::chrono::hours(24));
        signer_root = ReadFile(signer_dir + "/ca-cert.pem");

        auto other_key = PrivateKey::Generate(KeyType::EcdsaP256);
        foreign_root = CreateCACertificate(other_key, PublicKey::FromPrivateKey(other_key), "foreign.local",
                                           std::chrono::hours(24)).ToPEM();
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    void PublishMeshRoot(const std::string& pem, const std::string& signer) {
        config::MeshConfig mesh_config;
        auto* entry = mesh_config.add_ca_certificates();
        entry->set_pem(pem);
        entry->add_cert_signers(signer);
        catalog.SetCACertificatesFromMeshConfig(mesh_config.ca_certificates());
    }

    KubernetesCsrOptions K8sOptions() const {
        KubernetesCsrOptions options;
        options.signer_name = kSignerName;
        options.signer_domain = kSignerDomain;
        options.poll_interval = std::chrono::milliseconds(10);
        options.timeout = std::chrono::milliseconds(2000);
        return options;
    }

    static std::string provider_signer() {
        return std::string(kSignerDomain) + "/" + kSignerName;
    }

    ExternalRaOptions RaOptions() const {
        ExternalRaOptions options;
        options.signer_name = kSignerName;
        options.signer_domain = kSignerDomain;
        options.poll_interval = std::chrono::milliseconds(10);
        options.timeout = std::chrono::milliseconds(2000);
        return options;
    }

    std::string temp_dir;
    std::string signer_dir;
    std::string signer_root;
    std::string foreign_root;
    MeshRootCatalog catalog;
};

// ============================================================================
// SignCsrWithApi Tests
// ============================================================================

TEST_F(CsrProviderTest, SignCsrTimesOut) {
    StrictMock<MockCsrApiClient> client;
    EXPECT_CALL(client, Create(_)).WillOnce(Return("csr-1"));
    EXPECT_CALL(client, Approve("csr-1", _)).Times(1);
    EXPECT_CALL(client, Get("csr-1")).Times(AtLeast(1)).WillRepeatedly(Return(CsrStatus()));
    EXPECT_CALL(client, Delete("csr-1")).Times(1);

    CsrSigningOptions options;
    options.poll_interval = std::chrono::milliseconds(20);
    options.timeout = std::chrono::milliseconds(100);

    try {
        SignCsrWithApi(client, "csr", options);
        FAIL() << "Expected CertGenError";
    } catch (const CertError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CertGenError);
        EXPECT_THAT(e.what(), HasSubstr("timed out"));
    }
}

TEST_F(CsrProviderTest, SignCsrDenied) {
    StrictMock<MockCsrApiClient> client;
    CsrStatus denied;
    denied.denied = true;
    denied.reason = "policy";
    EXPECT_CALL(client, Create(_)).WillOnce(Return("csr-1"));
    EXPECT_CALL(client, Approve(_, _)).Times(1);
    EXPECT_CALL(client, Get("csr-1")).WillOnce(Return(denied));
    EXPECT_CALL(client, Delete("csr-1")).Times(1);

    EXPECT_EQ(KindOf([&] { SignCsrWithApi(client, "csr", CsrSigningOptions()); }), ErrorKind::CertGenError);
}

TEST_F(CsrProviderTest, SignCsrCreateFailure) {
    StrictMock<MockCsrApiClient> client;
    EXPECT_CALL(client, Create(_)).WillOnce(Throw(std::runtime_error("connection refused")));

    EXPECT_EQ(KindOf([&] { SignCsrWithApi(client, "csr", CsrSigningOptions()); }), ErrorKind::CertGenError);
}

TEST_F(CsrProviderTest, SignCsrWithoutApproval) {
    StrictMock<MockCsrApiClient> client;
    CsrStatus issued;
    issued.approved = true;
    issued.certificate_pem = "chain";

    CsrSigningOptions options;
    options.approve = false;
    options.signer_name = "example.com/signer";
    options.requested_lifetime = std::chrono::seconds(600);

    EXPECT_CALL(client, Create(AllOf(Field(&CsrSpec::signer_name, "example.com/signer"),
                                     Field(&CsrSpec::expiration_seconds, 600),
                                     Field(&CsrSpec::request_pem, "csr"))))
        .WillOnce(Return("csr-7"));
    EXPECT_CALL(client, Get("csr-7")).WillOnce(Return(issued));
    EXPECT_CALL(client, Delete("csr-7")).Times(1);

    EXPECT_EQ(SignCsrWithApi(client, "csr", options), "chain");
}

TEST_F(CsrProviderTest, LocalSignerFailsUnknownSigner) {
    LocalCsrSigner signer(temp_dir);
    CsrSpec spec;
    spec.signer_name = "no-such-signer";
    spec.request_pem = "garbage";

    auto name = signer.Create(spec);
    signer.Approve(name, "ok");
    auto status = signer.Get(name);
    EXPECT_TRUE(status.failed);
    EXPECT_TRUE(status.certificate_pem.empty());
}

// ============================================================================
// KubernetesCsrProvider Tests
// ============================================================================

TEST_F(CsrProviderTest, KubernetesIssuesWithMeshRoot) {
    LocalCsrSigner signer(temp_dir);
    PublishMeshRoot(signer_root, provider_signer());
    KubernetesCsrProvider provider(signer, catalog, K8sOptions());

    auto bundle = provider.Issue({"istiod.istio-system.svc"}, std::chrono::hours(1), false);

    EXPECT_NO_THROW(bundle->Verify());
    EXPECT_EQ(bundle->RootPem(), signer_root);
    EXPECT_EQ(bundle->NotAfter() - bundle->NotBefore(), 3600 + DEFAULT_BACKDATE.count());
    EXPECT_EQ(signer.PendingCount(), 0u);
    EXPECT_EQ(provider.GetRootCertPem(), signer_root);
}

TEST_F(CsrProviderTest, KubernetesRootNotFoundBeforeSubmitting) {
    StrictMock<MockCsrApiClient> client;
    PublishMeshRoot(signer_root, "some-other-signer");
    KubernetesCsrProvider provider(client, catalog, K8sOptions());

    EXPECT_EQ(KindOf([&] { provider.Issue({"a.svc"}, std::chrono::hours(1), false); }),
              ErrorKind::RootNotFound);
    EXPECT_TRUE(provider.GetRootCertPem().empty());
}

TEST_F(CsrProviderTest, KubernetesDefaultSignerUsesCAFile) {
    const std::string default_dir = temp_dir + "/" + DEFAULT_CSR_SIGNER;
    std::filesystem::create_directories(default_dir);
    GenerateSelfSignedCA(default_dir + "/ca-cert.pem", default_dir + "/ca-key.pem", "legacy.local",
                         std::chrono::hours(24));

    LocalCsrSigner signer(temp_dir);
    KubernetesCsrOptions options;
    options.ca_cert_file = default_dir + "/ca-cert.pem";
    options.poll_interval = std::chrono::milliseconds(10);
    KubernetesCsrProvider provider(signer, catalog, options);

    EXPECT_EQ(provider.QualifiedSigner(), DEFAULT_CSR_SIGNER);
    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->RootPem(), ReadFile(default_dir + "/ca-cert.pem"));
}

TEST_F(CsrProviderTest, KubernetesQualifiedSigner) {
    NiceMock<MockCsrApiClient> client;

    KubernetesCsrOptions options;
    options.signer_name = "istio-ca";
    EXPECT_EQ(KubernetesCsrProvider(client, catalog, options).QualifiedSigner(), "istio-ca");

    options.signer_domain = "example.com";
    EXPECT_EQ(KubernetesCsrProvider(client, catalog, options).QualifiedSigner(), "example.com/istio-ca");
}

TEST_F(CsrProviderTest, KubernetesTimeoutIsCertGenError) {
    NiceMock<MockCsrApiClient> client;
    ON_CALL(client, Create(_)).WillByDefault(Return("csr-1"));
    ON_CALL(client, Get(_)).WillByDefault(Return(CsrStatus()));
    EXPECT_CALL(client, Delete("csr-1")).Times(1);

    PublishMeshRoot(signer_root, provider_signer());
    auto options = K8sOptions();
    options.timeout = std::chrono::milliseconds(100);
    KubernetesCsrProvider provider(client, catalog, options);

    EXPECT_EQ(KindOf([&] { provider.Issue({"a.svc"}, std::chrono::hours(1), false); }),
              ErrorKind::CertGenError);
}

// ============================================================================
// ExternalRaProvider Tests
// ============================================================================

TEST_F(CsrProviderTest, ExternalRaPreSignChecks) {
    StrictMock<MockCsrApiClient> client;
    auto options = RaOptions();
    options.max_ttl = std::chrono::hours(2);
    ExternalRaProvider provider(client, catalog, options);

    EXPECT_EQ(KindOf([&] { provider.Issue({}, std::chrono::hours(1), false); }), ErrorKind::CertGenError);
    EXPECT_EQ(KindOf([&] { provider.Issue({"a.svc"}, std::chrono::hours(3), false); }), ErrorKind::CertGenError);
    EXPECT_EQ(KindOf([&] { provider.Issue({"a.svc"}, std::chrono::hours(1), true); }), ErrorKind::CertGenError);

    auto no_domain = RaOptions();
    no_domain.signer_domain.clear();
    ExternalRaProvider undomained(client, catalog, no_domain);
    EXPECT_EQ(KindOf([&] { undomained.Issue({"a.svc"}, std::chrono::hours(1), false); }),
              ErrorKind::CertGenError);
}

TEST_F(CsrProviderTest, ExternalRaRootFromChain) {
    LocalCsrSigner signer(temp_dir);
    ExternalRaProvider provider(signer, catalog, RaOptions());

    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);

    EXPECT_EQ(bundle->RootPem(), signer_root);
    EXPECT_EQ(provider.GetRootCertPem(), signer_root);
}

TEST_F(CsrProviderTest, ExternalRaPrefersMeshRoot) {
    LocalCsrSigner signer(temp_dir);
    PublishMeshRoot(signer_root, provider_signer());
    ExternalRaProvider provider(signer, catalog, RaOptions());

    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->RootPem(), signer_root);
}

TEST_F(CsrProviderTest, ExternalRaMeshRootMustVerify) {
    LocalCsrSigner signer(temp_dir);
    PublishMeshRoot(foreign_root, provider_signer());
    ExternalRaProvider provider(signer, catalog, RaOptions());

    // No fallback to the chain's own root
    EXPECT_EQ(KindOf([&] { provider.Issue({"a.svc"}, std::chrono::hours(1), false); }),
              ErrorKind::RootVerifyFailed);
}

TEST_F(CsrProviderTest, ExternalRaChainPreference) {
    LocalCsrSigner signer(temp_dir);
    PublishMeshRoot(foreign_root, provider_signer());
    auto options = RaOptions();
    options.root_preference = RootPreference::CertChain;
    ExternalRaProvider provider(signer, catalog, options);

    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->RootPem(), signer_root);
}

TEST_F(CsrProviderTest, ExternalRaConfiguredRootFile) {
    LocalCsrSigner signer(temp_dir);
    auto options = RaOptions();
    options.ca_cert_file = signer_dir + "/ca-cert.pem";
    ExternalRaProvider provider(signer, catalog, options);

    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->RootPem(), signer_root);
    EXPECT_EQ(provider.GetRootCertPem(), signer_root);
}

TEST_F(CsrProviderTest, ExternalRaResolveRootWithoutCandidates) {
    NiceMock<MockCsrApiClient> client;
    ExternalRaProvider provider(client, catalog, RaOptions());

    auto key = PrivateKey::Generate(KeyType::EcdsaP256);
    CertificateAuthority authority(signer_root, ReadFile(signer_dir + "/ca-key.pem"), "");
    auto leaf = authority.Sign(PublicKey::FromPrivateKey(key), {"a.svc"}, std::chrono::hours(1), false);

    // Leaf alone: no self-signed tail and no mesh root
    EXPECT_EQ(KindOf([&] { provider.ResolveRoot(leaf.ToPEM()); }), ErrorKind::RootVerifyFailed);
    EXPECT_EQ(provider.ResolveRoot(leaf.ToPEM() + signer_root), signer_root);
}
