/**
 * @file cert_provider_test.cpp
 * @brief Unit tests for the self-signed and file-mounted providers and the factory
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "meshcert/ca/cert_provider.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>

using namespace meshcert;
using namespace meshcert::ca;
using namespace meshcert::crypto;
using ::testing::Contains;

// ============================================================================
// Test Fixture
// ============================================================================

class CertProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/meshcert_provider_XXXXXX";
        char* dir = mkdtemp(dir_template);
        ASSERT_NE(dir, nullptr);
        temp_dir = dir;
        cert_file = temp_dir + "/ca-cert.pem";
        key_file = temp_dir + "/ca-key.pem";
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    std::shared_ptr<CaProvider> LoadedCA() {
        GenerateSelfSignedCA(cert_file, key_file, "cluster.local", std::chrono::hours(24));
        auto ca_provider = std::make_shared<CaProvider>(cert_file, key_file);
        ca_provider->Load();
        return ca_provider;
    }

    std::string temp_dir;
    std::string cert_file;
    std::string key_file;
};

// ============================================================================
// SelfSignedProvider Tests
// ============================================================================

TEST_F(CertProviderTest, SelfSignedIssuesVerifiedBundle) {
    SelfSignedProvider provider(LoadedCA());

    auto bundle = provider.Issue({"istiod.istio-system.svc"}, std::chrono::hours(1), false);

    ASSERT_NE(bundle, nullptr);
    EXPECT_NO_THROW(bundle->Verify());
    EXPECT_EQ(bundle->RootPem(), ReadFile(cert_file));
    EXPECT_TRUE(bundle->ChainPem().empty());
    EXPECT_EQ(bundle->NotAfter() - bundle->NotBefore(), 3600 + DEFAULT_BACKDATE.count());

    auto leaf = Certificate::LoadFromPEM(bundle->CertPem());
    EXPECT_THAT(leaf.GetSubjectAltNames(), Contains("istiod.istio-system.svc"));
    EXPECT_STREQ(provider.Name(), "SelfSigned");
}

TEST_F(CertProviderTest, SelfSignedFreshKeyEveryIssue) {
    SelfSignedProvider provider(LoadedCA());

    auto first = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    auto second = provider.Issue({"a.svc"}, std::chrono::hours(1), false);

    EXPECT_NE(first->KeyPem(), second->KeyPem());
    EXPECT_NE(first->SerialNumber(), second->SerialNumber());
}

TEST_F(CertProviderTest, SelfSignedWithoutCAIsUnavailable) {
    SelfSignedProvider provider(std::make_shared<CaProvider>(cert_file, key_file));

    try {
        provider.Issue({"a.svc"}, std::chrono::hours(1), false);
        FAIL() << "Expected CAUnavailable";
    } catch (const CertError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CAUnavailable);
    }
    EXPECT_TRUE(provider.GetRootCertPem().empty());
}

TEST_F(CertProviderTest, SelfSignedIntermediateCarriesChain) {
    auto root_key = PrivateKey::Generate(KeyType::EcdsaP256);
    auto root = CreateCACertificate(root_key, PublicKey::FromPrivateKey(root_key), "root", std::chrono::hours(24));
    auto ca_key = PrivateKey::Generate(KeyType::EcdsaP256);
    auto ca_cert = CreateCACertificate(root_key, PublicKey::FromPrivateKey(ca_key), "intermediate",
                                       std::chrono::hours(24), &root);
    WriteFileAtomic(cert_file, ca_cert.ToPEM());
    WriteFileAtomic(key_file, ca_key.ToPEM(), 0600);
    WriteFileAtomic(temp_dir + "/root-cert.pem", root.ToPEM());

    auto ca_provider = std::make_shared<CaProvider>(cert_file, key_file, temp_dir + "/root-cert.pem");
    ca_provider->Load();
    SelfSignedProvider provider(ca_provider);

    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->ChainPem(), ca_cert.ToPEM());
    EXPECT_EQ(bundle->RootPem(), root.ToPEM());
    EXPECT_EQ(provider.GetRootCertPem(), root.ToPEM());
}

TEST_F(CertProviderTest, SelfSignedFollowsCARotation) {
    auto ca_provider = LoadedCA();
    SelfSignedProvider provider(ca_provider);
    const std::string old_root = provider.GetRootCertPem();

    GenerateSelfSignedCA(cert_file, key_file, "rotated.local", std::chrono::hours(24));

    EXPECT_NE(provider.GetRootCertPem(), old_root);
    auto bundle = provider.Issue({"a.svc"}, std::chrono::hours(1), false);
    EXPECT_EQ(bundle->RootPem(), ReadFile(cert_file));
}

// ============================================================================
// FileMountedProvider Tests
// ============================================================================

TEST_F(CertProviderTest, FileMountedReadsFiles) {
    SelfSignedProvider issuer(LoadedCA());
    auto issued = issuer.Issue({"a.svc"}, std::chrono::hours(1), false);
    WriteFileAtomic(temp_dir + "/key.pem", issued->KeyPem(), 0600);
    WriteFileAtomic(temp_dir + "/cert-chain.pem", issued->CertChainPem());
    WriteFileAtomic(temp_dir + "/root-cert.pem", issued->RootPem());

    FileMountedProvider provider(temp_dir + "/key.pem", temp_dir + "/cert-chain.pem", temp_dir + "/root-cert.pem");

    auto bundle = provider.Issue({}, std::chrono::seconds(0), false);
    EXPECT_EQ(bundle->SerialNumber(), issued->SerialNumber());
    EXPECT_EQ(provider.GetRootCertPem(), issued->RootPem());
}

TEST_F(CertProviderTest, FileMountedMissingFiles) {
    FileMountedProvider provider(temp_dir + "/key.pem", temp_dir + "/cert-chain.pem", temp_dir + "/root-cert.pem");

    try {
        provider.Issue({}, std::chrono::seconds(0), false);
        FAIL() << "Expected IOError";
    } catch (const CertError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOError);
    }
    EXPECT_TRUE(provider.GetRootCertPem().empty());
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST_F(CertProviderTest, FactoryGeneratesMissingCA) {
    AgentConfig config;
    config.provider = ProviderType::SelfSigned;
    config.self_signed.ca_cert_file = cert_file;
    config.self_signed.ca_key_file = key_file;
    config.self_signed.generate_if_missing = true;

    auto handle = CreateCertProvider(config, ProviderDependencies());

    ASSERT_NE(handle.provider, nullptr);
    ASSERT_NE(handle.ca_provider, nullptr);
    EXPECT_TRUE(FileExists(cert_file));
    EXPECT_TRUE(FileExists(key_file));
    EXPECT_EQ(std::filesystem::status(key_file).permissions() & std::filesystem::perms::others_read,
              std::filesystem::perms::none);
    EXPECT_NO_THROW(handle.provider->Issue({"a.svc"}, std::chrono::hours(1), false));
}

TEST_F(CertProviderTest, FactoryFailsWithoutCA) {
    AgentConfig config;
    config.provider = ProviderType::SelfSigned;
    config.self_signed.ca_cert_file = cert_file;
    config.self_signed.ca_key_file = key_file;

    try {
        CreateCertProvider(config, ProviderDependencies());
        FAIL() << "Expected CAInitFail";
    } catch (const CertError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CAInitFail);
    }
}

TEST_F(CertProviderTest, FactoryCsrProviderNeedsClient) {
    AgentConfig config;
    config.provider = ProviderType::KubernetesCSR;
    config.kubernetes_csr.signer_name = "istio-ca";

    EXPECT_THROW(CreateCertProvider(config, ProviderDependencies()), ConfigError);
}

TEST_F(CertProviderTest, FactoryCreatesLocalSigner) {
    AgentConfig config;
    config.provider = ProviderType::ExternalRA;
    config.external_ra.signer_name = "istio-ca";
    config.external_ra.signer_domain = "example.com";
    config.external_ra.local_signer_root = temp_dir;

    auto handle = CreateCertProvider(config, ProviderDependencies());

    ASSERT_NE(handle.provider, nullptr);
    EXPECT_NE(handle.owned_csr_client, nullptr);
    EXPECT_NE(handle.owned_catalog, nullptr);
    EXPECT_STREQ(handle.provider->Name(), "ExternalRA");
}

TEST_F(CertProviderTest, FactoryFileMounted) {
    AgentConfig config;
    config.provider = ProviderType::FileMounted;
    config.file_mounted.key_file = temp_dir + "/key.pem";
    config.file_mounted.cert_file = temp_dir + "/cert-chain.pem";

    auto handle = CreateCertProvider(config, ProviderDependencies());
    EXPECT_STREQ(handle.provider->Name(), "FileMounted");
}
