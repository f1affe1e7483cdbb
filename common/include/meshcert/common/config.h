/**
 * @file config.h
 * @brief Agent configuration (JSON)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CONFIG_H
#define MESHCERT_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace meshcert {

enum class ProviderType {
    SelfSigned,
    KubernetesCSR,
    ExternalRA,
    FileMounted
};

/**
 * @brief Which root wins when an external RA chain and the mesh config disagree
 */
enum class RootPreference {
    MeshConfig,  ///< Mesh-config root for the signer, else the chain's self-signed tail
    CertChain    ///< Chain's self-signed tail, else the mesh-config root
};

const char* ProviderTypeName(ProviderType type);
const char* RootPreferenceName(RootPreference preference);

struct SelfSignedConfig {
    std::string ca_cert_file;
    std::string ca_key_file;
    std::string root_cert_file;             ///< Set when the CA is a plugged-in intermediate
    int64_t backdate_seconds = 300;
    bool generate_if_missing = false;       ///< Create a self-signed root when the files are absent
    std::string org = "cluster.local";
};

struct KubernetesCsrConfig {
    std::string signer_name;
    std::string signer_domain;
    std::string ca_cert_file;               ///< Root used when no signer is configured
    bool approve = true;
    int64_t poll_interval_ms = 100;
    int64_t timeout_seconds = 30;
    std::string local_signer_root;          ///< Directory of per-signer CAs for the in-process API
};

struct ExternalRaConfig {
    std::string signer_name;
    std::string signer_domain;
    std::string ca_cert_file;               ///< RA root, skips root resolution when set
    std::string cert_chain_file;            ///< RA intermediates appended to every issued chain
    bool approve = true;
    int64_t poll_interval_ms = 100;
    int64_t timeout_seconds = 30;
    std::string local_signer_root;
    int64_t max_ttl_seconds = 0;            ///< 0 disables the check
    bool allow_ca = false;
    RootPreference root_preference = RootPreference::MeshConfig;
};

struct FileMountedConfig {
    std::string key_file;
    std::string cert_file;
    std::string root_file;
    int64_t debounce_ms = 1000;
};

/**
 * @brief Settings of one identity agent
 *
 * Example:
 * @code
 * {
 *   "provider": "self_signed",
 *   "dns_names": ["istiod.istio-system.svc"],
 *   "ttl_seconds": 86400,
 *   "self_signed": {"ca_cert_file": "ca-cert.pem", "ca_key_file": "ca-key.pem"}
 * }
 * @endcode
 */
struct AgentConfig {
    ProviderType provider = ProviderType::SelfSigned;
    std::vector<std::string> dns_names;
    int64_t ttl_seconds = 24 * 3600;
    bool for_ca = false;

    double grace_period_ratio = 0.5;
    int64_t min_grace_period_seconds = 0;
    int64_t retry_backoff_ms = 10000;
    int64_t root_poll_interval_seconds = 60;

    bool multi_root_mesh = false;
    std::string mesh_config_file;
    std::string output_dir;

    SelfSignedConfig self_signed;
    KubernetesCsrConfig kubernetes_csr;
    ExternalRaConfig external_ra;
    FileMountedConfig file_mounted;
};

/**
 * @brief Parse agent configuration JSON
 *
 * Missing fields keep their defaults. Sub-objects of providers other than
 * the selected one are parsed but not validated.
 *
 * @throws ConfigError on malformed JSON, wrong field types or invalid values
 */
AgentConfig ParseAgentConfig(const std::string& json_text);

/**
 * @brief Read and parse an agent configuration file
 * @throws ConfigError if the file cannot be read or parsed
 */
AgentConfig LoadAgentConfig(const std::string& path);

} // namespace meshcert

#endif // MESHCERT_CONFIG_H
