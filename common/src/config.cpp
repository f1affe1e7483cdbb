/**
 * @file config.cpp
 * @brief Agent configuration (JSON)
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/config.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace meshcert {

const char* ProviderTypeName(ProviderType type) {
    switch (type) {
        case ProviderType::SelfSigned:
            return "self_signed";
        case ProviderType::KubernetesCSR:
            return "kubernetes_csr";
        case ProviderType::ExternalRA:
            return "external_ra";
        case ProviderType::FileMounted:
            return "file_mounted";
    }
    return "unknown";
}

const char* RootPreferenceName(RootPreference preference) {
    switch (preference) {
        case RootPreference::MeshConfig:
            return "mesh_config";
        case RootPreference::CertChain:
            return "cert_chain";
    }
    return "unknown";
}

namespace {

template <typename T>
void Read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

ProviderType ParseProviderType(const std::string& name) {
    if (name == "self_signed") return ProviderType::SelfSigned;
    if (name == "kubernetes_csr") return ProviderType::KubernetesCSR;
    if (name == "external_ra") return ProviderType::ExternalRA;
    if (name == "file_mounted") return ProviderType::FileMounted;
    throw ConfigError("Unknown provider: " + name);
}

RootPreference ParseRootPreference(const std::string& name) {
    if (name == "mesh_config") return RootPreference::MeshConfig;
    if (name == "cert_chain") return RootPreference::CertChain;
    throw ConfigError("Unknown root_preference: " + name);
}

void ReadCsrSettings(const json& j, std::string& signer_name, std::string& signer_domain,
                     std::string& ca_cert_file, bool& approve, int64_t& poll_interval_ms,
                     int64_t& timeout_seconds, std::string& local_signer_root) {
    Read(j, "signer_name", signer_name);
    Read(j, "signer_domain", signer_domain);
    Read(j, "ca_cert_file", ca_cert_file);
    Read(j, "approve", approve);
    Read(j, "poll_interval_ms", poll_interval_ms);
    Read(j, "timeout_seconds", timeout_seconds);
    Read(j, "local_signer_root", local_signer_root);
}

void Validate(const AgentConfig& config) {
    if (config.ttl_seconds <= 0) {
        throw ConfigError("ttl_seconds must be positive");
    }
    if (config.grace_period_ratio <= 0.0 || config.grace_period_ratio > 1.0) {
        throw ConfigError("grace_period_ratio must be in (0, 1]");
    }
    if (config.min_grace_period_seconds < 0) {
        throw ConfigError("min_grace_period_seconds must not be negative");
    }
    if (config.retry_backoff_ms <= 0) {
        throw ConfigError("retry_backoff_ms must be positive");
    }
    if (config.root_poll_interval_seconds <= 0) {
        throw ConfigError("root_poll_interval_seconds must be positive");
    }

    switch (config.provider) {
        case ProviderType::SelfSigned:
            if (config.self_signed.ca_cert_file.empty() || config.self_signed.ca_key_file.empty()) {
                throw ConfigError("self_signed requires ca_cert_file and ca_key_file");
            }
            break;
        case ProviderType::KubernetesCSR:
            if (config.kubernetes_csr.signer_name.empty() && config.kubernetes_csr.ca_cert_file.empty()) {
                throw ConfigError("kubernetes_csr requires signer_name or ca_cert_file");
            }
            break;
        case ProviderType::ExternalRA:
            if (config.external_ra.signer_name.empty()) {
                throw ConfigError("external_ra requires signer_name");
            }
            break;
        case ProviderType::FileMounted:
            if (config.file_mounted.key_file.empty() || config.file_mounted.cert_file.empty()) {
                throw ConfigError("file_mounted requires key_file and cert_file");
            }
            break;
    }

    if (config.provider != ProviderType::FileMounted && config.dns_names.empty()) {
        throw ConfigError("dns_names must not be empty");
    }
}

} // anonymous namespace

AgentConfig ParseAgentConfig(const std::string& json_text) {
    AgentConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw ConfigError("Agent config must be a JSON object");
        }

        if (j.contains("provider")) {
            config.provider = ParseProviderType(j["provider"].get<std::string>());
        }
        Read(j, "dns_names", config.dns_names);
        Read(j, "ttl_seconds", config.ttl_seconds);
        Read(j, "for_ca", config.for_ca);
        Read(j, "grace_period_ratio", config.grace_period_ratio);
        Read(j, "min_grace_period_seconds", config.min_grace_period_seconds);
        Read(j, "retry_backoff_ms", config.retry_backoff_ms);
        Read(j, "root_poll_interval_seconds", config.root_poll_interval_seconds);
        Read(j, "multi_root_mesh", config.multi_root_mesh);
        Read(j, "mesh_config_file", config.mesh_config_file);
        Read(j, "output_dir", config.output_dir);

        if (j.contains("self_signed")) {
            const json& s = j["self_signed"];
            Read(s, "ca_cert_file", config.self_signed.ca_cert_file);
            Read(s, "ca_key_file", config.self_signed.ca_key_file);
            Read(s, "root_cert_file", config.self_signed.root_cert_file);
            Read(s, "backdate_seconds", config.self_signed.backdate_seconds);
            Read(s, "generate_if_missing", config.self_signed.generate_if_missing);
            Read(s, "org", config.self_signed.org);
        }

        if (j.contains("kubernetes_csr")) {
            auto& k = config.kubernetes_csr;
            ReadCsrSettings(j["kubernetes_csr"], k.signer_name, k.signer_domain, k.ca_cert_file,
                            k.approve, k.poll_interval_ms, k.timeout_seconds, k.local_signer_root);
        }

        if (j.contains("external_ra")) {
            const json& r = j["external_ra"];
            auto& ra = config.external_ra;
            ReadCsrSettings(r, ra.signer_name, ra.signer_domain, ra.ca_cert_file,
                            ra.approve, ra.poll_interval_ms, ra.timeout_seconds, ra.local_signer_root);
            Read(r, "cert_chain_file", ra.cert_chain_file);
            Read(r, "max_ttl_seconds", ra.max_ttl_seconds);
            Read(r, "allow_ca", ra.allow_ca);
            if (r.contains("root_preference")) {
                ra.root_preference = ParseRootPreference(r["root_preference"].get<std::string>());
            }
        }

        if (j.contains("file_mounted")) {
            const json& f = j["file_mounted"];
            Read(f, "key_file", config.file_mounted.key_file);
            Read(f, "cert_file", config.file_mounted.cert_file);
            Read(f, "root_file", config.file_mounted.root_file);
            Read(f, "debounce_ms", config.file_mounted.debounce_ms);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid agent config: ") + e.what());
    }

    Validate(config);
    return config;
}

AgentConfig LoadAgentConfig(const std::string& path) {
    std::string contents;
    try {
        contents = ReadFile(path);
    } catch (const CertError& e) {
        throw ConfigError(std::string("Failed to read agent config: ") + e.what());
    }
    return ParseAgentConfig(contents);
}

} // namespace meshcert
