/**
 * @file mesh_config.cpp
 * @brief Mesh configuration loading, update fan-out and signer root lookup
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/mesh_config.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>
#include <cctype>
#include <sstream>

namespace meshcert {

config::MeshConfig ParseMeshConfigJSON(const std::string& json) {
    config::MeshConfig mesh_config;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &mesh_config, options);
    if (!status.ok()) {
        throw ConfigError("Failed to parse mesh config JSON: " + std::string(status.message()));
    }
    return mesh_config;
}

config::MeshConfig LoadMeshConfigFile(const std::string& path) {
    std::string contents;
    try {
        contents = ReadFile(path);
    } catch (const CertError& e) {
        throw ConfigError(std::string("Failed to read mesh config: ") + e.what());
    }

    for (char c : contents) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '{') {
            return ParseMeshConfigJSON(contents);
        }
        break;
    }

    config::MeshConfig mesh_config;
    if (!mesh_config.ParseFromString(contents)) {
        throw ConfigError("Failed to parse protobuf mesh config: " + path);
    }
    return mesh_config;
}

std::string MeshConfigToJSON(const config::MeshConfig& mesh_config) {
    std::string json_string;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;

    auto status = google::protobuf::util::MessageToJsonString(mesh_config, &json_string, options);
    if (!status.ok()) {
        throw ConfigError("Failed to convert mesh config to JSON: " + std::string(status.message()));
    }
    return json_string;
}

std::vector<std::string> RootsFromMeshConfig(const config::MeshConfig& mesh_config) {
    std::vector<std::string> roots;
    for (const auto& entry : mesh_config.ca_certificates()) {
        if (entry.certificate_data_case() == config::CertificateData::kPem && !entry.pem().empty()) {
            roots.push_back(entry.pem());
        }
    }
    return roots;
}

// ============================================================================
// MeshRootCatalog
// ============================================================================

void MeshRootCatalog::SetCACertificatesFromMeshConfig(
    const google::protobuf::RepeatedPtrField<config::CertificateData>& ca_certificates) {
    std::map<std::string, std::string> roots;

    for (const auto& entry : ca_certificates) {
        // SPIFFE bundle endpoints are not resolved here
        if (entry.pem().empty() || entry.cert_signers().empty()) {
            continue;
        }

        std::string signers;
        for (const auto& signer : entry.cert_signers()) {
            if (!signers.empty()) {
                signers += ",";
            }
            signers += signer;
        }
        roots[signers] = entry.pem();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    roots_by_signers_ = std::move(roots);
    VLOG(1) << "Mesh root catalog holds " << roots_by_signers_.size() << " signer entries";
}

std::string MeshRootCatalog::GetRootCertFromMeshConfig(const std::string& signer_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (roots_by_signers_.empty()) {
        throw CertError(ErrorKind::RootNotFound, "no caCertificates defined in mesh config");
    }

    for (const auto& entry : roots_by_signers_) {
        std::istringstream signers(entry.first);
        std::string signer;
        while (std::getline(signers, signer, ',')) {
            if (signer == signer_name) {
                return entry.second;
            }
        }
    }

    throw CertError(ErrorKind::RootNotFound,
                    "failed to find root cert for signer: " + signer_name + " in mesh config");
}

bool MeshRootCatalog::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roots_by_signers_.empty();
}

// ============================================================================
// MeshConfigWatcher
// ============================================================================

MeshConfigWatcher::MeshConfigWatcher(config::MeshConfig initial)
    : current_(std::move(initial)) {}

config::MeshConfig MeshConfigWatcher::Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void MeshConfigWatcher::Update(const config::MeshConfig& mesh_config) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = mesh_config;
        handlers = handlers_;
    }

    LOG(INFO) << "Mesh config updated: " << mesh_config.ca_certificates_size()
              << " CA certificate entries, multi_root_mesh=" << mesh_config.multi_root_mesh();

    for (const auto& handler : handlers) {
        handler(mesh_config);
    }
}

void MeshConfigWatcher::AddHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void BindRootCatalog(MeshConfigWatcher& watcher, MeshRootCatalog& catalog) {
    catalog.SetCACertificatesFromMeshConfig(watcher.Get().ca_certificates());
    watcher.AddHandler([&catalog](const config::MeshConfig& mesh_config) {
        catalog.SetCACertificatesFromMeshConfig(mesh_config.ca_certificates());
    });
}

} // namespace meshcert
