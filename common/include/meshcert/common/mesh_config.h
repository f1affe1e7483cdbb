/**
 * @file mesh_config.h
 * @brief Mesh configuration loading, update fan-out and signer root lookup
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_MESH_CONFIG_H
#define MESHCERT_MESH_CONFIG_H

#include "mesh_config.pb.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace meshcert {

/**
 * @brief Parse a mesh config from its protobuf JSON mapping
 * @throws ConfigError on malformed JSON or unknown fields
 */
config::MeshConfig ParseMeshConfigJSON(const std::string& json);

/**
 * @brief Load a mesh config file (JSON, or binary protobuf)
 *
 * A file whose first non-blank character is '{' is parsed as JSON.
 *
 * @throws ConfigError if the file cannot be read or parsed
 */
config::MeshConfig LoadMeshConfigFile(const std::string& path);

std::string MeshConfigToJSON(const config::MeshConfig& mesh_config);

/**
 * @brief Every PEM root carried by the mesh config, in entry order
 *
 * Entries that only name a SPIFFE bundle URL are skipped.
 */
std::vector<std::string> RootsFromMeshConfig(const config::MeshConfig& mesh_config);

/**
 * @brief Signer name to root certificate lookup
 *
 * Each CA certificate entry of the mesh config is keyed by its signers
 * joined with ",", so one root may serve several signers. Entries without
 * signers or without a PEM are ignored. Thread-safe.
 */
class MeshRootCatalog {
public:
    /**
     * @brief Replace the catalog with the entries of a mesh config push
     */
    void SetCACertificatesFromMeshConfig(
        const google::protobuf::RepeatedPtrField<config::CertificateData>& ca_certificates);

    /**
     * @brief Root certificate PEM for a signer
     * @throws CertError RootNotFound if no entry is configured or none lists the signer
     */
    std::string GetRootCertFromMeshConfig(const std::string& signer_name) const;

    bool Empty() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> roots_by_signers_;
};

/**
 * @brief Holder of the current mesh config with update handlers
 *
 * Handlers run synchronously on the updating thread, in registration order.
 */
class MeshConfigWatcher {
public:
    using Handler = std::function<void(const config::MeshConfig&)>;

    MeshConfigWatcher() = default;
    explicit MeshConfigWatcher(config::MeshConfig initial);

    config::MeshConfig Get() const;

    /**
     * @brief Store a new mesh config and run every handler with it
     */
    void Update(const config::MeshConfig& mesh_config);

    void AddHandler(Handler handler);

private:
    mutable std::mutex mutex_;
    config::MeshConfig current_;
    std::vector<Handler> handlers_;
};

/**
 * @brief Keep a root catalog in sync with a mesh config watcher
 *
 * Loads the watcher's current config into the catalog and registers a
 * handler for later pushes. The catalog must outlive the watcher.
 */
void BindRootCatalog(MeshConfigWatcher& watcher, MeshRootCatalog& catalog);

} // namespace meshcert

#endif // MESHCERT_MESH_CONFIG_H
