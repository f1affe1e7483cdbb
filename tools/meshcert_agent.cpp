/**
 * @file meshcert_agent.cpp
 * @brief Identity agent: issues, rotates and distributes the mesh identity
 *
 * Production workflow:
 * 1. meshcert-create-ca --cert-out ca-cert.pem --key-out ca-key.pem
 * 2. meshcert-agent --config agent.json
 * 3. Consumers read key.pem / cert-chain.pem / root-cert.pem from the
 *    output directory; they are replaced atomically on every rotation.
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/ca/cert_provider.h"
#include "meshcert/common/config.h"
#include "meshcert/common/errors.h"
#include "meshcert/common/file_util.h"
#include "meshcert/common/mesh_config.h"
#include "meshcert/rotation/bundle_watcher.h"
#include "meshcert/rotation/cert_file_reloader.h"
#include "meshcert/rotation/file_watcher.h"
#include "meshcert/rotation/rotation_scheduler.h"
#include "meshcert/rotation/tls_context_provider.h"
#include "meshcert/rotation/trust_anchor_aggregator.h"
#include <glog/logging.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace meshcert;

namespace {

std::atomic<bool> g_shutdown{false};

void SignalHandler(int) {
    g_shutdown = true;
}

void PrintUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Issue the workload identity and keep it rotated\n"
              << "\n"
              << "Required:\n"
              << "  --config FILE          Agent configuration (JSON)\n"
              << "\n"
              << "Optional:\n"
              << "  --output-dir DIR       Write key.pem, cert-chain.pem and root-cert.pem here\n"
              << "                         (overrides output_dir of the configuration)\n"
              << "  --once                 Issue one identity, write it and exit\n"
              << "  --verbose              Log at INFO level and enable VLOG(1)\n"
              << "  --help                 Show this help\n"
              << "\n"
              << "Example:\n"
              << "  meshcert-agent --config /etc/meshcert/agent.json --output-dir /var/run/secrets/mesh\n";
}

rotation::TrustAnchorSource AnchorSourceFor(ProviderType type) {
    switch (type) {
        case ProviderType::SelfSigned:
            return rotation::TrustAnchorSource::SelfManagedCA;
        case ProviderType::KubernetesCSR:
            return rotation::TrustAnchorSource::Kubernetes;
        case ProviderType::ExternalRA:
            return rotation::TrustAnchorSource::ExternalRA;
        case ProviderType::FileMounted:
            return rotation::TrustAnchorSource::FileMounted;
    }
    return rotation::TrustAnchorSource::SelfManagedCA;
}

rotation::RotationOptions RotationOptionsFor(const AgentConfig& config) {
    rotation::RotationOptions options;
    options.names = config.dns_names;
    options.ttl = std::chrono::seconds(config.ttl_seconds);
    options.for_ca = config.for_ca;
    options.grace_period_ratio = config.grace_period_ratio;
    options.min_grace_period = std::chrono::seconds(config.min_grace_period_seconds);
    options.retry_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
    options.root_poll_interval = std::chrono::seconds(config.root_poll_interval_seconds);
    options.anchor_source = AnchorSourceFor(config.provider);
    return options;
}

// Persist a bundle in the layout sidecars mount
void WriteBundle(const std::string& dir, const KeyCertBundle& bundle) {
    WriteFileAtomic(dir + "/key.pem", bundle.KeyPem(), 0600);
    WriteFileAtomic(dir + "/cert-chain.pem", bundle.CertChainPem(), 0644);
    if (!bundle.RootPem().empty()) {
        WriteFileAtomic(dir + "/root-cert.pem", bundle.RootPem(), 0644);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    FLAGS_minloglevel = 1;  // WARNING level by default

    std::string config_path;
    std::string output_dir;
    bool once = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--verbose") {
            FLAGS_minloglevel = 0;
            FLAGS_v = 1;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        std::cerr << "Error: Missing required arguments\n\n";
        PrintUsage(argv[0]);
        return 1;
    }

    AgentConfig config;
    MeshConfigWatcher mesh_watcher;
    try {
        config = LoadAgentConfig(config_path);
        if (!config.mesh_config_file.empty()) {
            mesh_watcher.Update(LoadMeshConfigFile(config.mesh_config_file));
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    if (output_dir.empty()) {
        output_dir = config.output_dir;
    }

    LOG(INFO) << "Starting meshcert agent with provider " << ProviderTypeName(config.provider);

    MeshRootCatalog catalog;
    BindRootCatalog(mesh_watcher, catalog);

    rotation::TrustAnchorAggregator aggregator(config.multi_root_mesh);
    BindMeshConfigAnchors(mesh_watcher, aggregator, config.multi_root_mesh);

    ca::ProviderDependencies deps;
    deps.root_catalog = &catalog;

    ca::ProviderHandle handle;
    try {
        handle = ca::CreateCertProvider(config, deps);
    } catch (const CertError& e) {
        // The only fatal failure: without a CA nothing can be issued
        LOG(ERROR) << "Failed to initialize certificate provider (" << ErrorKindName(e.kind())
                   << "): " << e.what();
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    rotation::BundleWatcher watcher;
    if (!output_dir.empty()) {
        watcher.Subscribe([output_dir](const KeyCertBundlePtr& bundle) {
            WriteBundle(output_dir, *bundle);
            VLOG(1) << "Wrote identity to " << output_dir;
        });
    }

    if (once) {
        try {
            auto bundle = handle.provider->Issue(config.dns_names, std::chrono::seconds(config.ttl_seconds),
                                                 config.for_ca);
            watcher.Publish(bundle);
            std::cout << "Issued certificate:\n"
                      << "  Subject: " << bundle->Subject() << "\n"
                      << "  Serial: " << bundle->SerialNumber() << "\n"
                      << "  Valid: " << bundle->NotBefore() << " to " << bundle->NotAfter() << "\n";
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    rotation::InotifyFileWatcher file_watcher;
    std::unique_ptr<rotation::RotationScheduler> scheduler;
    std::unique_ptr<rotation::CertFileReloader> reloader;
    std::unique_ptr<rotation::TlsContextProvider> tls;

    try {
        file_watcher.Start();
        tls = std::make_unique<rotation::TlsContextProvider>(watcher);

        if (config.provider == ProviderType::FileMounted) {
            reloader = std::make_unique<rotation::CertFileReloader>(
                watcher, file_watcher, config.file_mounted.key_file, config.file_mounted.cert_file,
                config.file_mounted.root_file, std::chrono::milliseconds(config.file_mounted.debounce_ms));
            reloader->Start();
        } else {
            scheduler = std::make_unique<rotation::RotationScheduler>(*handle.provider, watcher,
                                                                     RotationOptionsFor(config), &aggregator);
            rotation::RotationScheduler* s = scheduler.get();
            mesh_watcher.AddHandler([s](const config::MeshConfig&) { s->TriggerRootCheck(); });
            aggregator.AddListener([s](const std::vector<std::string>&) { s->TriggerTrustRefresh(); });
            scheduler->Start();
        }

        if (!config.mesh_config_file.empty()) {
            file_watcher.Add(config.mesh_config_file, [&mesh_watcher](const std::string& path) {
                try {
                    mesh_watcher.Update(LoadMeshConfigFile(path));
                    LOG(INFO) << "Mesh config reloaded from " << path;
                } catch (const ConfigError& e) {
                    LOG(ERROR) << "Ignoring mesh config update: " << e.what();
                }
            });
        }
    } catch (const CertError& e) {
        LOG(ERROR) << "Startup failed (" << ErrorKindName(e.kind()) << "): " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Startup failed: " << e.what();
        return 1;
    }

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG(INFO) << "Shutting down";
    if (scheduler) {
        scheduler->Stop();
    }
    if (reloader) {
        reloader->Stop();
    }
    file_watcher.Stop();
    return 0;
}
