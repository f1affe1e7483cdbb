/**
 * @file meshcert_create_ca.cpp
 * @brief Tool for creating mesh CA material (root or intermediate)
 *
 * Writes a CA certificate and its ECDSA P-256 key in the layout the agent
 * loads (ca-cert.pem / ca-key.pem), optionally signed by a parent CA.
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/common/crypto.h"
#include "meshcert/common/file_util.h"
#include <glog/logging.h>
#include <chrono>
#include <iostream>

using namespace meshcert;

void PrintUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Create a mesh CA (self-signed root or intermediate)\n"
              << "\n"
              << "Required:\n"
              << "  --cert-out FILE        Output CA certificate (PEM)\n"
              << "  --key-out FILE         Output CA private key (PEM, mode 0600)\n"
              << "\n"
              << "Optional:\n"
              << "  --org NAME             Organization, also the CN (default: cluster.local)\n"
              << "  --sign-with FILE       Parent CA certificate (creates an intermediate)\n"
              << "  --sign-with-key FILE   Parent CA private key\n"
              << "  --root-out FILE        Copy the parent certificate here (root-cert.pem)\n"
              << "  --validity-days DAYS   Validity (default: 3650 for root, 1095 for intermediate)\n"
              << "  --help                 Show this help\n"
              << "\n"
              << "Examples:\n"
              << "  # Self-signed root\n"
              << "  meshcert-create-ca --cert-out root-cert.pem --key-out root-key.pem\n"
              << "\n"
              << "  # Plugged-in intermediate\n"
              << "  meshcert-create-ca --cert-out ca-cert.pem --key-out ca-key.pem \\\n"
              << "                     --sign-with root-cert.pem --sign-with-key root-key.pem \\\n"
              << "                     --root-out root-cert.pem\n";
}

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1;
    FLAGS_minloglevel = 2;  // ERROR level by default

    std::string cert_out;
    std::string key_out;
    std::string org = "cluster.local";
    std::string sign_with_path;
    std::string sign_with_key_path;
    std::string root_out;
    int validity_days = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--cert-out" && i + 1 < argc) {
            cert_out = argv[++i];
        } else if (arg == "--key-out" && i + 1 < argc) {
            key_out = argv[++i];
        } else if (arg == "--org" && i + 1 < argc) {
            org = argv[++i];
        } else if (arg == "--sign-with" && i + 1 < argc) {
            sign_with_path = argv[++i];
        } else if (arg == "--sign-with-key" && i + 1 < argc) {
            sign_with_key_path = argv[++i];
        } else if (arg == "--root-out" && i + 1 < argc) {
            root_out = argv[++i];
        } else if (arg == "--validity-days" && i + 1 < argc) {
            validity_days = std::stoi(argv[++i]);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (cert_out.empty() || key_out.empty()) {
        std::cerr << "Error: Missing required arguments\n\n";
        PrintUsage(argv[0]);
        return 1;
    }
    if (sign_with_path.empty() != sign_with_key_path.empty()) {
        std::cerr << "Error: --sign-with and --sign-with-key must be given together\n\n";
        PrintUsage(argv[0]);
        return 1;
    }

    const bool is_intermediate = !sign_with_path.empty();
    if (validity_days == 0) {
        validity_days = is_intermediate ? 1095 : 3650;
    }
    const std::chrono::seconds ttl(static_cast<int64_t>(validity_days) * 24 * 3600);

    try {
        auto key = crypto::PrivateKey::Generate(crypto::KeyType::EcdsaP256);
        auto pubkey = crypto::PublicKey::FromPrivateKey(key);

        crypto::Certificate ca_cert;
        if (is_intermediate) {
            auto parent_cert = crypto::Certificate::LoadFromFile(sign_with_path);
            auto parent_key = crypto::PrivateKey::LoadFromFile(sign_with_key_path);
            ca_cert = crypto::CreateCACertificate(parent_key, pubkey, org, ttl, &parent_cert);
            if (!root_out.empty()) {
                WriteFileAtomic(root_out, parent_cert.ToPEM(), 0644);
            }
            std::cout << "Created intermediate CA certificate:\n";
        } else {
            ca_cert = crypto::CreateCACertificate(key, pubkey, org, ttl);
            if (!root_out.empty()) {
                WriteFileAtomic(root_out, ca_cert.ToPEM(), 0644);
            }
            std::cout << "Created self-signed root CA certificate:\n";
        }

        WriteFileAtomic(key_out, key.ToPEM(), 0600);
        WriteFileAtomic(cert_out, ca_cert.ToPEM(), 0644);

        std::cout << "  Organization: " << org << "\n"
                  << "  Serial: " << ca_cert.GetSerialNumber() << "\n"
                  << "  Validity: " << validity_days << " days\n"
                  << "  Certificate: " << cert_out << "\n"
                  << "  Key: " << key_out << "\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
