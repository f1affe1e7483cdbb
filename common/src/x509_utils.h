/**
 * @file x509_utils.h
 * @brief Shared X.509 helpers for certificates and requests
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_X509_UTILS_H
#define MESHCERT_X509_UTILS_H

#include "meshcert/common/crypto.h"
#include "openssl_wrappers.h"
#include <openssl/asn1.h>
#include <openssl/x509v3.h>
#include <ctime>
#include <string>
#include <vector>

namespace meshcert {
namespace crypto {
namespace internal {

// URI SANs carry SPIFFE identities, everything else is a DNS name
constexpr const char* SPIFFE_URI_PREFIX = "spiffe://";

inline std::vector<std::string> GeneralNamesToStrings(const GENERAL_NAMES* names) {
    std::vector<std::string> result;
    if (!names) {
        return result;
    }

    for (int i = 0; i < sk_GENERAL_NAME_num(names); i++) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names, i);
        if (name->type == GEN_DNS || name->type == GEN_URI) {
            const ASN1_IA5STRING* value = (name->type == GEN_DNS) ? name->d.dNSName : name->d.uniformResourceIdentifier;
            result.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)),
                                static_cast<size_t>(ASN1_STRING_length(value)));
        }
    }
    return result;
}

// "DNS:a,URI:spiffe://b" value for X509V3_EXT_conf_nid
inline std::string SubjectAltNameValue(const std::vector<std::string>& names) {
    std::string value;
    for (const auto& name : names) {
        if (!value.empty()) {
            value += ",";
        }
        if (name.rfind(SPIFFE_URI_PREFIX, 0) == 0) {
            value += "URI:" + name;
        } else {
            value += "DNS:" + name;
        }
    }
    return value;
}

inline int64_t AsnTimeToEpoch(const ASN1_TIME* time) {
    if (!time) {
        throw CryptoError("Missing certificate time field");
    }

    struct tm tm_time = {};
    if (!ASN1_TIME_to_tm(time, &tm_time)) {
        throw CryptoError("Failed to convert ASN1_TIME to tm");
    }

    return static_cast<int64_t>(timegm(&tm_time));
}

inline std::string NameToString(const X509_NAME* name) {
    char* str = X509_NAME_oneline(name, nullptr, 0);
    if (!str) {
        throw CryptoError("Failed to format X.509 name");
    }
    std::string result(str);
    OPENSSL_free(str);
    return result;
}

inline X509_NAME_ptr BuildSubjectName(const CertificateOptions& options) {
    X509_NAME_ptr name(X509_NAME_new());
    if (!name) {
        throw CryptoError("Failed to allocate X509_NAME");
    }

    if (!options.org.empty()) {
        X509_NAME_add_entry_by_txt(name.get(), "O", MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(options.org.c_str()), -1, -1, 0);
    }

    std::string cn = options.common_name;
    if (cn.empty() && !options.dns_names.empty() && options.dns_names.front().rfind(SPIFFE_URI_PREFIX, 0) != 0) {
        cn = options.dns_names.front();
    }
    // CN is capped at 64 characters by RFC 5280
    if (!cn.empty() && cn.size() <= 64) {
        X509_NAME_add_entry_by_txt(name.get(), "CN", MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    }

    return name;
}

} // namespace internal
} // namespace crypto
} // namespace meshcert

#endif // MESHCERT_X509_UTILS_H
