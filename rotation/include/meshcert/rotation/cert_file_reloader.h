/**
 * @file cert_file_reloader.h
 * @brief Republishes file-mounted identities when the files change
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_CERT_FILE_RELOADER_H
#define MESHCERT_CERT_FILE_RELOADER_H

#include "meshcert/rotation/bundle_watcher.h"
#include "meshcert/rotation/file_watcher.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace meshcert {
namespace rotation {

/**
 * @brief Debounced reload of key, certificate and root files
 *
 * The first change event arms a timer of one debounce window; events that
 * arrive while it is armed are folded into the same reload. A reload that
 * fails (half-written files, mismatched key) is logged and the previous
 * bundle stays published until the next event.
 */
class CertFileReloader {
public:
    CertFileReloader(BundleWatcher& watcher, FileWatcher& file_watcher,
                     std::string key_file, std::string cert_file, std::string root_file,
                     std::chrono::milliseconds debounce = std::chrono::milliseconds(1000));
    ~CertFileReloader();

    CertFileReloader(const CertFileReloader&) = delete;
    CertFileReloader& operator=(const CertFileReloader&) = delete;

    /**
     * @brief Load and publish the files, then start watching them
     * @throws CertError if the initial load fails
     */
    void Start();
    void Stop();

    /**
     * @brief Number of debounced reload attempts since Start()
     */
    uint64_t ReloadCount() const;

    uint64_t FailureCount() const;

private:
    void OnChange(const std::string& path);
    void DebounceLoop();
    void Reload();

    BundleWatcher& watcher_;
    FileWatcher& file_watcher_;
    const std::string key_file_;
    const std::string cert_file_;
    const std::string root_file_;
    const std::chrono::milliseconds debounce_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_ = false;
    bool pending_ = false;
    std::chrono::steady_clock::time_point deadline_;
    uint64_t reloads_ = 0;
    uint64_t failures_ = 0;

    std::thread thread_;
};

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_CERT_FILE_RELOADER_H
