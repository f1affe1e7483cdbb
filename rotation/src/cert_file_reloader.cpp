/**
 * @file cert_file_reloader.cpp
 * @brief Republishes file-mounted identities when the files change
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/cert_file_reloader.h"
#include "meshcert/common/errors.h"
#include <glog/logging.h>

namespace meshcert {
namespace rotation {

CertFileReloader::CertFileReloader(BundleWatcher& watcher, FileWatcher& file_watcher,
                                   std::string key_file, std::string cert_file,
                                   std::string root_file, std::chrono::milliseconds debounce)
    : watcher_(watcher)
    , file_watcher_(file_watcher)
    , key_file_(std::move(key_file))
    , cert_file_(std::move(cert_file))
    , root_file_(std::move(root_file))
    , debounce_(debounce) {}

CertFileReloader::~CertFileReloader() {
    Stop();
}

void CertFileReloader::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
    }

    auto bundle = watcher_.SetFromFilesAndNotify(key_file_, cert_file_, root_file_);
    LOG(INFO) << "Loaded identity from " << cert_file_ << ", serial " << bundle->SerialNumber();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
        stop_ = false;
    }
    thread_ = std::thread(&CertFileReloader::DebounceLoop, this);

    auto on_change = [this](const std::string& path) { OnChange(path); };
    file_watcher_.Add(cert_file_, on_change);
    file_watcher_.Add(key_file_, on_change);
    if (!root_file_.empty()) {
        file_watcher_.Add(root_file_, on_change);
    }
}

void CertFileReloader::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();

    file_watcher_.Remove(cert_file_);
    file_watcher_.Remove(key_file_);
    if (!root_file_.empty()) {
        file_watcher_.Remove(root_file_);
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

uint64_t CertFileReloader::ReloadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reloads_;
}

uint64_t CertFileReloader::FailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void CertFileReloader::OnChange(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        VLOG(1) << "Certificate file changed: " << path;
        // Later events within the window do not extend it
        if (pending_) {
            return;
        }
        pending_ = true;
        deadline_ = std::chrono::steady_clock::now() + debounce_;
    }
    cv_.notify_all();
}

void CertFileReloader::Reload() {
    try {
        auto bundle = watcher_.SetFromFilesAndNotify(key_file_, cert_file_, root_file_);
        LOG(INFO) << "Reloaded identity from " << cert_file_ << ", serial " << bundle->SerialNumber();
    } catch (const CertError& e) {
        LOG(ERROR) << "Reload of " << cert_file_ << " failed (" << ErrorKindName(e.kind())
                   << "), keeping the previous identity: " << e.what();
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;
    }
}

void CertFileReloader::DebounceLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!stop_) {
        cv_.wait(lock, [this] { return stop_ || pending_; });
        if (stop_) {
            break;
        }

        if (cv_.wait_until(lock, deadline_, [this] { return stop_; })) {
            break;
        }
        pending_ = false;
        ++reloads_;

        lock.unlock();
        Reload();
        lock.lock();
    }
}

} // namespace rotation
} // namespace meshcert
