/**
 * @file file_watcher.cpp
 * @brief inotify based change notification for certificate files
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "meshcert/rotation/file_watcher.h"
#include "meshcert/common/errors.h"
#include <glog/logging.h>
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace meshcert {
namespace rotation {

namespace {

constexpr uint32_t kWatchMask = IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE | IN_MOVED_TO | IN_DELETE;

// Kubernetes projects secret volumes through this symlink
const char* const kDataLink = "..data";

std::pair<std::string, std::string> SplitPath(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return {".", path};
    }
    if (pos == 0) {
        return {"/", path.substr(1)};
    }
    return {path.substr(0, pos), path.substr(pos + 1)};
}

} // anonymous namespace

InotifyFileWatcher::InotifyFileWatcher() = default;

InotifyFileWatcher::~InotifyFileWatcher() {
    Stop();
}

void InotifyFileWatcher::Start() {
    if (running_) {
        return;
    }

    fd_ = inotify_init1(IN_NONBLOCK);
    if (fd_ < 0) {
        throw CertError(ErrorKind::IOError, std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    running_ = true;
    thread_ = std::thread(&InotifyFileWatcher::MonitorLoop, this);
    VLOG(1) << "inotify watcher started";
}

void InotifyFileWatcher::Stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    dirs_.clear();
}

void InotifyFileWatcher::Add(const std::string& path, Callback callback) {
    const auto parts = SplitPath(path);

    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        throw CertError(ErrorKind::IOError, "cannot watch " + path + ": watcher not started");
    }

    auto& dir = dirs_[parts.first];
    if (dir.wd < 0) {
        dir.wd = inotify_add_watch(fd_, parts.first.c_str(), kWatchMask);
        if (dir.wd < 0) {
            const int err = errno;
            dirs_.erase(parts.first);
            throw CertError(ErrorKind::IOError,
                            "cannot watch " + parts.first + ": " + std::strerror(err));
        }
        LOG(INFO) << "Watching directory " << parts.first;
    }
    dir.files[parts.second] = std::move(callback);
}

void InotifyFileWatcher::Remove(const std::string& path) {
    const auto parts = SplitPath(path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = dirs_.find(parts.first);
    if (it == dirs_.end()) {
        return;
    }

    it->second.files.erase(parts.second);
    if (it->second.files.empty()) {
        if (fd_ >= 0 && inotify_rm_watch(fd_, it->second.wd) < 0) {
            LOG(WARNING) << "inotify_rm_watch(" << parts.first << ") failed: " << std::strerror(errno);
        }
        dirs_.erase(it);
    }
}

void InotifyFileWatcher::NotifyAll() {
    std::vector<std::pair<std::string, Callback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& dir : dirs_) {
            for (const auto& file : dir.second.files) {
                targets.emplace_back(dir.first + "/" + file.first, file.second);
            }
        }
    }
    Deliver(targets);
}

void InotifyFileWatcher::Dispatch(int wd, const std::string& name) {
    std::vector<std::pair<std::string, Callback>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& dir : dirs_) {
            if (dir.second.wd != wd) {
                continue;
            }
            for (const auto& file : dir.second.files) {
                if (name == kDataLink || name == file.first) {
                    targets.emplace_back(dir.first + "/" + file.first, file.second);
                }
            }
        }
    }

    Deliver(targets);
}

void InotifyFileWatcher::Deliver(const std::vector<std::pair<std::string, Callback>>& targets) {
    for (const auto& target : targets) {
        VLOG(1) << "Change event for " << target.first;
        try {
            target.second(target.first);
        } catch (const std::exception& e) {
            LOG(ERROR) << "File watch callback for " << target.first << " failed: " << e.what();
        }
    }
}

void InotifyFileWatcher::MonitorLoop() {
    constexpr size_t kBufferSize = 64 * (sizeof(struct inotify_event) + 256);
    alignas(struct inotify_event) char buffer[kBufferSize];

    while (running_) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd_, &fds);

        // Short timeout so Stop() is noticed promptly
        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100000;

        int ret = select(fd_ + 1, &fds, nullptr, nullptr, &timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG(ERROR) << "select on inotify failed: " << std::strerror(errno);
            break;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t length = read(fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            LOG(ERROR) << "inotify read failed: " << std::strerror(errno);
            break;
        }

        ssize_t offset = 0;
        while (offset < length) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
            if (event->mask & IN_Q_OVERFLOW) {
                LOG(WARNING) << "inotify queue overflow, reporting every watched file as changed";
                NotifyAll();
            } else if (event->len > 0) {
                Dispatch(event->wd, event->name);
            }
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + event->len);
        }
    }
    VLOG(1) << "inotify monitor loop exited";
}

} // namespace rotation
} // namespace meshcert
