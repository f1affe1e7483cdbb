/**
 * @file file_watcher.h
 * @brief Change notification for certificate files
 *
 * Copyright 2025 meshcert contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef MESHCERT_FILE_WATCHER_H
#define MESHCERT_FILE_WATCHER_H

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace meshcert {
namespace rotation {

/**
 * @brief Per-path change events
 *
 * Callbacks run on the watcher's own thread.
 */
class FileWatcher {
public:
    using Callback = std::function<void(const std::string& path)>;

    virtual ~FileWatcher() = default;

    /**
     * @brief Watch a file
     * @throws CertError IOError if the path cannot be watched
     */
    virtual void Add(const std::string& path, Callback callback) = 0;

    virtual void Remove(const std::string& path) = 0;
};

/**
 * @brief inotify implementation
 *
 * Watches the parent directory of every file so that replacements by
 * rename are seen. A Kubernetes volume update (swap of the "..data"
 * symlink) is reported for every watched file of that directory.
 */
class InotifyFileWatcher : public FileWatcher {
public:
    InotifyFileWatcher();
    ~InotifyFileWatcher() override;

    InotifyFileWatcher(const InotifyFileWatcher&) = delete;
    InotifyFileWatcher& operator=(const InotifyFileWatcher&) = delete;

    /**
     * @brief Create the inotify instance and the monitor thread
     * @throws CertError IOError if inotify is unavailable
     */
    void Start();
    void Stop();

    void Add(const std::string& path, Callback callback) override;
    void Remove(const std::string& path) override;

    /**
     * @brief Report a change for every watched file
     *
     * The monitor loop calls this when the kernel queue overflowed and
     * events were lost.
     */
    void NotifyAll();

private:
    struct WatchedDir {
        int wd = -1;
        std::map<std::string, Callback> files;  // file name -> callback
    };

    void MonitorLoop();
    void Dispatch(int wd, const std::string& name);
    void Deliver(const std::vector<std::pair<std::string, Callback>>& targets);

    int fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex mutex_;
    std::map<std::string, WatchedDir> dirs_;    // directory -> watched files
};

} // namespace rotation
} // namespace meshcert

#endif // MESHCERT_FILE_WATCHER_H
