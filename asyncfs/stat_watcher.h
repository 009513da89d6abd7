#ifndef ASYNCFS_STAT_WATCHER_H
#define ASYNCFS_STAT_WATCHER_H

#include "asyncfs/event_loop.h"
#include "asyncfs/stats.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace asyncfs {

class FileSystem;

struct WatchFileOptions {
    bool persistent = true;
    // 0 picks the configured default
    unsigned interval_ms = 0;
};

// Polls one path with stat and reports (current, previous) whenever the
// snapshot changes. A path that cannot be stat'ed reads as all-zero stats,
// so a deletion is reported exactly once.
class StatWatcher : public std::enable_shared_from_this<StatWatcher> {
public:
    using Listener = std::function<void(const FileStats& current, const FileStats& previous)>;
    using ListenerId = uint64_t;

    static std::shared_ptr<StatWatcher> start(FileSystem& fs, const std::string& path,
                                              std::chrono::milliseconds interval, bool persistent);

    StatWatcher(const StatWatcher&) = delete;
    StatWatcher& operator=(const StatWatcher&) = delete;

    ListenerId add_listener(Listener listener);
    // Stops the watcher when the last listener goes away.
    void remove_listener(ListenerId id);
    size_t listener_count() const { return listeners_.size(); }

    void stop();
    bool active() const { return active_; }
    const std::string& path() const { return path_; }

    // Fields that count as a change; access time alone does not.
    static bool changed(const FileStats& a, const FileStats& b);

private:
    StatWatcher(FileSystem& fs, std::string path, std::chrono::milliseconds interval);

    void poll();
    void deliver(const FileStats& current);

    FileSystem& fs_;
    std::string path_;
    std::chrono::milliseconds interval_;
    bool active_ = false;
    bool busy_ = false;
    bool primed_ = false;
    EventLoop::TimerId timer_ = 0;
    FileStats previous_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_ = 1;
};

// Handle given to one watch_file() caller.
class StatSubscription {
public:
    StatSubscription(std::shared_ptr<StatWatcher> watcher, StatWatcher::ListenerId id);

    void close();
    bool active() const;

private:
    std::weak_ptr<StatWatcher> watcher_;
    StatWatcher::ListenerId id_;
    bool closed_ = false;
};

} // namespace asyncfs

#endif
