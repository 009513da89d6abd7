#ifndef ASYNCFS_FS_WATCHER_H
#define ASYNCFS_FS_WATCHER_H

#include "asyncfs/encoding.h"
#include "asyncfs/event_loop.h"
#include "asyncfs/pending_operation.h"
#include "asyncfs/result.h"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace asyncfs {

enum class WatchEventKind { Rename, Change };

const char *watch_event_name(WatchEventKind kind);

struct WatchEvent {
    WatchEventKind kind = WatchEventKind::Change;
    // Not every backend reports one; never assume it is set.
    std::optional<std::string> filename;
};

struct WatchOptions {
    bool persistent = true;
    bool recursive = false;
    std::optional<Encoding> encoding;
};

// Change listener bound to one path, backed by inotify. The listener gets
// each event as a successful Result; an error Result is terminal and is
// the last thing delivered.
class WatchSubscription : public std::enable_shared_from_this<WatchSubscription> {
public:
    using Listener = Callback<WatchEvent>;

    static Result<std::shared_ptr<WatchSubscription>> start(EventLoop& loop, const std::string& path,
                                                            const WatchOptions& options, Encoding encoding,
                                                            Listener listener);
    ~WatchSubscription();

    WatchSubscription(const WatchSubscription&) = delete;
    WatchSubscription& operator=(const WatchSubscription&) = delete;

    void close();
    bool active() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }
    size_t watch_count() const { return prefixes_.size(); }

private:
    WatchSubscription(EventLoop& loop, std::string path, bool recursive, Encoding encoding, Listener listener);

    int add_watch(const std::string& dir, const std::string& prefix);
    void add_tree(const std::string& dir, const std::string& prefix);
    // Drops the watches on prefix and everything below it.
    void remove_subtree(const std::string& prefix);
    void on_readable();
    void fail(Error err);

    EventLoop& loop_;
    std::string path_;
    bool recursive_;
    Encoding encoding_;
    Listener listener_;
    int fd_ = -1;
    int root_wd_ = -1;
    std::map<int, std::string> prefixes_; // watch descriptor -> path relative to the root
};

} // namespace asyncfs

#endif
