#include "asyncfs/stat_watcher.h"
#include "asyncfs/file_system.h"
#include "asyncfs/log.h"

namespace asyncfs {

StatWatcher::StatWatcher(FileSystem& fs, std::string path, std::chrono::milliseconds interval)
    : fs_(fs), path_(std::move(path)), interval_(interval) {}

std::shared_ptr<StatWatcher> StatWatcher::start(FileSystem& fs, const std::string& path,
                                                std::chrono::milliseconds interval, bool persistent) {
    std::shared_ptr<StatWatcher> w(new StatWatcher(fs, path, interval));
    w->active_ = true;
    w->timer_ = fs.loop().add_timer(interval, [w] { w->poll(); }, true);
    if (!persistent) fs.loop().set_timer_ref(w->timer_, false);
    // Take the baseline right away instead of after the first interval
    w->poll();
    log_debug("watchfile", "polling " + path + " every " + std::to_string(interval.count()) + "ms");
    return w;
}

bool StatWatcher::changed(const FileStats& a, const FileStats& b) {
    return a.ctime != b.ctime || a.mtime != b.mtime || a.birthtime != b.birthtime || a.size != b.size ||
           a.mode != b.mode || a.uid != b.uid || a.gid != b.gid || a.ino != b.ino || a.dev != b.dev;
}

StatWatcher::ListenerId StatWatcher::add_listener(Listener listener) {
    ListenerId id = next_listener_++;
    listeners_[id] = std::move(listener);
    return id;
}

void StatWatcher::remove_listener(ListenerId id) {
    listeners_.erase(id);
    if (listeners_.empty()) stop();
}

void StatWatcher::stop() {
    if (!active_) return;
    active_ = false;
    listeners_.clear();
    // Drops the loop's reference to us
    fs_.loop().cancel_timer(timer_);
}

void StatWatcher::poll() {
    if (busy_ || !active_) return;
    busy_ = true;
    auto self = shared_from_this();
    fs_.stat(path_, [self](Result<FileStats> r) {
        self->busy_ = false;
        if (!self->active_) return;
        // Any failure, not just ENOENT, reads as a missing file
        FileStats current = r.ok() ? r.value() : FileStats();
        if (!self->primed_) {
            self->primed_ = true;
            self->previous_ = current;
            if (!r.ok()) self->deliver(current);
            return;
        }
        if (changed(current, self->previous_)) self->deliver(current);
    });
}

void StatWatcher::deliver(const FileStats& current) {
    FileStats previous = previous_;
    previous_ = current;
    auto listeners = listeners_;
    for (auto& [id, listener] : listeners) {
        if (!active_) break;
        if (listeners_.count(id) == 0) continue; // removed by an earlier listener
        listener(current, previous);
    }
}

StatSubscription::StatSubscription(std::shared_ptr<StatWatcher> watcher, StatWatcher::ListenerId id)
    : watcher_(watcher), id_(id) {}

void StatSubscription::close() {
    if (closed_) return;
    closed_ = true;
    if (auto w = watcher_.lock()) w->remove_listener(id_);
}

bool StatSubscription::active() const {
    if (closed_) return false;
    auto w = watcher_.lock();
    return w && w->active();
}

} // namespace asyncfs
