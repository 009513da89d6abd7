#include "asyncfs/fs_watcher.h"
#include "asyncfs/log.h"
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/inotify.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <unistd.h>

namespace asyncfs {

static const uint32_t watch_mask = IN_ATTRIB | IN_CREATE | IN_MODIFY | IN_DELETE | IN_DELETE_SELF |
                                   IN_MOVE_SELF | IN_MOVED_FROM | IN_MOVED_TO;

const char *watch_event_name(WatchEventKind kind) {
    return kind == WatchEventKind::Rename ? "rename" : "change";
}

static std::string base_name(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) return "/";
    size_t start = path.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

static std::string join_rel(const std::string& prefix, const std::string& name) {
    return prefix.empty() ? name : prefix + "/" + name;
}

WatchSubscription::WatchSubscription(EventLoop& loop, std::string path, bool recursive, Encoding encoding,
                                     Listener listener)
    : loop_(loop), path_(std::move(path)), recursive_(recursive), encoding_(encoding),
      listener_(std::move(listener)) {}

WatchSubscription::~WatchSubscription() {
    // The loop no longer references us, so only the descriptor is left
    if (fd_ >= 0) ::close(fd_);
}

Result<std::shared_ptr<WatchSubscription>> WatchSubscription::start(EventLoop& loop, const std::string& path,
                                                                     const WatchOptions& options,
                                                                     Encoding encoding, Listener listener) {
    if (!listener) return Error::make(ErrorCode::InvalidArgument, "watch", path);

    struct stat st;
    if (::stat(path.c_str(), &st) < 0) return Error::from_errno(errno, "watch", path);

    bool recursive = options.recursive;
    if (recursive && !S_ISDIR(st.st_mode)) {
        log_debug("watch", "recursive ignored for non-directory " + path);
        recursive = false;
    }

    std::shared_ptr<WatchSubscription> sub(
        new WatchSubscription(loop, path, recursive, encoding, std::move(listener)));

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) return Error::from_errno(errno, "watch", path);
    if (fd >= FD_SETSIZE) {
        ::close(fd);
        return Error::from_errno(EMFILE, "watch", path);
    }
    sub->fd_ = fd;

    sub->root_wd_ = sub->add_watch(path, "");
    if (sub->root_wd_ < 0) {
        int err = errno;
        ::close(sub->fd_);
        sub->fd_ = -1;
        return Error::from_errno(err, "watch", path);
    }
    if (recursive) sub->add_tree(path, "");

    loop.add_fd(fd, [sub] { sub->on_readable(); }, options.persistent);
    log_debug("watch", "watching " + path + " (" + std::to_string(sub->watch_count()) + " watches)");
    return sub;
}

int WatchSubscription::add_watch(const std::string& dir, const std::string& prefix) {
    int wd = inotify_add_watch(fd_, dir.c_str(), watch_mask);
    if (wd >= 0) prefixes_[wd] = prefix;
    return wd;
}

void WatchSubscription::add_tree(const std::string& dir, const std::string& prefix) {
    DIR *d = opendir(dir.c_str());
    if (!d) {
        log_warn("watch", "cannot descend into " + dir + ": " + strerror(errno));
        return;
    }
    while (struct dirent *ent = readdir(d)) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
        std::string child = dir + "/" + ent->d_name;
        bool is_dir = ent->d_type == DT_DIR;
        if (ent->d_type == DT_UNKNOWN) {
            struct stat st;
            is_dir = lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
        }
        if (!is_dir) continue;
        std::string rel = join_rel(prefix, ent->d_name);
        if (add_watch(child, rel) < 0) {
            log_warn("watch", "cannot watch " + child + ": " + strerror(errno));
            continue;
        }
        add_tree(child, rel);
    }
    closedir(d);
}

void WatchSubscription::remove_subtree(const std::string& prefix) {
    std::string below = prefix + "/";
    for (auto it = prefixes_.begin(); it != prefixes_.end();) {
        const std::string& rel = it->second;
        if (it->first != root_wd_ && (rel == prefix || rel.compare(0, below.size(), below) == 0)) {
            if (inotify_rm_watch(fd_, it->first) < 0) {
                log_debug("watch", "watch on " + rel + " already gone: " + strerror(errno));
            }
            it = prefixes_.erase(it);
        } else {
            ++it;
        }
    }
}

void WatchSubscription::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    prefixes_.clear();
    ::close(fd);
    // May drop the last reference to this object
    loop_.remove_fd(fd);
}

void WatchSubscription::fail(Error err) {
    if (!active()) return;
    Listener listener = listener_;
    close();
    listener(Result<WatchEvent>(std::move(err)));
}

void WatchSubscription::on_readable() {
    auto self = shared_from_this();
    alignas(struct inotify_event) char buf[4096];

    while (fd_ >= 0) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            fail(Error::from_errno(errno, "watch", path_));
            return;
        }
        if (n == 0) return;

        char *p = buf;
        while (p < buf + n && fd_ >= 0) {
            auto *ev = reinterpret_cast<struct inotify_event *>(p);
            p += sizeof(struct inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                log_warn("watch", "event queue overflow on " + path_);
                fail(Error::make(ErrorCode::IOError, "watch", path_));
                return;
            }
            auto it = prefixes_.find(ev->wd);
            if (it == prefixes_.end()) continue;
            std::string prefix = it->second;

            if (ev->mask & IN_IGNORED) {
                prefixes_.erase(it);
                // The watched path itself is gone
                if (ev->wd == root_wd_) {
                    fail(Error::from_errno(ENOENT, "watch", path_));
                    return;
                }
                continue;
            }
            // Subdirectories going away are reported by their parent
            if (ev->wd != root_wd_ && (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF))) continue;

            std::string name;
            if (ev->len > 0) {
                name = join_rel(prefix, std::string(ev->name, strnlen(ev->name, ev->len)));
            } else {
                name = base_name(path_);
            }

            if (recursive_ && (ev->mask & IN_ISDIR)) {
                if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
                    std::string full = path_ + "/" + name;
                    if (add_watch(full, name) >= 0) add_tree(full, name);
                } else if (ev->mask & IN_MOVED_FROM) {
                    // Wherever it went, it is no longer under the watched path
                    remove_subtree(name);
                }
            }

            WatchEvent event;
            event.kind = (ev->mask & (IN_ATTRIB | IN_MODIFY)) ? WatchEventKind::Change : WatchEventKind::Rename;
            event.filename = encode_name(name, encoding_);
            Listener listener = listener_;
            listener(Result<WatchEvent>(std::move(event)));

            // Renamed away: later events would describe the old location
            if (ev->wd == root_wd_ && (ev->mask & IN_MOVE_SELF)) {
                fail(Error::from_errno(ENOENT, "watch", path_));
                return;
            }
        }
    }
}

} // namespace asyncfs
