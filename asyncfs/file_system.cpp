#include "asyncfs/file_system.h"
#include "asyncfs/log.h"
#include <cerrno>
#include <climits>
#include <cstring>
#include <deque>
#include <dirent.h>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace asyncfs {

static Error sys_error(const char *syscall, const std::string& path = "", const std::string& dest = "") {
    return Error::from_errno(errno, syscall, path, dest);
}

static Result<void> check(int rc, const char *syscall, const std::string& path = "",
                          const std::string& dest = "") {
    if (rc < 0) return sys_error(syscall, path, dest);
    return Result<void>();
}

static std::deque<std::string> split_path(const std::string& path) {
    std::deque<std::string> elems;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) pos = path.size();
        if (pos > start) elems.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return elems;
}

// Cached answers may carry stray or doubled slashes
static std::string canonical_hint(const std::string& hint) {
    std::string out;
    for (const auto& part : split_path(hint)) {
        if (part != ".") out += "/" + part;
    }
    return out.empty() ? std::string("/") : out;
}

// statx with a fallback for kernels that do not have it
static Result<FileStats> do_stat(int dirfd, const char *path, int flags, const char *syscall,
                                 const std::string& shown) {
    struct statx stx;
    if (statx(dirfd, path, flags | AT_STATX_SYNC_AS_STAT, STATX_BASIC_STATS | STATX_BTIME, &stx) == 0) {
        return FileStats::from_statx(stx);
    }
    if (errno != ENOSYS) return sys_error(syscall, shown);

    struct stat st;
    if (fstatat(dirfd, path, &st, flags) < 0) return sys_error(syscall, shown);
    return FileStats::from_stat(st);
}

FileSystem::FileSystem(EventLoop& loop, Config config)
    : loop_(loop), config_(std::move(config)),
      pool_(std::make_unique<WorkerPool>(config_.worker_threads)) {}

FileSystem::~FileSystem() {
    for (auto& [path, w] : stat_watchers_) {
        w->stop();
    }
    stat_watchers_.clear();
    // Let queued jobs finish before their descriptors go away
    pool_.reset();
    auto leaked = handles_.drain();
    if (!leaked.empty()) log_warn("fs", std::to_string(leaked.size()) + " handle(s) still open, closing");
    for (const auto& f : leaked) {
        ::close(f.fd);
    }
}

Result<int> FileSystem::resolve_fd(FileHandle handle, const char *syscall) const {
    OpenFile f;
    if (!handles_.lookup(handle, f)) return Error::make(ErrorCode::InvalidHandle, syscall);
    return f.fd;
}

Result<FileHandle> FileSystem::open_sync(const std::string& path, OpenFlags flags, std::optional<mode_t> mode) {
    int fd = ::open(path.c_str(), to_posix_flags(flags), mode.value_or(config_.default_file_mode));
    if (fd < 0) return sys_error("open", path);
    return handles_.insert(fd, is_append(flags));
}

Result<void> FileSystem::close_sync(FileHandle handle) {
    OpenFile f;
    if (!handles_.remove(handle, f)) return Error::make(ErrorCode::InvalidHandle, "close");
    // On Linux the descriptor is gone even when close reports EINTR
    if (::close(f.fd) < 0 && errno != EINTR) return sys_error("close");
    return Result<void>();
}

Result<size_t> FileSystem::read_sync(FileHandle handle, char *buffer, size_t length,
                                     std::optional<int64_t> position) {
    if (!buffer && length > 0) return Error::make(ErrorCode::InvalidArgument, "read");
    if (position && *position < 0) return Error::make(ErrorCode::InvalidArgument, "read");
    OpenFile f;
    if (!handles_.lookup(handle, f)) return Error::make(ErrorCode::InvalidHandle, "read");

    ssize_t n = position ? ::pread(f.fd, buffer, length, *position) : ::read(f.fd, buffer, length);
    if (n < 0) return sys_error("read");
    return static_cast<size_t>(n);
}

Result<size_t> FileSystem::write_sync(FileHandle handle, const char *data, size_t length,
                                      std::optional<int64_t> position) {
    if (!data && length > 0) return Error::make(ErrorCode::InvalidArgument, "write");
    if (position && *position < 0) return Error::make(ErrorCode::InvalidArgument, "write");
    OpenFile f;
    if (!handles_.lookup(handle, f)) return Error::make(ErrorCode::InvalidHandle, "write");

    ssize_t n;
    if (f.append || !position) {
        // Append handles always land at end of file, whatever position says
        n = ::write(f.fd, data, length);
    } else {
        n = ::pwrite(f.fd, data, length, *position);
    }
    if (n < 0) return sys_error("write");
    return static_cast<size_t>(n);
}

Result<size_t> FileSystem::write_sync(FileHandle handle, const std::string& data, std::optional<int64_t> position) {
    return write_sync(handle, data.data(), data.size(), position);
}

Result<FileStats> FileSystem::stat_sync(const std::string& path) {
    return do_stat(AT_FDCWD, path.c_str(), 0, "stat", path);
}

Result<FileStats> FileSystem::lstat_sync(const std::string& path) {
    return do_stat(AT_FDCWD, path.c_str(), AT_SYMLINK_NOFOLLOW, "lstat", path);
}

Result<FileStats> FileSystem::fstat_sync(FileHandle handle) {
    auto fd = resolve_fd(handle, "fstat");
    if (!fd) return fd.error();
    return do_stat(fd.value(), "", AT_EMPTY_PATH, "fstat", "");
}

Result<void> FileSystem::mkdir_sync(const std::string& path, std::optional<mode_t> mode) {
    return check(::mkdir(path.c_str(), mode.value_or(config_.default_dir_mode)), "mkdir", path);
}

Result<void> FileSystem::rmdir_sync(const std::string& path) {
    return check(::rmdir(path.c_str()), "rmdir", path);
}

Result<void> FileSystem::unlink_sync(const std::string& path) {
    return check(::unlink(path.c_str()), "unlink", path);
}

Result<void> FileSystem::rename_sync(const std::string& from, const std::string& to) {
    return check(::rename(from.c_str(), to.c_str()), "rename", from, to);
}

Result<void> FileSystem::link_sync(const std::string& existing, const std::string& new_path) {
    return check(::link(existing.c_str(), new_path.c_str()), "link", existing, new_path);
}

Result<void> FileSystem::symlink_sync(const std::string& target, const std::string& path) {
    return check(::symlink(target.c_str(), path.c_str()), "symlink", target, path);
}

Result<std::vector<std::string>> FileSystem::readdir_sync(const std::string& path, std::optional<Encoding> encoding) {
    Encoding enc = encoding.value_or(config_.default_encoding);
    DIR *d = ::opendir(path.c_str());
    if (!d) return sys_error("scandir", path);

    std::vector<std::string> names;
    errno = 0;
    while (struct dirent *ent = ::readdir(d)) {
        if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0) continue;
        names.push_back(encode_name(ent->d_name, enc));
        errno = 0;
    }
    int err = errno;
    ::closedir(d);
    if (err != 0) return Error::from_errno(err, "scandir", path);
    return names;
}

Result<std::string> FileSystem::readlink_sync(const std::string& path, std::optional<Encoding> encoding) {
    std::string buf(256, '\0');
    while (true) {
        ssize_t n = ::readlink(path.c_str(), &buf[0], buf.size());
        if (n < 0) return sys_error("readlink", path);
        if (static_cast<size_t>(n) < buf.size()) {
            buf.resize(n);
            break;
        }
        // Possibly truncated
        buf.resize(buf.size() * 2);
    }
    return encode_name(buf, encoding.value_or(config_.default_encoding));
}

Result<std::string> FileSystem::resolve_path(const std::string& path, const RealpathCache *cache) {
    if (path.empty()) return Error::from_errno(ENOENT, "realpath", path);

    std::string abs = path;
    if (abs[0] != '/') {
        char cwd[PATH_MAX];
        if (!getcwd(cwd, sizeof(cwd))) return sys_error("realpath", path);
        abs = std::string(cwd) + "/" + abs;
    }
    if (cache) {
        auto it = cache->find(abs);
        if (it != cache->end() && !it->second.empty() && it->second[0] == '/') return canonical_hint(it->second);
    }

    std::deque<std::string> pending = split_path(abs);
    std::string resolved; // empty means "/"
    int links = 0;
    while (!pending.empty()) {
        std::string part = pending.front();
        pending.pop_front();
        if (part == ".") continue;
        if (part == "..") {
            size_t pos = resolved.find_last_of('/');
            resolved.erase(pos == std::string::npos ? 0 : pos);
            continue;
        }
        std::string next = resolved + "/" + part;

        if (cache) {
            auto it = cache->find(next);
            if (it != cache->end() && !it->second.empty() && it->second[0] == '/') {
                std::string hint = canonical_hint(it->second);
                resolved = hint == "/" ? "" : hint;
                continue;
            }
        }

        struct stat st;
        if (::lstat(next.c_str(), &st) < 0) return sys_error("lstat", next);
        if (!S_ISLNK(st.st_mode)) {
            if (!pending.empty() && !S_ISDIR(st.st_mode)) return Error::from_errno(ENOTDIR, "realpath", path);
            resolved = next;
            continue;
        }

        if (++links > 40) return Error::from_errno(ELOOP, "realpath", path);
        auto target = readlink_sync(next, Encoding::Buffer);
        if (!target) return target.error();
        const std::string& t = target.value();
        if (!t.empty() && t[0] == '/') resolved.clear();
        auto parts = split_path(t);
        pending.insert(pending.begin(), parts.begin(), parts.end());
    }
    return resolved.empty() ? std::string("/") : resolved;
}

Result<std::string> FileSystem::realpath_sync(const std::string& path, const RealpathCache *cache) {
    if (cache && !cache->empty()) {
        // The cache is only a hint: an answer naming a different file than the
        // path itself, or no file at all, is dropped
        auto hinted = resolve_path(path, cache);
        struct stat real_st, hinted_st;
        if (hinted && ::stat(path.c_str(), &real_st) == 0 && ::stat(hinted.value().c_str(), &hinted_st) == 0 &&
            real_st.st_dev == hinted_st.st_dev && real_st.st_ino == hinted_st.st_ino) {
            return hinted;
        }
        log_debug("realpath", "cache hint for " + path + " did not hold, resolving from disk");
    }
    return resolve_path(path, nullptr);
}

Result<void> FileSystem::truncate_sync(const std::string& path, int64_t length) {
    if (length < 0) return Error::make(ErrorCode::InvalidArgument, "truncate", path);
    return check(::truncate(path.c_str(), length), "truncate", path);
}

Result<void> FileSystem::ftruncate_sync(FileHandle handle, int64_t length) {
    if (length < 0) return Error::make(ErrorCode::InvalidArgument, "ftruncate");
    auto fd = resolve_fd(handle, "ftruncate");
    if (!fd) return fd.error();
    return check(::ftruncate(fd.value(), length), "ftruncate");
}

Result<void> FileSystem::fsync_sync(FileHandle handle) {
    auto fd = resolve_fd(handle, "fsync");
    if (!fd) return fd.error();
    return check(::fsync(fd.value()), "fsync");
}

Result<void> FileSystem::fdatasync_sync(FileHandle handle) {
    auto fd = resolve_fd(handle, "fdatasync");
    if (!fd) return fd.error();
    return check(::fdatasync(fd.value()), "fdatasync");
}

Result<void> FileSystem::chmod_sync(const std::string& path, mode_t mode) {
    return check(::chmod(path.c_str(), mode), "chmod", path);
}

Result<void> FileSystem::fchmod_sync(FileHandle handle, mode_t mode) {
    auto fd = resolve_fd(handle, "fchmod");
    if (!fd) return fd.error();
    return check(::fchmod(fd.value(), mode), "fchmod");
}

Result<void> FileSystem::chown_sync(const std::string& path, uid_t uid, gid_t gid) {
    return check(::chown(path.c_str(), uid, gid), "chown", path);
}

static struct timespec to_timespec(const Timestamp& t) {
    struct timespec ts;
    ts.tv_sec = t.sec;
    ts.tv_nsec = t.nsec;
    return ts;
}

Result<void> FileSystem::utimes_sync(const std::string& path, Timestamp atime, Timestamp mtime) {
    struct timespec times[2] = {to_timespec(atime), to_timespec(mtime)};
    return check(::utimensat(AT_FDCWD, path.c_str(), times, 0), "utime", path);
}

Result<void> FileSystem::futimes_sync(FileHandle handle, Timestamp atime, Timestamp mtime) {
    auto fd = resolve_fd(handle, "futime");
    if (!fd) return fd.error();
    struct timespec times[2] = {to_timespec(atime), to_timespec(mtime)};
    return check(::futimens(fd.value(), times), "futime");
}

Result<void> FileSystem::access_sync(const std::string& path, int mode) {
    return check(::access(path.c_str(), mode), "access", path);
}

bool FileSystem::exists_sync(const std::string& path) {
    return ::access(path.c_str(), F_OK) == 0;
}

Result<std::string> FileSystem::read_file_sync(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return sys_error("open", path);

    struct stat st;
    if (::fstat(fd, &st) < 0) {
        Error err = sys_error("fstat", path);
        ::close(fd);
        return err;
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        return Error::from_errno(EISDIR, "read", path);
    }

    std::string data;
    // st_size is only a hint; procfs and friends report 0
    data.reserve(st.st_size > 0 ? static_cast<size_t>(st.st_size) : 0);
    char chunk[65536];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err = sys_error("read", path);
            ::close(fd);
            return err;
        }
        if (n == 0) break;
        data.append(chunk, n);
    }
    ::close(fd);
    return data;
}

Result<void> FileSystem::write_whole(const std::string& path, const std::string& data, int flags, mode_t mode,
                                     const char *syscall) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd < 0) return sys_error("open", path);

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err = sys_error(syscall, path);
            ::close(fd);
            return err;
        }
        written += n;
    }
    if (::close(fd) < 0 && errno != EINTR) return sys_error("close", path);
    return Result<void>();
}

Result<void> FileSystem::write_file_sync(const std::string& path, const std::string& data, std::optional<mode_t> mode) {
    return write_whole(path, data, O_WRONLY | O_CREAT | O_TRUNC, mode.value_or(config_.default_file_mode), "write");
}

Result<void> FileSystem::append_file_sync(const std::string& path, const std::string& data,
                                          std::optional<mode_t> mode) {
    return write_whole(path, data, O_WRONLY | O_CREAT | O_APPEND, mode.value_or(config_.default_file_mode),
                       "write");
}

Result<std::shared_ptr<WatchSubscription>> FileSystem::watch(const std::string& path, const WatchOptions& options,
                                                             WatchSubscription::Listener listener) {
    Encoding enc = options.encoding.value_or(config_.default_encoding);
    return WatchSubscription::start(loop_, path, options, enc, std::move(listener));
}

std::shared_ptr<StatSubscription> FileSystem::watch_file(const std::string& path, const WatchFileOptions& options,
                                                         StatWatcher::Listener listener) {
    if (!listener) throw std::invalid_argument("watch_file requires a listener");
    auto& w = stat_watchers_[path];
    if (!w || !w->active()) {
        unsigned interval = options.interval_ms ? options.interval_ms : config_.watch_file_interval_ms;
        w = StatWatcher::start(*this, path, std::chrono::milliseconds(interval), options.persistent);
    }
    auto id = w->add_listener(std::move(listener));
    return std::make_shared<StatSubscription>(w, id);
}

void FileSystem::unwatch_file(const std::string& path) {
    auto it = stat_watchers_.find(path);
    if (it == stat_watchers_.end()) return;
    it->second->stop();
    stat_watchers_.erase(it);
}

} // namespace asyncfs
