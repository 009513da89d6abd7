#ifndef ASYNCFS_FILE_SYSTEM_H
#define ASYNCFS_FILE_SYSTEM_H

#include "asyncfs/config.h"
#include "asyncfs/encoding.h"
#include "asyncfs/event_loop.h"
#include "asyncfs/fs_watcher.h"
#include "asyncfs/handle_table.h"
#include "asyncfs/open_flags.h"
#include "asyncfs/pending_operation.h"
#include "asyncfs/result.h"
#include "asyncfs/stat_watcher.h"
#include "asyncfs/stats.h"
#include "asyncfs/worker_pool.h"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace asyncfs {

// Caller supplied path -> resolved path hints for realpath.
using RealpathCache = std::map<std::string, std::string>;

// Every operation comes in two forms. The *_sync form runs on the calling
// thread and stalls the event loop until the OS call returns; keep it off
// latency sensitive paths. The plain form runs on the worker pool and
// delivers its Result to the callback on the loop thread, exactly once.
//
// Two non-blocking calls issued back to back complete in no particular
// order. Chain the second inside the first's callback when order matters.
// Nothing serializes concurrent use of one FileHandle.
class FileSystem {
public:
    explicit FileSystem(EventLoop& loop, Config config = Config());
    ~FileSystem();

    FileSystem(const FileSystem&) = delete;
    FileSystem& operator=(const FileSystem&) = delete;

    EventLoop& loop() { return loop_; }
    const Config& config() const { return config_; }
    size_t open_handles() const { return handles_.size(); }

    // Blocking variants

    Result<FileHandle> open_sync(const std::string& path, OpenFlags flags,
                                 std::optional<mode_t> mode = std::nullopt);
    Result<void> close_sync(FileHandle handle);
    // Reads at position, or at the current offset when none is given.
    // Returns 0 at or past end of file.
    Result<size_t> read_sync(FileHandle handle, char *buffer, size_t length,
                             std::optional<int64_t> position = std::nullopt);
    // A short count is returned as is. Append handles ignore position.
    Result<size_t> write_sync(FileHandle handle, const char *data, size_t length,
                              std::optional<int64_t> position = std::nullopt);
    Result<size_t> write_sync(FileHandle handle, const std::string& data,
                              std::optional<int64_t> position = std::nullopt);

    Result<FileStats> stat_sync(const std::string& path);
    Result<FileStats> lstat_sync(const std::string& path);
    Result<FileStats> fstat_sync(FileHandle handle);

    Result<void> mkdir_sync(const std::string& path, std::optional<mode_t> mode = std::nullopt);
    Result<void> rmdir_sync(const std::string& path);
    Result<void> unlink_sync(const std::string& path);
    Result<void> rename_sync(const std::string& from, const std::string& to);
    Result<void> link_sync(const std::string& existing, const std::string& new_path);
    Result<void> symlink_sync(const std::string& target, const std::string& path);
    Result<std::vector<std::string>> readdir_sync(const std::string& path,
                                                  std::optional<Encoding> encoding = std::nullopt);
    Result<std::string> readlink_sync(const std::string& path, std::optional<Encoding> encoding = std::nullopt);
    Result<std::string> realpath_sync(const std::string& path, const RealpathCache *cache = nullptr);

    Result<void> truncate_sync(const std::string& path, int64_t length);
    Result<void> ftruncate_sync(FileHandle handle, int64_t length);
    Result<void> fsync_sync(FileHandle handle);
    Result<void> fdatasync_sync(FileHandle handle);
    Result<void> chmod_sync(const std::string& path, mode_t mode);
    Result<void> fchmod_sync(FileHandle handle, mode_t mode);
    Result<void> chown_sync(const std::string& path, uid_t uid, gid_t gid);
    Result<void> utimes_sync(const std::string& path, Timestamp atime, Timestamp mtime);
    Result<void> futimes_sync(FileHandle handle, Timestamp atime, Timestamp mtime);
    Result<void> access_sync(const std::string& path, int mode = F_OK);
    bool exists_sync(const std::string& path);

    Result<std::string> read_file_sync(const std::string& path);
    Result<void> write_file_sync(const std::string& path, const std::string& data,
                                 std::optional<mode_t> mode = std::nullopt);
    Result<void> append_file_sync(const std::string& path, const std::string& data,
                                  std::optional<mode_t> mode = std::nullopt);

    // Non-blocking variants

    void open(const std::string& path, OpenFlags flags, Callback<FileHandle> cb);
    void open(const std::string& path, OpenFlags flags, mode_t mode, Callback<FileHandle> cb);
    void close(FileHandle handle, Callback<void> cb);
    // buffer must stay valid until cb runs
    void read(FileHandle handle, char *buffer, size_t length, std::optional<int64_t> position,
              Callback<size_t> cb);
    void write(FileHandle handle, std::string data, std::optional<int64_t> position, Callback<size_t> cb);

    void stat(const std::string& path, Callback<FileStats> cb);
    void lstat(const std::string& path, Callback<FileStats> cb);
    void fstat(FileHandle handle, Callback<FileStats> cb);

    void mkdir(const std::string& path, Callback<void> cb);
    void mkdir(const std::string& path, mode_t mode, Callback<void> cb);
    void rmdir(const std::string& path, Callback<void> cb);
    void unlink(const std::string& path, Callback<void> cb);
    void rename(const std::string& from, const std::string& to, Callback<void> cb);
    void link(const std::string& existing, const std::string& new_path, Callback<void> cb);
    void symlink(const std::string& target, const std::string& path, Callback<void> cb);
    void readdir(const std::string& path, Callback<std::vector<std::string>> cb);
    void readdir(const std::string& path, Encoding encoding, Callback<std::vector<std::string>> cb);
    void readlink(const std::string& path, Callback<std::string> cb);
    void realpath(const std::string& path, Callback<std::string> cb);
    void realpath(const std::string& path, RealpathCache cache, Callback<std::string> cb);

    void truncate(const std::string& path, int64_t length, Callback<void> cb);
    void ftruncate(FileHandle handle, int64_t length, Callback<void> cb);
    void fsync(FileHandle handle, Callback<void> cb);
    void fdatasync(FileHandle handle, Callback<void> cb);
    void chmod(const std::string& path, mode_t mode, Callback<void> cb);
    void fchmod(FileHandle handle, mode_t mode, Callback<void> cb);
    void chown(const std::string& path, uid_t uid, gid_t gid, Callback<void> cb);
    void utimes(const std::string& path, Timestamp atime, Timestamp mtime, Callback<void> cb);
    void futimes(FileHandle handle, Timestamp atime, Timestamp mtime, Callback<void> cb);
    void access(const std::string& path, int mode, Callback<void> cb);

    void read_file(const std::string& path, Callback<std::string> cb);
    void write_file(const std::string& path, std::string data, Callback<void> cb);
    void append_file(const std::string& path, std::string data, Callback<void> cb);

    // Watching. Both run on the loop thread and deliver on it.

    Result<std::shared_ptr<WatchSubscription>> watch(const std::string& path, const WatchOptions& options,
                                                     WatchSubscription::Listener listener);
    // Listeners on the same path share one poller; the first caller's
    // interval and persistence win.
    std::shared_ptr<StatSubscription> watch_file(const std::string& path, const WatchFileOptions& options,
                                                 StatWatcher::Listener listener);
    // Stops every watch_file() listener on path.
    void unwatch_file(const std::string& path);

private:
    template <typename T, typename Work>
    void dispatch(const char *syscall, Work work, Callback<T> cb);

    Result<int> resolve_fd(FileHandle handle, const char *syscall) const;
    Result<std::string> resolve_path(const std::string& path, const RealpathCache *cache);
    Result<void> write_whole(const std::string& path, const std::string& data, int flags, mode_t mode,
                             const char *syscall);

    EventLoop& loop_;
    Config config_;
    HandleTable handles_;
    std::map<std::string, std::shared_ptr<StatWatcher>> stat_watchers_;
    std::unique_ptr<WorkerPool> pool_;
};

template <typename T, typename Work>
void FileSystem::dispatch(const char *syscall, Work work, Callback<T> cb) {
    auto op = std::make_shared<PendingOperation<T>>(std::move(cb));
    EventLoop *loop = &loop_;
    loop->add_pending();
    try {
        pool_->submit([loop, op, work, syscall]() mutable {
            std::shared_ptr<Result<T>> result;
            try {
                result = std::make_shared<Result<T>>(work());
            } catch (const std::exception& e) {
                // Reported through the callback like any other failure
                result = std::make_shared<Result<T>>(
                    Error::make(ErrorCode::IOError, std::string(syscall) + " (" + e.what() + ")"));
            }
            loop->post([loop, op, result] {
                loop->remove_pending();
                op->resolve(std::move(*result));
            });
        });
    } catch (...) {
        loop->remove_pending();
        throw;
    }
}

} // namespace asyncfs

#endif
