#ifndef ASYNCFS_STATS_H
#define ASYNCFS_STATS_H

#include <cstdint>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>

namespace Json {
class Value;
}

namespace asyncfs {

struct Timestamp {
    int64_t sec = 0;
    int64_t nsec = 0;

    bool operator==(const Timestamp& o) const { return sec == o.sec && nsec == o.nsec; }
    bool operator!=(const Timestamp& o) const { return !(*this == o); }
    double millis() const { return static_cast<double>(sec) * 1e3 + static_cast<double>(nsec) / 1e6; }
};

// Snapshot of one stat call. A default constructed value is the all-zero
// snapshot used for paths that do not exist.
struct FileStats {
    uint64_t dev = 0;
    uint64_t ino = 0;
    uint32_t mode = 0;
    uint64_t nlink = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint64_t rdev = 0;
    int64_t size = 0;
    int64_t blksize = 0;
    int64_t blocks = 0;
    Timestamp atime;
    Timestamp mtime;
    Timestamp ctime;
    std::optional<Timestamp> birthtime;

    static FileStats from_stat(const struct stat& st);
    static FileStats from_statx(const struct statx& stx);

    bool is_file() const { return S_ISREG(mode); }
    bool is_directory() const { return S_ISDIR(mode); }
    bool is_symlink() const { return S_ISLNK(mode); }
    bool is_fifo() const { return S_ISFIFO(mode); }
    bool is_socket() const { return S_ISSOCK(mode); }
    bool is_char_device() const { return S_ISCHR(mode); }
    bool is_block_device() const { return S_ISBLK(mode); }
    bool is_zero() const;

    bool operator==(const FileStats& o) const;
    bool operator!=(const FileStats& o) const { return !(*this == o); }

    void to_json(Json::Value& out) const;
    std::string to_json() const;
};

} // namespace asyncfs

#endif
