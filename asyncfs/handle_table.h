#ifndef ASYNCFS_HANDLE_TABLE_H
#define ASYNCFS_HANDLE_TABLE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace asyncfs {

// Opaque reference to an open file. Handles from one table are never reused.
struct FileHandle {
    int64_t id = -1;

    bool operator==(const FileHandle& o) const { return id == o.id; }
    bool operator!=(const FileHandle& o) const { return id != o.id; }
    bool operator<(const FileHandle& o) const { return id < o.id; }
};

struct OpenFile {
    int fd = -1;
    bool append = false;
};

class HandleTable {
public:
    FileHandle insert(int fd, bool append);
    bool lookup(FileHandle h, OpenFile& out) const;
    // Removes the entry. Returns false if the handle was not open.
    bool remove(FileHandle h, OpenFile& out);
    size_t size() const;
    // Empties the table, handing back whatever was still open.
    std::vector<OpenFile> drain();

private:
    mutable std::mutex mutex_;
    std::map<int64_t, OpenFile> files_;
    int64_t next_id_ = 1;
};

} // namespace asyncfs

#endif
