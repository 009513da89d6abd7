#include "asyncfs/handle_table.h"

namespace asyncfs {

FileHandle HandleTable::insert(int fd, bool append) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileHandle h{next_id_++};
    files_[h.id] = OpenFile{fd, append};
    return h;
}

bool HandleTable::lookup(FileHandle h, OpenFile& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(h.id);
    if (it == files_.end()) return false;
    out = it->second;
    return true;
}

bool HandleTable::remove(FileHandle h, OpenFile& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(h.id);
    if (it == files_.end()) return false;
    out = it->second;
    files_.erase(it);
    return true;
}

size_t HandleTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

std::vector<OpenFile> HandleTable::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OpenFile> out;
    for (auto& [id, f] : files_) {
        out.push_back(f);
    }
    files_.clear();
    return out;
}

} // namespace asyncfs
