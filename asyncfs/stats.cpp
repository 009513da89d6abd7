#include "asyncfs/stats.h"
#include <json/json.h>
#include <sys/sysmacros.h>

namespace asyncfs {

FileStats FileStats::from_stat(const struct stat& st) {
    FileStats s;
    s.dev = st.st_dev;
    s.ino = st.st_ino;
    s.mode = st.st_mode;
    s.nlink = st.st_nlink;
    s.uid = st.st_uid;
    s.gid = st.st_gid;
    s.rdev = st.st_rdev;
    s.size = st.st_size;
    s.blksize = st.st_blksize;
    s.blocks = st.st_blocks;
    s.atime = {st.st_atim.tv_sec, st.st_atim.tv_nsec};
    s.mtime = {st.st_mtim.tv_sec, st.st_mtim.tv_nsec};
    s.ctime = {st.st_ctim.tv_sec, st.st_ctim.tv_nsec};
    return s;
}

FileStats FileStats::from_statx(const struct statx& stx) {
    FileStats s;
    s.dev = makedev(stx.stx_dev_major, stx.stx_dev_minor);
    s.ino = stx.stx_ino;
    s.mode = stx.stx_mode;
    s.nlink = stx.stx_nlink;
    s.uid = stx.stx_uid;
    s.gid = stx.stx_gid;
    s.rdev = makedev(stx.stx_rdev_major, stx.stx_rdev_minor);
    s.size = static_cast<int64_t>(stx.stx_size);
    s.blksize = stx.stx_blksize;
    s.blocks = static_cast<int64_t>(stx.stx_blocks);
    s.atime = {stx.stx_atime.tv_sec, stx.stx_atime.tv_nsec};
    s.mtime = {stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec};
    s.ctime = {stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec};
    // Not every filesystem records a birth time
    if (stx.stx_mask & STATX_BTIME) s.birthtime = Timestamp{stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec};
    return s;
}

bool FileStats::is_zero() const {
    return *this == FileStats();
}

bool FileStats::operator==(const FileStats& o) const {
    return dev == o.dev && ino == o.ino && mode == o.mode && nlink == o.nlink && uid == o.uid &&
           gid == o.gid && rdev == o.rdev && size == o.size && blksize == o.blksize && blocks == o.blocks &&
           atime == o.atime && mtime == o.mtime && ctime == o.ctime && birthtime == o.birthtime;
}

static Json::Value timestamp_json(const Timestamp& t) {
    Json::Value jt;
    jt["sec"] = static_cast<Json::Int64>(t.sec);
    jt["nsec"] = static_cast<Json::Int64>(t.nsec);
    return jt;
}

void FileStats::to_json(Json::Value& out) const {
    out["dev"] = static_cast<Json::UInt64>(dev);
    out["ino"] = static_cast<Json::UInt64>(ino);
    out["mode"] = mode;
    out["nlink"] = static_cast<Json::UInt64>(nlink);
    out["uid"] = uid;
    out["gid"] = gid;
    out["rdev"] = static_cast<Json::UInt64>(rdev);
    out["size"] = static_cast<Json::Int64>(size);
    out["blksize"] = static_cast<Json::Int64>(blksize);
    out["blocks"] = static_cast<Json::Int64>(blocks);
    out["atime"] = timestamp_json(atime);
    out["mtime"] = timestamp_json(mtime);
    out["ctime"] = timestamp_json(ctime);
    if (birthtime) out["birthtime"] = timestamp_json(*birthtime);

    const char *type = "other";
    if (is_file()) type = "file";
    else if (is_directory()) type = "dir";
    else if (is_symlink()) type = "symlink";
    else if (is_fifo()) type = "fifo";
    else if (is_socket()) type = "socket";
    else if (is_char_device()) type = "chardev";
    else if (is_block_device()) type = "blockdev";
    out["type"] = type;
}

std::string FileStats::to_json() const {
    Json::Value jn;
    to_json(jn);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, jn);
}

} // namespace asyncfs
