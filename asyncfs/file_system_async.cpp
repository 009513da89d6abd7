#include "asyncfs/file_system.h"

namespace asyncfs {

void FileSystem::open(const std::string& path, OpenFlags flags, Callback<FileHandle> cb) {
    dispatch<FileHandle>("open", [this, path, flags] { return open_sync(path, flags); }, std::move(cb));
}

void FileSystem::open(const std::string& path, OpenFlags flags, mode_t mode, Callback<FileHandle> cb) {
    dispatch<FileHandle>("open", [this, path, flags, mode] { return open_sync(path, flags, mode); },
                         std::move(cb));
}

void FileSystem::close(FileHandle handle, Callback<void> cb) {
    dispatch<void>("close", [this, handle] { return close_sync(handle); }, std::move(cb));
}

void FileSystem::read(FileHandle handle, char *buffer, size_t length, std::optional<int64_t> position,
                      Callback<size_t> cb) {
    dispatch<size_t>("read", [this, handle, buffer, length, position] {
        return read_sync(handle, buffer, length, position);
    }, std::move(cb));
}

void FileSystem::write(FileHandle handle, std::string data, std::optional<int64_t> position, Callback<size_t> cb) {
    auto owned = std::make_shared<std::string>(std::move(data));
    dispatch<size_t>("write", [this, handle, owned, position] {
        return write_sync(handle, *owned, position);
    }, std::move(cb));
}

void FileSystem::stat(const std::string& path, Callback<FileStats> cb) {
    dispatch<FileStats>("stat", [this, path] { return stat_sync(path); }, std::move(cb));
}

void FileSystem::lstat(const std::string& path, Callback<FileStats> cb) {
    dispatch<FileStats>("lstat", [this, path] { return lstat_sync(path); }, std::move(cb));
}

void FileSystem::fstat(FileHandle handle, Callback<FileStats> cb) {
    dispatch<FileStats>("fstat", [this, handle] { return fstat_sync(handle); }, std::move(cb));
}

void FileSystem::mkdir(const std::string& path, Callback<void> cb) {
    dispatch<void>("mkdir", [this, path] { return mkdir_sync(path); }, std::move(cb));
}

void FileSystem::mkdir(const std::string& path, mode_t mode, Callback<void> cb) {
    dispatch<void>("mkdir", [this, path, mode] { return mkdir_sync(path, mode); }, std::move(cb));
}

void FileSystem::rmdir(const std::string& path, Callback<void> cb) {
    dispatch<void>("rmdir", [this, path] { return rmdir_sync(path); }, std::move(cb));
}

void FileSystem::unlink(const std::string& path, Callback<void> cb) {
    dispatch<void>("unlink", [this, path] { return unlink_sync(path); }, std::move(cb));
}

void FileSystem::rename(const std::string& from, const std::string& to, Callback<void> cb) {
    dispatch<void>("rename", [this, from, to] { return rename_sync(from, to); }, std::move(cb));
}

void FileSystem::link(const std::string& existing, const std::string& new_path, Callback<void> cb) {
    dispatch<void>("link", [this, existing, new_path] { return link_sync(existing, new_path); }, std::move(cb));
}

void FileSystem::symlink(const std::string& target, const std::string& path, Callback<void> cb) {
    dispatch<void>("symlink", [this, target, path] { return symlink_sync(target, path); }, std::move(cb));
}

void FileSystem::readdir(const std::string& path, Callback<std::vector<std::string>> cb) {
    dispatch<std::vector<std::string>>("scandir", [this, path] { return readdir_sync(path); }, std::move(cb));
}

void FileSystem::readdir(const std::string& path, Encoding encoding, Callback<std::vector<std::string>> cb) {
    dispatch<std::vector<std::string>>("scandir", [this, path, encoding] {
        return readdir_sync(path, encoding);
    }, std::move(cb));
}

void FileSystem::readlink(const std::string& path, Callback<std::string> cb) {
    dispatch<std::string>("readlink", [this, path] { return readlink_sync(path); }, std::move(cb));
}

void FileSystem::realpath(const std::string& path, Callback<std::string> cb) {
    dispatch<std::string>("realpath", [this, path] { return realpath_sync(path); }, std::move(cb));
}

void FileSystem::realpath(const std::string& path, RealpathCache cache, Callback<std::string> cb) {
    auto owned = std::make_shared<RealpathCache>(std::move(cache));
    dispatch<std::string>("realpath", [this, path, owned] { return realpath_sync(path, owned.get()); },
                          std::move(cb));
}

void FileSystem::truncate(const std::string& path, int64_t length, Callback<void> cb) {
    dispatch<void>("truncate", [this, path, length] { return truncate_sync(path, length); }, std::move(cb));
}

void FileSystem::ftruncate(FileHandle handle, int64_t length, Callback<void> cb) {
    dispatch<void>("ftruncate", [this, handle, length] { return ftruncate_sync(handle, length); }, std::move(cb));
}

void FileSystem::fsync(FileHandle handle, Callback<void> cb) {
    dispatch<void>("fsync", [this, handle] { return fsync_sync(handle); }, std::move(cb));
}

void FileSystem::fdatasync(FileHandle handle, Callback<void> cb) {
    dispatch<void>("fdatasync", [this, handle] { return fdatasync_sync(handle); }, std::move(cb));
}

void FileSystem::chmod(const std::string& path, mode_t mode, Callback<void> cb) {
    dispatch<void>("chmod", [this, path, mode] { return chmod_sync(path, mode); }, std::move(cb));
}

void FileSystem::fchmod(FileHandle handle, mode_t mode, Callback<void> cb) {
    dispatch<void>("fchmod", [this, handle, mode] { return fchmod_sync(handle, mode); }, std::move(cb));
}

void FileSystem::chown(const std::string& path, uid_t uid, gid_t gid, Callback<void> cb) {
    dispatch<void>("chown", [this, path, uid, gid] { return chown_sync(path, uid, gid); }, std::move(cb));
}

void FileSystem::utimes(const std::string& path, Timestamp atime, Timestamp mtime, Callback<void> cb) {
    dispatch<void>("utime", [this, path, atime, mtime] { return utimes_sync(path, atime, mtime); },
                   std::move(cb));
}

void FileSystem::futimes(FileHandle handle, Timestamp atime, Timestamp mtime, Callback<void> cb) {
    dispatch<void>("futime", [this, handle, atime, mtime] { return futimes_sync(handle, atime, mtime); },
                   std::move(cb));
}

void FileSystem::access(const std::string& path, int mode, Callback<void> cb) {
    dispatch<void>("access", [this, path, mode] { return access_sync(path, mode); }, std::move(cb));
}

void FileSystem::read_file(const std::string& path, Callback<std::string> cb) {
    dispatch<std::string>("read", [this, path] { return read_file_sync(path); }, std::move(cb));
}

void FileSystem::write_file(const std::string& path, std::string data, Callback<void> cb) {
    auto owned = std::make_shared<std::string>(std::move(data));
    dispatch<void>("write", [this, path, owned] { return write_file_sync(path, *owned); }, std::move(cb));
}

void FileSystem::append_file(const std::string& path, std::string data, Callback<void> cb) {
    auto owned = std::make_shared<std::string>(std::move(data));
    dispatch<void>("write", [this, path, owned] { return append_file_sync(path, *owned); }, std::move(cb));
}

} // namespace asyncfs
