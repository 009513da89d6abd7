#include "fs_fixture.h"
#include <algorithm>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

using namespace asyncfs;

TEST_F(FsTest, OpenMissingFileFails) {
    auto h = fs_.open_sync(path("missing"), OpenFlags::Read);
    ASSERT_FALSE(h.ok());
    EXPECT_EQ(h.code(), ErrorCode::NotFound);
    EXPECT_EQ(h.error().syscall, "open");
    EXPECT_EQ(h.error().path, path("missing"));
}

TEST_F(FsTest, ExclusiveCreateRefusesExistingFile) {
    make_file("f", "x");
    EXPECT_EQ(fs_.open_sync(path("f"), OpenFlags::WriteExclusive).code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(fs_.open_sync(path("f"), OpenFlags::ReadWriteExclusive).code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(fs_.open_sync(path("f"), OpenFlags::AppendExclusive).code(), ErrorCode::AlreadyExists);

    auto h = fs_.open_sync(path("g"), OpenFlags::WriteExclusive);
    ASSERT_TRUE(h.ok());
    EXPECT_TRUE(fs_.close_sync(h.value()).ok());
}

TEST_F(FsTest, OpenAppliesMode) {
    auto h = fs_.open_sync(path("f"), OpenFlags::Write, 0600);
    ASSERT_TRUE(h.ok());
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
    EXPECT_EQ(fs_.stat_sync(path("f")).value().mode & 0777, 0600u);
}

TEST_F(FsTest, SecondCloseIsInvalidHandle) {
    make_file("f", "data");
    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    EXPECT_EQ(fs_.open_handles(), 1u);
    EXPECT_TRUE(fs_.close_sync(h.value()).ok());
    EXPECT_EQ(fs_.open_handles(), 0u);

    auto again = fs_.close_sync(h.value());
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.code(), ErrorCode::InvalidHandle);

    char buf[4];
    EXPECT_EQ(fs_.read_sync(h.value(), buf, sizeof(buf)).code(), ErrorCode::InvalidHandle);
    EXPECT_EQ(fs_.write_sync(h.value(), std::string("x")).code(), ErrorCode::InvalidHandle);
    EXPECT_EQ(fs_.fstat_sync(h.value()).code(), ErrorCode::InvalidHandle);
    EXPECT_EQ(fs_.fsync_sync(h.value()).code(), ErrorCode::InvalidHandle);
    EXPECT_EQ(fs_.close_sync(FileHandle()).code(), ErrorCode::InvalidHandle);
}

TEST_F(FsTest, ReadAtAndPastEndReturnsZero) {
    make_file("f", "hello");
    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    char buf[16];
    EXPECT_EQ(fs_.read_sync(h.value(), buf, sizeof(buf), 5).value(), 0u);
    EXPECT_EQ(fs_.read_sync(h.value(), buf, sizeof(buf), 100).value(), 0u);
    EXPECT_EQ(fs_.read_sync(h.value(), buf, sizeof(buf), -1).code(), ErrorCode::InvalidArgument);

    auto n = fs_.read_sync(h.value(), buf, 3, 1);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(std::string(buf, n.value()), "ell");
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
}

TEST_F(FsTest, ReadWithoutPositionAdvances) {
    make_file("f", "abcdef");
    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    char buf[4];
    ASSERT_EQ(fs_.read_sync(h.value(), buf, 4).value(), 4u);
    EXPECT_EQ(std::string(buf, 4), "abcd");
    // Positional reads leave the offset alone
    ASSERT_EQ(fs_.read_sync(h.value(), buf, 1, 0).value(), 1u);
    auto n = fs_.read_sync(h.value(), buf, 4);
    ASSERT_TRUE(n.ok());
    EXPECT_EQ(std::string(buf, n.value()), "ef");
    EXPECT_EQ(fs_.read_sync(h.value(), buf, 4).value(), 0u);
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
}

TEST_F(FsTest, PositionalWrite) {
    make_file("f", "0123456789");
    auto h = fs_.open_sync(path("f"), OpenFlags::ReadWrite);
    ASSERT_TRUE(h.ok());
    EXPECT_EQ(fs_.write_sync(h.value(), std::string("AB"), 4).value(), 2u);
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
    EXPECT_EQ(fs_.read_file_sync(path("f")).value(), "0123AB6789");
}

TEST_F(FsTest, AppendHandleIgnoresPosition) {
    make_file("f", "abc");
    auto h = fs_.open_sync(path("f"), OpenFlags::Append);
    ASSERT_TRUE(h.ok());
    EXPECT_EQ(fs_.write_sync(h.value(), std::string("XY"), 0).value(), 2u);
    EXPECT_EQ(fs_.write_sync(h.value(), std::string("Z")).value(), 1u);
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());

    auto st = fs_.stat_sync(path("f"));
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(st.value().size, 6);
    EXPECT_EQ(fs_.read_file_sync(path("f")).value(), "abcXYZ");
}

TEST_F(FsTest, WriteFileReadFileKeepsBinaryData) {
    std::string data("\x00\x01\xFFline\n\x00", 8);
    ASSERT_TRUE(fs_.write_file_sync(path("bin"), data).ok());
    EXPECT_EQ(fs_.read_file_sync(path("bin")).value(), data);

    ASSERT_TRUE(fs_.write_file_sync(path("bin"), "short").ok());
    EXPECT_EQ(fs_.read_file_sync(path("bin")).value(), "short");

    std::string big(200000, 'q');
    ASSERT_TRUE(fs_.write_file_sync(path("big"), big).ok());
    EXPECT_EQ(fs_.read_file_sync(path("big")).value(), big);
}

TEST_F(FsTest, AppendFileCreatesThenAppends) {
    ASSERT_TRUE(fs_.append_file_sync(path("log"), "one\n").ok());
    ASSERT_TRUE(fs_.append_file_sync(path("log"), "two\n").ok());
    EXPECT_EQ(fs_.read_file_sync(path("log")).value(), "one\ntwo\n");
}

TEST_F(FsTest, ReadFileOnDirectory) {
    EXPECT_EQ(fs_.read_file_sync(dir_).code(), ErrorCode::IsADirectory);
    EXPECT_EQ(fs_.read_file_sync(path("none")).code(), ErrorCode::NotFound);
}

TEST_F(FsTest, StatAndLstatOnSymlink) {
    make_file("target", "12345");
    ASSERT_TRUE(fs_.symlink_sync("target", path("link")).ok());

    auto target = fs_.stat_sync(path("target"));
    auto followed = fs_.stat_sync(path("link"));
    auto own = fs_.lstat_sync(path("link"));
    ASSERT_TRUE(target.ok());
    ASSERT_TRUE(followed.ok());
    ASSERT_TRUE(own.ok());

    EXPECT_TRUE(followed.value().is_file());
    EXPECT_EQ(followed.value().ino, target.value().ino);
    EXPECT_EQ(followed.value().size, 5);
    EXPECT_TRUE(own.value().is_symlink());
    EXPECT_NE(own.value().ino, target.value().ino);

    // Not a link: both agree
    EXPECT_EQ(fs_.lstat_sync(path("target")).value().ino, target.value().ino);
    EXPECT_EQ(fs_.readlink_sync(path("link")).value(), "target");
    EXPECT_EQ(fs_.readlink_sync(path("target")).code(), ErrorCode::InvalidArgument);
}

TEST_F(FsTest, DanglingSymlink) {
    ASSERT_TRUE(fs_.symlink_sync("nowhere", path("dangling")).ok());
    EXPECT_EQ(fs_.stat_sync(path("dangling")).code(), ErrorCode::NotFound);
    EXPECT_TRUE(fs_.lstat_sync(path("dangling")).ok());
}

TEST_F(FsTest, StatThroughFileComponent) {
    make_file("f", "");
    EXPECT_EQ(fs_.stat_sync(path("f/child")).code(), ErrorCode::NotADirectory);
}

TEST_F(FsTest, FstatMatchesStat) {
    make_file("f", "abc");
    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    auto a = fs_.fstat_sync(h.value());
    auto b = fs_.stat_sync(path("f"));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.value().ino, b.value().ino);
    EXPECT_EQ(a.value().size, 3);
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
}

TEST_F(FsTest, MkdirAndRmdir) {
    ASSERT_TRUE(fs_.mkdir_sync(path("d")).ok());
    EXPECT_TRUE(fs_.stat_sync(path("d")).value().is_directory());
    EXPECT_EQ(fs_.mkdir_sync(path("d")).code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(fs_.mkdir_sync(path("no/such/parent")).code(), ErrorCode::NotFound);

    make_file("d/inside", "");
    auto busy = fs_.rmdir_sync(path("d"));
    ASSERT_FALSE(busy.ok());
    EXPECT_EQ(busy.code(), ErrorCode::IOError);
    EXPECT_EQ(busy.error().sys_errno, ENOTEMPTY);

    ASSERT_TRUE(fs_.unlink_sync(path("d/inside")).ok());
    EXPECT_TRUE(fs_.rmdir_sync(path("d")).ok());
    EXPECT_FALSE(fs_.exists_sync(path("d")));
    EXPECT_EQ(fs_.rmdir_sync(path("d")).code(), ErrorCode::NotFound);

    make_file("plain", "");
    EXPECT_EQ(fs_.rmdir_sync(path("plain")).code(), ErrorCode::NotADirectory);
}

TEST_F(FsTest, MkdirAppliesMode) {
    ASSERT_TRUE(fs_.mkdir_sync(path("d"), 0700).ok());
    EXPECT_EQ(fs_.stat_sync(path("d")).value().mode & 0777, 0700u);
}

TEST_F(FsTest, ReaddirSkipsDotEntries) {
    make_file("a", "");
    make_file("b", "");
    ASSERT_TRUE(fs_.mkdir_sync(path("c")).ok());

    auto names = fs_.readdir_sync(dir_);
    ASSERT_TRUE(names.ok());
    std::vector<std::string> got = names.value();
    std::sort(got.begin(), got.end());
    EXPECT_EQ(got, (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_TRUE(fs_.readdir_sync(path("c")).value().empty());
    EXPECT_EQ(fs_.readdir_sync(path("a")).code(), ErrorCode::NotADirectory);
    EXPECT_EQ(fs_.readdir_sync(path("zz")).code(), ErrorCode::NotFound);
    EXPECT_EQ(fs_.readdir_sync(path("zz")).error().syscall, "scandir");
}

TEST_F(FsTest, ReaddirEncodings) {
    make_file("bad\xFF", "");
    auto utf8 = fs_.readdir_sync(dir_, Encoding::Utf8);
    ASSERT_TRUE(utf8.ok());
    ASSERT_EQ(utf8.value().size(), 1u);
    EXPECT_EQ(utf8.value()[0], "bad\xEF\xBF\xBD");

    auto raw = fs_.readdir_sync(dir_, Encoding::Buffer);
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value()[0], "bad\xFF");

    EXPECT_EQ(fs_.readdir_sync(dir_, Encoding::Hex).value()[0], "626164ff");
}

TEST_F(FsTest, RenameUnlinkAndLink) {
    make_file("a", "payload");
    ASSERT_TRUE(fs_.rename_sync(path("a"), path("b")).ok());
    EXPECT_FALSE(fs_.exists_sync(path("a")));
    EXPECT_EQ(fs_.read_file_sync(path("b")).value(), "payload");

    auto missing = fs_.rename_sync(path("a"), path("c"));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
    EXPECT_EQ(missing.error().dest, path("c"));

    ASSERT_TRUE(fs_.link_sync(path("b"), path("hard")).ok());
    EXPECT_EQ(fs_.stat_sync(path("b")).value().nlink, 2u);
    EXPECT_EQ(fs_.link_sync(path("b"), path("hard")).code(), ErrorCode::AlreadyExists);

    ASSERT_TRUE(fs_.unlink_sync(path("b")).ok());
    EXPECT_EQ(fs_.stat_sync(path("hard")).value().nlink, 1u);
    EXPECT_EQ(fs_.unlink_sync(path("b")).code(), ErrorCode::NotFound);
}

TEST_F(FsTest, TruncateBothWays) {
    make_file("f", "0123456789");
    ASSERT_TRUE(fs_.truncate_sync(path("f"), 4).ok());
    EXPECT_EQ(fs_.read_file_sync(path("f")).value(), "0123");
    EXPECT_EQ(fs_.truncate_sync(path("f"), -1).code(), ErrorCode::InvalidArgument);

    auto h = fs_.open_sync(path("f"), OpenFlags::ReadWrite);
    ASSERT_TRUE(h.ok());
    ASSERT_TRUE(fs_.ftruncate_sync(h.value(), 6).ok());
    EXPECT_TRUE(fs_.fsync_sync(h.value()).ok());
    EXPECT_TRUE(fs_.fdatasync_sync(h.value()).ok());
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());
    EXPECT_EQ(fs_.read_file_sync(path("f")).value(), std::string("0123\0\0", 6));
}

TEST_F(FsTest, ChmodAndUtimes) {
    make_file("f", "");
    ASSERT_TRUE(fs_.chmod_sync(path("f"), 0640).ok());
    EXPECT_EQ(fs_.stat_sync(path("f")).value().mode & 0777, 0640u);

    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    ASSERT_TRUE(fs_.fchmod_sync(h.value(), 0600).ok());
    EXPECT_EQ(fs_.stat_sync(path("f")).value().mode & 0777, 0600u);

    Timestamp at{1000000000, 0};
    Timestamp mt{1200000000, 250000000};
    ASSERT_TRUE(fs_.utimes_sync(path("f"), at, mt).ok());
    auto st = fs_.stat_sync(path("f")).value();
    EXPECT_EQ(st.atime, at);
    EXPECT_EQ(st.mtime, mt);

    ASSERT_TRUE(fs_.futimes_sync(h.value(), mt, at).ok());
    EXPECT_EQ(fs_.fstat_sync(h.value()).value().mtime, at);
    ASSERT_TRUE(fs_.close_sync(h.value()).ok());

    EXPECT_EQ(fs_.chmod_sync(path("none"), 0600).code(), ErrorCode::NotFound);
}

TEST_F(FsTest, ChownToSelf) {
    make_file("f", "");
    EXPECT_TRUE(fs_.chown_sync(path("f"), getuid(), getgid()).ok());
}

TEST_F(FsTest, AccessAndExists) {
    make_file("f", "");
    EXPECT_TRUE(fs_.access_sync(path("f")).ok());
    EXPECT_TRUE(fs_.access_sync(path("f"), R_OK | W_OK).ok());
    EXPECT_EQ(fs_.access_sync(path("none")).code(), ErrorCode::NotFound);
    EXPECT_TRUE(fs_.exists_sync(path("f")));
    EXPECT_FALSE(fs_.exists_sync(path("none")));
}

TEST_F(FsTest, HardLinkToDirectoryIsPermissionDenied) {
    ASSERT_TRUE(fs_.mkdir_sync(path("d")).ok());
    // Refused with EPERM even for root
    auto r = fs_.link_sync(path("d"), path("hl"));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.code(), ErrorCode::PermissionDenied);
    EXPECT_EQ(r.error().sys_errno, EPERM);
    EXPECT_EQ(r.error().syscall, "link");
    EXPECT_FALSE(fs_.exists_sync(path("hl")));
}

TEST_F(FsTest, PermissionDenied) {
    if (geteuid() == 0) GTEST_SKIP() << "root bypasses permission checks";
    make_file("locked", "secret");
    ASSERT_TRUE(fs_.chmod_sync(path("locked"), 0).ok());
    EXPECT_EQ(fs_.open_sync(path("locked"), OpenFlags::Read).code(), ErrorCode::PermissionDenied);
    EXPECT_EQ(fs_.read_file_sync(path("locked")).code(), ErrorCode::PermissionDenied);
}
