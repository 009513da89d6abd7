#include "fs_fixture.h"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace asyncfs;

TEST_F(FsTest, AsyncOpenWriteReadClose) {
    auto buf = std::make_shared<std::vector<char>>(32);
    std::string read_back;
    bool closed = false;
    FileHandle handle;

    fs_.open(path("f"), OpenFlags::WriteRead, [&](Result<FileHandle> opened) {
        ASSERT_TRUE(opened.ok()) << opened.error().message();
        handle = opened.value();
        fs_.write(handle, "async data", std::nullopt, [&](Result<size_t> written) {
            ASSERT_TRUE(written.ok());
            EXPECT_EQ(written.value(), 10u);
            fs_.read(handle, buf->data(), buf->size(), 0, [&, buf](Result<size_t> n) {
                ASSERT_TRUE(n.ok());
                read_back.assign(buf->data(), n.value());
                fs_.close(handle, [&](Result<void> r) { closed = r.ok(); });
            });
        });
    });
    arm_deadline();
    loop_.run();

    EXPECT_EQ(read_back, "async data");
    EXPECT_TRUE(closed);
    EXPECT_EQ(fs_.open_handles(), 0u);
}

TEST_F(FsTest, AsyncFailureReachesCallbackOnce) {
    int calls = 0;
    fs_.open(path("missing"), OpenFlags::Read, [&](Result<FileHandle> r) {
        ++calls;
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.code(), ErrorCode::NotFound);
        EXPECT_EQ(r.error().path, path("missing"));
    });
    arm_deadline();
    loop_.run();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(loop_.pending(), 0);
}

TEST_F(FsTest, AsyncCallbacksRunOnLoopThread) {
    make_file("f", "x");
    auto loop_thread = std::this_thread::get_id();
    int calls = 0;
    for (int i = 0; i < 100; ++i) {
        fs_.stat(path("f"), [&](Result<FileStats> r) {
            ++calls;
            EXPECT_TRUE(r.ok());
            EXPECT_EQ(std::this_thread::get_id(), loop_thread);
        });
    }
    EXPECT_EQ(loop_.pending(), 100);
    arm_deadline();
    loop_.run();
    EXPECT_EQ(calls, 100);
}

TEST_F(FsTest, AsyncRequiresCallback) {
    EXPECT_THROW(fs_.stat(path("f"), Callback<FileStats>()), std::invalid_argument);
    EXPECT_THROW(fs_.close(FileHandle(), Callback<void>()), std::invalid_argument);
    EXPECT_EQ(loop_.pending(), 0);
    EXPECT_FALSE(loop_.alive());
}

TEST_F(FsTest, AsyncDoubleClose) {
    make_file("f", "");
    auto h = fs_.open_sync(path("f"), OpenFlags::Read);
    ASSERT_TRUE(h.ok());
    std::vector<ErrorCode> codes;
    bool first_ok = false;
    fs_.close(h.value(), [&](Result<void> r) {
        first_ok = r.ok();
        fs_.close(h.value(), [&](Result<void> again) {
            ASSERT_FALSE(again.ok());
            codes.push_back(again.code());
        });
    });
    arm_deadline();
    loop_.run();
    EXPECT_TRUE(first_ok);
    EXPECT_EQ(codes, (std::vector<ErrorCode>{ErrorCode::InvalidHandle}));
}

TEST_F(FsTest, AsyncDirectoryOps) {
    std::vector<std::string> listing;
    bool removed = false;
    fs_.mkdir(path("d"), [&](Result<void> made) {
        ASSERT_TRUE(made.ok());
        fs_.write_file(path("d/one"), "1", [&](Result<void> w) {
            ASSERT_TRUE(w.ok());
            fs_.append_file(path("d/one"), "2", [&](Result<void> a) {
                ASSERT_TRUE(a.ok());
                fs_.readdir(path("d"), [&](Result<std::vector<std::string>> names) {
                    ASSERT_TRUE(names.ok());
                    listing = names.value();
                    fs_.rmdir(path("d"), [&](Result<void> r) {
                        EXPECT_EQ(r.code(), ErrorCode::IOError);
                        removed = true;
                    });
                });
            });
        });
    });
    arm_deadline();
    loop_.run();
    EXPECT_EQ(listing, (std::vector<std::string>{"one"}));
    EXPECT_TRUE(removed);
    EXPECT_EQ(fs_.read_file_sync(path("d/one")).value(), "12");
}

TEST_F(FsTest, AsyncReadFileAndStatVariants) {
    make_file("f", "contents");
    ASSERT_TRUE(fs_.symlink_sync("f", path("l")).ok());
    std::string data;
    bool lstat_link = false;
    bool stat_file = false;
    fs_.read_file(path("f"), [&](Result<std::string> r) { data = r.value(); });
    fs_.lstat(path("l"), [&](Result<FileStats> r) { lstat_link = r.ok() && r.value().is_symlink(); });
    fs_.stat(path("l"), [&](Result<FileStats> r) { stat_file = r.ok() && r.value().is_file(); });
    arm_deadline();
    loop_.run();
    EXPECT_EQ(data, "contents");
    EXPECT_TRUE(lstat_link);
    EXPECT_TRUE(stat_file);
}

TEST_F(FsTest, AsyncRenameUnlinkSymlinkReadlink) {
    make_file("a", "x");
    std::string link_target;
    bool gone = false;
    fs_.rename(path("a"), path("b"), [&](Result<void> r) {
        ASSERT_TRUE(r.ok());
        fs_.symlink("b", path("s"), [&](Result<void> s) {
            ASSERT_TRUE(s.ok());
            fs_.readlink(path("s"), [&](Result<std::string> t) {
                link_target = t.value();
                fs_.unlink(path("b"), [&](Result<void> u) {
                    ASSERT_TRUE(u.ok());
                    fs_.access(path("b"), F_OK, [&](Result<void> acc) { gone = acc.code() == ErrorCode::NotFound; });
                });
            });
        });
    });
    arm_deadline();
    loop_.run();
    EXPECT_EQ(link_target, "b");
    EXPECT_TRUE(gone);
}

TEST_F(FsTest, RacingTimerAgainstOperation) {
    make_file("f", "x");
    // Whichever fires first wins; the loser must notice and do nothing
    auto settled = std::make_shared<bool>(false);
    std::string outcome;
    auto timer = loop_.add_timer(std::chrono::seconds(10), [&, settled] {
        if (*settled) return;
        *settled = true;
        outcome = "timeout";
    });
    fs_.read_file(path("f"), [&, settled, timer](Result<std::string> r) {
        if (*settled) return;
        *settled = true;
        outcome = r.ok() ? "done" : "error";
        loop_.cancel_timer(timer);
    });
    arm_deadline();
    loop_.run();
    EXPECT_EQ(outcome, "done");
}
