#include "asyncfs/config.h"
#include "asyncfs/event_loop.h"
#include "asyncfs/file_system.h"
#include "asyncfs/log.h"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <json/json.h>
#include <memory>
#include <string>
#include <vector>

using namespace asyncfs;

namespace {

EventLoop *running_loop = nullptr;
int exit_code = 0;

void usage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] <command> [args]\n"
              << "  cat <path>                 print a file\n"
              << "  write <path> <text>        replace a file's contents\n"
              << "  append <path> <text>       append to a file\n"
              << "  stat|lstat <path>          print stats as JSON\n"
              << "  ls <dir>                   list a directory\n"
              << "  mkdir|rmdir|rm <path>\n"
              << "  mv <from> <to>\n"
              << "  ln <existing> <new>\n"
              << "  symlink <target> <path>\n"
              << "  readlink|realpath <path>\n"
              << "  watch [-r] <path>          print change events until interrupted\n"
              << "  watchfile <path> [ms]      poll a path until interrupted\n";
}

void on_signal(int) {
    if (running_loop) running_loop->stop();
}

// Prints the error and records a failing exit status.
template <typename T>
bool report(const Result<T>& r) {
    if (r.ok()) return true;
    std::cerr << "fsctl: " << r.error().message() << std::endl;
    exit_code = 1;
    return false;
}

Callback<void> done() {
    return [](Result<void> r) { report(r); };
}

std::string stats_json(const FileStats& st) {
    Json::Value jn;
    st.to_json(jn);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, jn);
}

bool dispatch_command(FileSystem& fs, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto need = [&](size_t n) { return args.size() == n + 1; };

    if (cmd == "cat" && need(1)) {
        fs.read_file(args[1], [](Result<std::string> r) {
            if (report(r)) std::cout << r.value();
        });
    } else if (cmd == "write" && need(2)) {
        fs.write_file(args[1], args[2], done());
    } else if (cmd == "append" && need(2)) {
        fs.append_file(args[1], args[2], done());
    } else if ((cmd == "stat" || cmd == "lstat") && need(1)) {
        auto print = [](Result<FileStats> r) {
            if (report(r)) std::cout << stats_json(r.value()) << std::endl;
        };
        if (cmd == "stat") fs.stat(args[1], print);
        else fs.lstat(args[1], print);
    } else if (cmd == "ls" && need(1)) {
        fs.readdir(args[1], [](Result<std::vector<std::string>> r) {
            if (!report(r)) return;
            for (const auto& name : r.value()) {
                std::cout << name << "\n";
            }
        });
    } else if (cmd == "mkdir" && need(1)) {
        fs.mkdir(args[1], done());
    } else if (cmd == "rmdir" && need(1)) {
        fs.rmdir(args[1], done());
    } else if (cmd == "rm" && need(1)) {
        fs.unlink(args[1], done());
    } else if (cmd == "mv" && need(2)) {
        fs.rename(args[1], args[2], done());
    } else if (cmd == "ln" && need(2)) {
        fs.link(args[1], args[2], done());
    } else if (cmd == "symlink" && need(2)) {
        fs.symlink(args[1], args[2], done());
    } else if ((cmd == "readlink" || cmd == "realpath") && need(1)) {
        auto print = [](Result<std::string> r) {
            if (report(r)) std::cout << r.value() << std::endl;
        };
        if (cmd == "readlink") fs.readlink(args[1], print);
        else fs.realpath(args[1], print);
    } else if (cmd == "watch" && (need(1) || (need(2) && args[1] == "-r"))) {
        WatchOptions opts;
        opts.recursive = args.size() == 3;
        auto sub = fs.watch(args.back(), opts, [](Result<WatchEvent> r) {
            if (!report(r)) return;
            const WatchEvent& ev = r.value();
            std::cout << watch_event_name(ev.kind) << " " << ev.filename.value_or("-") << std::endl;
        });
        report(sub);
    } else if (cmd == "watchfile" && (need(1) || need(2))) {
        WatchFileOptions opts;
        if (args.size() == 3) opts.interval_ms = static_cast<unsigned>(std::atoi(args[2].c_str()));
        fs.watch_file(args[1], opts, [](const FileStats& curr, const FileStats& prev) {
            std::cout << "size " << prev.size << " -> " << curr.size << ", mtime " << prev.mtime.millis()
                      << " -> " << curr.mtime.millis() << std::endl;
        });
    } else {
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Config config;
    if (args.size() >= 2 && args[0] == "--config") {
        auto loaded = Config::load(args[1]);
        if (!report(loaded)) return 1;
        config = loaded.value();
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }
    set_log_level(config.log_level);

    EventLoop loop;
    FileSystem fs(loop, config);
    if (!dispatch_command(fs, args)) {
        usage(argv[0]);
        return 1;
    }

    running_loop = &loop;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    loop.run();
    running_loop = nullptr;
    return exit_code;
}
