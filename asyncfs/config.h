#ifndef ASYNCFS_CONFIG_H
#define ASYNCFS_CONFIG_H

#include "asyncfs/encoding.h"
#include "asyncfs/log.h"
#include "asyncfs/result.h"
#include <string>
#include <sys/types.h>

namespace asyncfs {

struct Config {
    unsigned worker_threads = 4;
    Encoding default_encoding = Encoding::Utf8;
    unsigned watch_file_interval_ms = 5007;
    LogLevel log_level = LogLevel::Info;
    mode_t default_file_mode = 0666;
    mode_t default_dir_mode = 0777;

    static Result<Config> parse(const std::string& json);
    static Result<Config> load(const std::string& path);
};

} // namespace asyncfs

#endif
