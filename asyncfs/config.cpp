#include "asyncfs/config.h"
#include <cerrno>
#include <climits>
#include <fstream>
#include <json/json.h>
#include <sstream>

namespace asyncfs {

static Error bad_config(const std::string& what) {
    return Error::make(ErrorCode::InvalidArgument, "config", what);
}

Result<Config> Config::parse(const std::string& json) {
    Json::CharReaderBuilder b;
    Json::Value root;
    std::istringstream s(json);
    std::string errs;
    if (!Json::parseFromStream(b, s, &root, &errs)) return bad_config(errs);
    if (!root.isObject()) return bad_config("top level must be an object");

    Config cfg;
    if (root.isMember("worker_threads")) {
        const Json::Value& v = root["worker_threads"];
        if (!v.isUInt() || v.asUInt() == 0) return bad_config("worker_threads");
        cfg.worker_threads = v.asUInt();
    }
    if (root.isMember("default_encoding")) {
        const Json::Value& v = root["default_encoding"];
        if (!v.isString() || !parse_encoding(v.asString(), cfg.default_encoding)) return bad_config("default_encoding");
    }
    if (root.isMember("watch_file_interval_ms")) {
        const Json::Value& v = root["watch_file_interval_ms"];
        if (!v.isUInt() || v.asUInt() == 0 || v.asUInt() > static_cast<unsigned>(INT_MAX)) {
            return bad_config("watch_file_interval_ms");
        }
        cfg.watch_file_interval_ms = v.asUInt();
    }
    if (root.isMember("log_level")) {
        const Json::Value& v = root["log_level"];
        if (!v.isString() || !parse_log_level(v.asString(), cfg.log_level)) return bad_config("log_level");
    }
    if (root.isMember("default_file_mode")) {
        const Json::Value& v = root["default_file_mode"];
        if (!v.isUInt() || v.asUInt() > 07777) return bad_config("default_file_mode");
        cfg.default_file_mode = v.asUInt();
    }
    if (root.isMember("default_dir_mode")) {
        const Json::Value& v = root["default_dir_mode"];
        if (!v.isUInt() || v.asUInt() > 07777) return bad_config("default_dir_mode");
        cfg.default_dir_mode = v.asUInt();
    }
    return cfg;
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) return Error::from_errno(errno ? errno : ENOENT, "open", path);
    std::stringstream buf;
    buf << ifs.rdbuf();
    return parse(buf.str());
}

} // namespace asyncfs
