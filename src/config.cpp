/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <logger.hpp>
#include <protocol.hpp>

#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <sys/stat.h>
#include <unistd.h>
#include <limits.h>

using json = nlohmann::json;

using namespace framecast::config;
using namespace framecast::log;

static bool file_exists(const std::string &path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static std::string get_exe_dir(const char *argv0) {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf)-1);
    if (len > 0) {
        buf[len] = '\0';
        std::string p(buf);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }

    // fallback: use argv0 path if it contains directory separator
    if (argv0) {
        std::string p(argv0);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
    return "."; // otherwise current directory
}

std::string framecast::config::default_config_path(const char *argv0) {
    return get_exe_dir(argv0) + "/config.json";
}

static json read_json_file(const std::string &path) {
    std::ifstream ifs(path);
    if (!ifs) throw ConfigError(fmt::format("cannot open config file '{}'", path));
    try {
        json j;
        ifs >> j;
        if (!j.is_object()) throw ConfigError(fmt::format("config file '{}' must hold a JSON object", path));
        return j;
    } catch (const json::exception &e) {
        throw ConfigError(fmt::format("error parsing config '{}': {}", path, e.what()));
    }
}

template<typename T>
static void read_key(const json &j, const char *key, T &dst) {
    if (!j.contains(key)) return;
    try {
        dst = j.at(key).get<T>();
    } catch (const json::exception &e) {
        throw ConfigError(fmt::format("config key '{}': {}", key, e.what()));
    }
}

static void read_port(const json &j, uint16_t &dst) {
    long long v = dst;
    read_key(j, "port", v);
    if (v <= 0 || v > 65535) throw ConfigError(fmt::format("config key 'port': out of range (got {})", v));
    dst = (uint16_t)v;
}

void framecast::config::apply_json(ServerConfig &cfg, const json &j) {
    read_port(j, cfg.port);
    read_key(j, "payload_size", cfg.payload_size);
    read_key(j, "client_timeout_s", cfg.client_timeout_s);
    read_key(j, "sweep_interval_s", cfg.sweep_interval_s);
    read_key(j, "status_interval_s", cfg.status_interval_s);
    read_key(j, "max_clients", cfg.max_clients);
    read_key(j, "width", cfg.width);
    read_key(j, "height", cfg.height);
    read_key(j, "fps", cfg.fps);
    read_key(j, "source", cfg.source);
    read_key(j, "source_mode", cfg.source_mode);
    read_key(j, "loop", cfg.loop);
    read_key(j, "log_file", cfg.log_file);
    read_key(j, "log_level", cfg.log_level);
}

void framecast::config::apply_json(ClientConfig &cfg, const json &j) {
    read_key(j, "host", cfg.host);
    read_port(j, cfg.port);
    read_key(j, "payload_size", cfg.payload_size);
    read_key(j, "keepalive_interval_s", cfg.keepalive_interval_s);
    read_key(j, "server_timeout_s", cfg.server_timeout_s);
    read_key(j, "register_timeout_ms", cfg.register_timeout_ms);
    read_key(j, "register_attempts", cfg.register_attempts);
    read_key(j, "stale_frame_ms", cfg.stale_frame_ms);
    read_key(j, "max_pending_frames", cfg.max_pending_frames);
    read_key(j, "output", cfg.output);
    read_key(j, "player", cfg.player);
    read_key(j, "log_file", cfg.log_file);
    read_key(j, "log_level", cfg.log_level);
}

static void require_positive(long long v, const char *name) {
    if (v <= 0) throw ConfigError(fmt::format("{} must be positive (got {})", name, v));
}

static void validate_payload_size(size_t payload_size) {
    const size_t max_payload = framecast::common::MAX_UDP_DATAGRAM - framecast::protocol::CHUNK_HEADER_SIZE;
    if (payload_size == 0 || payload_size > max_payload) {
        throw ConfigError(fmt::format("payload_size must be in 1..{} (got {})", max_payload, payload_size));
    }
}

static void validate_log_level(const std::string &s) {
    Level l;
    if (!parse_level(s, l)) throw ConfigError(fmt::format("unknown log level '{}'", s));
}

void framecast::config::validate(const ServerConfig &cfg) {
    require_positive(cfg.port, "port");
    validate_payload_size(cfg.payload_size);
    require_positive(cfg.client_timeout_s, "client_timeout_s");
    require_positive(cfg.sweep_interval_s, "sweep_interval_s");
    require_positive(cfg.status_interval_s, "status_interval_s");
    require_positive((long long)cfg.max_clients, "max_clients");
    require_positive(cfg.width, "width");
    require_positive(cfg.height, "height");
    require_positive(cfg.fps, "fps");
    if (cfg.source_mode != "file" && cfg.source_mode != "command" && cfg.source_mode != "camera") {
        throw ConfigError(fmt::format("source_mode must be file, command or camera (got '{}')", cfg.source_mode));
    }
    if (cfg.source.empty()) throw ConfigError("no frame source given");
    validate_log_level(cfg.log_level);
}

void framecast::config::validate(const ClientConfig &cfg) {
    if (cfg.host.empty()) throw ConfigError("server host not specified");
    require_positive(cfg.port, "port");
    validate_payload_size(cfg.payload_size);
    require_positive(cfg.keepalive_interval_s, "keepalive_interval_s");
    require_positive(cfg.server_timeout_s, "server_timeout_s");
    if (cfg.keepalive_interval_s >= cfg.server_timeout_s) {
        throw ConfigError(fmt::format("keepalive_interval_s must be shorter than the {} s server timeout",
                                      cfg.server_timeout_s));
    }
    require_positive(cfg.register_timeout_ms, "register_timeout_ms");
    require_positive(cfg.register_attempts, "register_attempts");
    require_positive(cfg.stale_frame_ms, "stale_frame_ms");
    require_positive((long long)cfg.max_pending_frames, "max_pending_frames");
    if (cfg.output.empty() && cfg.player.empty()) throw ConfigError("neither output file nor player given");
    validate_log_level(cfg.log_level);
}

//
// CLI helpers
//

static long long parse_number(const std::string &flag, const std::string &value) {
    try {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception &) {
        throw ConfigError(fmt::format("{} expects a number (got '{}')", flag, value));
    }
}

static uint16_t parse_port(const std::string &flag, const std::string &value) {
    long long v = parse_number(flag, value);
    if (v <= 0 || v > 65535) throw ConfigError(fmt::format("{}: port out of range (got {})", flag, v));
    return (uint16_t)v;
}

static int parse_int(const std::string &flag, const std::string &value) {
    long long v = parse_number(flag, value);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError(fmt::format("{}: value out of range (got {})", flag, v));
    }
    return (int)v;
}

static size_t parse_size(const std::string &flag, const std::string &value) {
    long long v = parse_number(flag, value);
    if (v < 0) throw ConfigError(fmt::format("{} must not be negative (got {})", flag, v));
    return (size_t)v;
}

/**
 * Split "--flag value" pairs from positionals; `--config` is resolved first so that the
 * JSON layer sits under every other flag regardless of argument order.
 */
struct CliArgs {
    std::vector<std::pair<std::string, std::string>> flags; // value empty for switches
    std::vector<std::string> positional;
    std::string config_path;
    bool config_set = false;
    bool help = false;
};

static CliArgs split_args(int argc, char **argv, const std::vector<std::string> &switches) {
    CliArgs out;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") {
            out.help = true;
        } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            bool is_switch = false;
            for (auto &s : switches) if (s == a) is_switch = true;
            if (is_switch) {
                out.flags.emplace_back(a, "");
                continue;
            }
            if (i + 1 >= argc) throw ConfigError(fmt::format("{} requires a value", a));
            std::string v(argv[++i]);
            if (a == "--config") {
                out.config_path = v;
                out.config_set = true;
            } else {
                out.flags.emplace_back(a, v);
            }
        } else {
            out.positional.push_back(a);
        }
    }
    return out;
}

static void load_config_layer(const CliArgs &args, const std::string &default_path, json &out, bool &loaded) {
    loaded = false;
    if (args.config_set) {
        if (!file_exists(args.config_path)) throw ConfigError(fmt::format("config file '{}' not found", args.config_path));
        out = read_json_file(args.config_path);
        loaded = true;
    } else if (!default_path.empty() && file_exists(default_path)) {
        out = read_json_file(default_path);
        loaded = true;
    }
}

bool framecast::config::parse_server_args(int argc, char **argv, const std::string &default_config_path, ServerConfig &out) {
    CliArgs args = split_args(argc, argv, {"--loop", "--no-loop"});
    if (args.help) return false;

    ServerConfig cfg;
    json j;
    bool loaded = false;
    load_config_layer(args, default_config_path, j, loaded);
    if (loaded) apply_json(cfg, j);

    for (auto &kv : args.flags) {
        const std::string &f = kv.first;
        const std::string &v = kv.second;
        if (f == "--port") cfg.port = parse_port(f, v);
        else if (f == "--payload-size") cfg.payload_size = parse_size(f, v);
        else if (f == "--client-timeout") cfg.client_timeout_s = parse_int(f, v);
        else if (f == "--sweep-interval") cfg.sweep_interval_s = parse_int(f, v);
        else if (f == "--status-interval") cfg.status_interval_s = parse_int(f, v);
        else if (f == "--max-clients") cfg.max_clients = parse_size(f, v);
        else if (f == "--width") cfg.width = parse_int(f, v);
        else if (f == "--height") cfg.height = parse_int(f, v);
        else if (f == "--fps") cfg.fps = parse_int(f, v);
        else if (f == "--source-mode") cfg.source_mode = v;
        else if (f == "--command") { cfg.source_mode = "command"; cfg.source = v; }
        else if (f == "--camera") { cfg.source_mode = "camera"; cfg.source = v; }
        else if (f == "--loop") cfg.loop = true;
        else if (f == "--no-loop") cfg.loop = false;
        else if (f == "--log") cfg.log_file = v;
        else if (f == "--log-level") cfg.log_level = v;
        else throw ConfigError(fmt::format("unknown option '{}'", f));
    }

    // positional: [source]
    if (args.positional.size() > 1) throw ConfigError("too many positional arguments");
    if (!args.positional.empty()) {
        cfg.source = args.positional[0];
        cfg.source_mode = "file";
    }

    validate(cfg);
    out = cfg;
    return true;
}

bool framecast::config::parse_client_args(int argc, char **argv, const std::string &default_config_path, ClientConfig &out) {
    CliArgs args = split_args(argc, argv, {});
    if (args.help) return false;

    ClientConfig cfg;
    json j;
    bool loaded = false;
    load_config_layer(args, default_config_path, j, loaded);
    if (loaded) apply_json(cfg, j);

    for (auto &kv : args.flags) {
        const std::string &f = kv.first;
        const std::string &v = kv.second;
        if (f == "--port") cfg.port = parse_port(f, v);
        else if (f == "--payload-size") cfg.payload_size = parse_size(f, v);
        else if (f == "--keepalive") cfg.keepalive_interval_s = parse_int(f, v);
        else if (f == "--server-timeout") cfg.server_timeout_s = parse_int(f, v);
        else if (f == "--register-timeout") cfg.register_timeout_ms = parse_int(f, v);
        else if (f == "--register-attempts") cfg.register_attempts = parse_int(f, v);
        else if (f == "--stale-ms") cfg.stale_frame_ms = parse_int(f, v);
        else if (f == "--max-pending") cfg.max_pending_frames = parse_size(f, v);
        else if (f == "--output") cfg.output = v;
        else if (f == "--player") cfg.player = v;
        else if (f == "--log") cfg.log_file = v;
        else if (f == "--log-level") cfg.log_level = v;
        else throw ConfigError(fmt::format("unknown option '{}'", f));
    }

    // positional: <host[:port]>
    if (args.positional.size() > 1) throw ConfigError("too many positional arguments");
    if (!args.positional.empty()) {
        const std::string &hp = args.positional[0];
        size_t colon = hp.rfind(':');
        if (colon == std::string::npos) {
            cfg.host = hp;
        } else {
            cfg.host = hp.substr(0, colon);
            cfg.port = parse_port("host:port", hp.substr(colon + 1));
        }
    }

    validate(cfg);
    out = cfg;
    return true;
}

void framecast::config::print_server_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [options] [h264_file]\n"
              << "  --config <path>           JSON config (default: config.json next to the binary)\n"
              << "  --port <n>                UDP port to bind (default 9999)\n"
              << "  --payload-size <n>        chunk payload bytes (default 1200)\n"
              << "  --fps <n> --width <n> --height <n>\n"
              << "  --loop | --no-loop        replay the file source\n"
              << "  --command <cmd>           read H.264 from a shell command's stdout\n"
              << "  --camera <dev>            capture and encode <dev> with ffmpeg\n"
              << "  --max-clients <n> --client-timeout <s> --sweep-interval <s> --status-interval <s>\n"
              << "  --log <file> --log-level trace|debug|info|warn|error\n";
    std::cerr << "CLI options override values from the config file.\n";
    std::cerr << "Example: " << prog << " --fps 25 --loop test.h264\n";
}

void framecast::config::print_client_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [options] <host[:port]>\n"
              << "  --config <path>           JSON config (default: config.json next to the binary)\n"
              << "  --port <n>                server UDP port (default 9999)\n"
              << "  --payload-size <n>        must match the server (default 1200)\n"
              << "  --output <file>           write frames to a file instead of playing them\n"
              << "  --player <cmd>            player binary fed on stdin (default ffplay)\n"
              << "  --keepalive <s> --server-timeout <s>\n"
              << "  --register-timeout <ms> --register-attempts <n>\n"
              << "  --stale-ms <ms> --max-pending <n>\n"
              << "  --log <file> --log-level trace|debug|info|warn|error\n";
    std::cerr << "CLI options override values from the config file.\n";
    std::cerr << "Example: " << prog << " --log client.log 127.0.0.1:9999\n";
}

void framecast::config::setup_logging(const std::string &log_level, const std::string &log_file) {
    Level desired_level = Level::INFO;
    if (!log_level.empty() && !parse_level(log_level, desired_level)) {
        std::cerr << "Warning: unknown log level '" << log_level << "', using info.\n";
    }
    Logger::instance().set_level(desired_level);

    if (!log_file.empty() && !Logger::instance().open_logfile(log_file)) {
        std::cerr << "Warning: could not open log file '" << log_file << "' for append, continuing without file logging\n";
    }
}
