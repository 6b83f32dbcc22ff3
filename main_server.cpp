/*
* @license
* (C) zachbabanov
*
*/

#include <server.hpp>
#include <config.hpp>
#include <frame_source.hpp>
#include <logger.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace framecast::config;
using namespace framecast::server;
using namespace framecast::video;

static std::atomic<StreamServer*> g_server{nullptr};

static void on_signal(int) {
    StreamServer *srv = g_server.load();
    if (srv) srv->request_stop();
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: blocking reads on the capture pipe return EINTR
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);
}

static std::unique_ptr<FrameSource> open_source(const ServerConfig &cfg) {
    if (cfg.source_mode == "file") {
        auto src = std::make_unique<AnnexBFileSource>(cfg.source, cfg.loop);
        if (!src->open()) return nullptr;
        return src;
    }
    std::string cmd = cfg.source_mode == "camera"
                      ? ffmpeg_capture_command(cfg.source, cfg.width, cfg.height, cfg.fps)
                      : cfg.source;
    auto src = std::make_unique<CommandFrameSource>(cmd);
    if (!src->open()) return nullptr;
    return src;
}

int main(int argc, char** argv) {
    ServerConfig cfg;
    try {
        if (!parse_server_args(argc, argv, default_config_path(argc > 0 ? argv[0] : nullptr), cfg)) {
            print_server_usage(argv[0]);
            return 0;
        }
    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_server_usage(argv[0]);
        return 1;
    }

    setup_logging(cfg.log_level, cfg.log_file);
    LOG_GEN_INFO("Starting server: port={} source_mode={} source='{}' loop={} fps={} payload={}",
                 cfg.port, cfg.source_mode, cfg.source, cfg.loop ? 1 : 0, cfg.fps, cfg.payload_size);

    std::unique_ptr<FrameSource> source = open_source(cfg);
    if (!source) {
        LOG_GEN_ERROR("Cannot open frame source '{}'", cfg.source);
        return 1;
    }

    StreamServer srv(cfg);
    if (!srv.start()) {
        LOG_GEN_ERROR("Server failed to start");
        return 1;
    }
    g_server.store(&srv);
    install_signal_handlers();

    srv.run(*source);

    g_server.store(nullptr);
    srv.stop();
    return 0;
}
