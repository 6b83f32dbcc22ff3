/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <config.hpp>
#include <frame_sink.hpp>
#include <logger.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace framecast::config;
using namespace framecast::client;
using namespace framecast::video;

static std::atomic<ViewerClient*> g_client{nullptr};

static void on_signal(int) {
    ViewerClient *c = g_client.load();
    if (c) c->request_stop();
}

static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // a player that exits must surface as EPIPE on write, not kill us
    signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char **argv) {
    ClientConfig cfg;
    try {
        if (!parse_client_args(argc, argv, default_config_path(argc > 0 ? argv[0] : nullptr), cfg)) {
            print_client_usage(argv[0]);
            return 0;
        }
    } catch (const ConfigError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_client_usage(argv[0]);
        return 1;
    }

    setup_logging(cfg.log_level, cfg.log_file);
    install_signal_handlers();

    LOG_GEN_INFO("Starting client -> {}:{} payload={} stale_ms={} output='{}'",
                 cfg.host, cfg.port, cfg.payload_size, cfg.stale_frame_ms,
                 cfg.output.empty() ? cfg.player : cfg.output);

    std::unique_ptr<FrameSink> sink;
    if (!cfg.output.empty()) {
        auto file = std::make_unique<FileFrameSink>(cfg.output);
        if (!file->open()) return 1;
        sink = std::move(file);
    } else {
        auto player = std::make_unique<PlayerSink>(cfg.player, framecast::player::PlayerProcess::default_args("framecast " + cfg.host));
        if (!player->start()) {
            LOG_GEN_ERROR("Failed to launch player '{}'", cfg.player);
            return 1;
        }
        sink = std::move(player);
    }

    ViewerClient c(cfg, *sink);
    g_client.store(&c);

    int rc = 0;
    if (!c.connect()) {
        LOG_GEN_ERROR("Could not register with {}:{}", cfg.host, cfg.port);
        rc = 1;
    } else if (!c.run()) {
        LOG_GEN_ERROR("Client run failed");
        rc = 2;
    }

    g_client.store(nullptr);
    c.stop();
    return rc;
}
