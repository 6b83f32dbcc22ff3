/*
* @license
* (C) zachbabanov
*
*/

#include <server.hpp>
#include <protocol.hpp>
#include <logger.hpp>

#include <vector>

using namespace framecast::server;
using namespace framecast::common;
using namespace framecast::net;
using namespace framecast::protocol;
using namespace framecast::registry;

helpers::ControlAction framecast::server::helpers::handle_control_datagram(ClientRegistry &registry, DatagramSink &sink,
                                                       const char *data, size_t len,
                                                       const Endpoint &src, Clock::time_point now) {
    ParsedPacket pkt = parse_packet(data, len);
    switch (pkt.type) {
        case PacketType::REGISTER_CLIENT: {
            RegisterResult r = registry.register_client(src, now);
            if (r == RegisterResult::Refused) return ControlAction::Refused;
            std::vector<char> reply = encode_control(PacketType::REGISTERED);
            if (sink.send_to(src, reply.data(), reply.size()) != SendResult::Sent) {
                // the client retries REGISTER_CLIENT; the session stays registered
                LOG_NET_WARN("Failed to send REGISTERED to {}", src.to_string());
            }
            return r == RegisterResult::Registered ? ControlAction::Registered : ControlAction::Refreshed;
        }
        case PacketType::KEEPALIVE:
            return registry.keepalive(src, now) ? ControlAction::KeepaliveAccepted : ControlAction::KeepaliveUnknown;
        case PacketType::DISCONNECT:
            return registry.disconnect(src) ? ControlAction::Disconnected : ControlAction::DisconnectUnknown;
        case PacketType::MALFORMED:
            LOG_NET_DEBUG("Malformed datagram ({} bytes) from {} dropped", len, src.to_string());
            return ControlAction::Malformed;
        default:
            LOG_NET_DEBUG("Unexpected {} from {} ignored", packet_type_name(pkt.type), src.to_string());
            return ControlAction::Ignored;
    }
}

StreamServer::StreamServer(const framecast::config::ServerConfig &cfg)
        : cfg_(cfg),
          registry_(std::chrono::seconds(cfg.client_timeout_s), cfg.max_clients),
          transmitter_(socket_, registry_, cfg.payload_size),
          stop_(false), started_(false),
          frames_at_last_status_(0) {}

StreamServer::~StreamServer() {
    stop();
}

bool StreamServer::start() {
    if (started_) return true;
    if (!socket_.bind_any(cfg_.port)) {
        LOG_NET_ERROR("Failed to bind UDP port {}", cfg_.port);
        return false;
    }
    stop_.store(false);
    last_status_ = Clock::now();
    frames_at_last_status_ = 0;
    control_thread_ = std::thread(&StreamServer::controlLoop, this);
    started_ = true;

    LOG_GEN_INFO("Server listening on UDP port {} (payload {} bytes, max {} clients, timeout {} s)",
                 socket_.local_port(), transmitter_.payload_size(), cfg_.max_clients, cfg_.client_timeout_s);
    return true;
}

void StreamServer::stop() {
    stop_.store(true);
    if (control_thread_.joinable()) control_thread_.join();
    if (started_) {
        socket_.close();
        started_ = false;
        LOG_GEN_INFO("Server stopped: {} frames sent, {} packets sent, {} dropped",
                     transmitter_.frames_sent(), transmitter_.packets_sent(), transmitter_.packets_dropped());
    }
}

void StreamServer::controlLoop() {
    std::vector<char> buf(MAX_UDP_DATAGRAM);
    auto last_sweep = Clock::now();
    const auto sweep_interval = std::chrono::seconds(cfg_.sweep_interval_s);
    const auto status_interval = std::chrono::seconds(cfg_.status_interval_s);

    LOG_NET_DEBUG("Control thread started");
    while (!stop_.load()) {
        Endpoint src;
        ssize_t n = socket_.recv_from(buf.data(), buf.size(), src, POLL_TICK_MS);
        if (n < 0) {
            LOG_NET_ERROR("Control socket receive failed; control thread exiting");
            break;
        }
        auto now = Clock::now();
        if (n > 0) {
            helpers::handle_control_datagram(registry_, socket_, buf.data(), (size_t)n, src, now);
        }

        if (now - last_sweep >= sweep_interval) {
            registry_.sweep(now);
            last_sweep = now;
        }
        if (now - last_status_ >= status_interval) {
            reportStatus(now);
        }
    }
    LOG_NET_DEBUG("Control thread exiting");
}

void StreamServer::reportStatus(Clock::time_point now) {
    uint64_t frames = transmitter_.frames_sent();
    int64_t ms = elapsed_ms(last_status_, now);
    double fps = ms > 0 ? (double)(frames - frames_at_last_status_) * 1000.0 / (double)ms : 0.0;
    LOG_GEN_INFO("Status: clients={} frames_sent={} fps={:.1f} packets_sent={} packets_dropped={}",
                 registry_.size(), frames, fps, transmitter_.packets_sent(), transmitter_.packets_dropped());
    frames_at_last_status_ = frames;
    last_status_ = now;
}

bool StreamServer::run(framecast::video::FrameSource &source) {
    if (!started_) {
        LOG_GEN_ERROR("run() called before start()");
        return false;
    }

    const auto frame_interval = std::chrono::microseconds(1000000 / cfg_.fps);
    auto next_deadline = Clock::now();
    std::vector<char> frame;

    LOG_VIDEO_INFO("Streaming {} at {} fps ({}x{})", source.describe(), cfg_.fps, cfg_.width, cfg_.height);

    while (!stop_.load()) {
        if (!source.next_frame(frame)) {
            LOG_VIDEO_INFO("Source exhausted: {}", source.describe());
            return true;
        }

        transmitter_.send_frame(frame.data(), frame.size());

        // Live sources arrive at capture cadence. Files are paced one picture per frame interval;
        // parameter sets and SEI go out with the picture that follows them.
        if (!source.is_live() && framecast::video::is_picture_nal(frame)) {
            next_deadline += frame_interval;
            auto now = Clock::now();
            if (next_deadline + frame_interval < now) {
                // fell behind (slow send or debugger): restart the clock instead of bursting
                next_deadline = now;
            } else {
                std::this_thread::sleep_until(next_deadline);
            }
        }
    }
    LOG_GEN_INFO("Stop requested, leaving producer loop");
    return true;
}
