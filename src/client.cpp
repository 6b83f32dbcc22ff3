/*
* @license
* (C) zachbabanov
*
*/

#include <client.hpp>
#include <logger.hpp>

#include <algorithm>
#include <vector>

using namespace framecast::client;
using namespace framecast::common;
using namespace framecast::net;
using namespace framecast::protocol;
using namespace framecast::assembly;

static ReassemblerConfig make_reassembler_config(const framecast::config::ClientConfig &cfg) {
    ReassemblerConfig rc;
    rc.payload_size = cfg.payload_size;
    rc.stale_after = std::chrono::milliseconds(cfg.stale_frame_ms);
    rc.max_pending_frames = cfg.max_pending_frames;
    return rc;
}

ViewerClient::ViewerClient(const framecast::config::ClientConfig &cfg, framecast::video::FrameSink &sink)
        : cfg_(cfg), sink_(sink),
          reassembler_(make_reassembler_config(cfg)),
          stop_(false), registered_(false),
          frames_completed_(0), frames_at_last_stats_(0) {}

ViewerClient::~ViewerClient() {
    stop();
}

bool ViewerClient::sendControl(PacketType type) {
    std::vector<char> pkt = encode_control(type);
    SendResult r = socket_.send_to(server_, pkt.data(), pkt.size());
    if (r != SendResult::Sent) {
        LOG_NET_WARN("Failed to send {} to {}", packet_type_name(type), server_.to_string());
        return false;
    }
    LOG_NET_TRACE("{} -> {}", packet_type_name(type), server_.to_string());
    return true;
}

bool ViewerClient::waitForRegistered(std::chrono::milliseconds timeout) {
    std::vector<char> buf(MAX_UDP_DATAGRAM);
    auto deadline = Clock::now() + timeout;
    while (!stop_.load()) {
        auto now = Clock::now();
        if (now >= deadline) return false;
        int wait_ms = (int)std::min<int64_t>(elapsed_ms(now, deadline), POLL_TICK_MS);
        Endpoint src;
        ssize_t n = socket_.recv_from(buf.data(), buf.size(), src, std::max(wait_ms, 1));
        if (n < 0) return false;
        if (n == 0) continue;
        if (src != server_) {
            LOG_NET_DEBUG("Ignoring datagram from {} while registering", src.to_string());
            continue;
        }
        ParsedPacket pkt = parse_packet(buf.data(), (size_t)n);
        if (pkt.type == PacketType::REGISTERED) return true;
        // frames of a previous session may still be in flight
        LOG_NET_TRACE("Ignoring {} from {} while registering", packet_type_name(pkt.type), src.to_string());
    }
    return false;
}

bool ViewerClient::connect() {
    if (!resolve_endpoint(cfg_.host, cfg_.port, server_)) {
        LOG_NET_ERROR("Cannot resolve server address '{}'", cfg_.host);
        return false;
    }
    if (!socket_.is_open() && !socket_.open()) {
        LOG_NET_ERROR("Failed to create UDP socket");
        return false;
    }

    for (int attempt = 1; attempt <= cfg_.register_attempts && !stop_.load(); ++attempt) {
        LOG_NET_INFO("Registering with {} (attempt {}/{})", server_.to_string(), attempt, cfg_.register_attempts);
        if (!sendControl(PacketType::REGISTER_CLIENT)) continue;
        if (waitForRegistered(std::chrono::milliseconds(cfg_.register_timeout_ms))) {
            registered_.store(true);
            auto now = Clock::now();
            last_rx_ = now;
            last_reregister_ = now;
            LOG_NET_INFO("Registered with {} from local port {}", server_.to_string(), socket_.local_port());
            keepalive_thread_ = std::thread(&ViewerClient::keepaliveLoop, this);
            return true;
        }
        LOG_NET_WARN("No REGISTERED from {} within {} ms", server_.to_string(), cfg_.register_timeout_ms);
    }
    LOG_NET_ERROR("Registration with {} failed", server_.to_string());
    return false;
}

void ViewerClient::keepaliveLoop() {
    const auto interval = std::chrono::seconds(cfg_.keepalive_interval_s);
    std::unique_lock<std::mutex> lk(ka_mtx_);
    while (!stop_.load()) {
        if (ka_cv_.wait_for(lk, interval, [this]() { return stop_.load(); })) break;
        sendControl(PacketType::KEEPALIVE);
    }
}

void ViewerClient::reportStats(Clock::time_point now) {
    int64_t ms = elapsed_ms(last_stats_, now);
    double fps = ms > 0 ? (double)(frames_completed_ - frames_at_last_stats_) * 1000.0 / (double)ms : 0.0;
    const ReassemblerStats &st = reassembler_.stats();
    LOG_ASM_INFO("Stats: frames={} fps={:.1f} pending={} expired={} evicted={} rejected_starts={} "
                 "bad_chunks={} unknown_chunks={} malformed={}",
                 frames_completed_, fps, reassembler_.pending_count(), st.frames_expired, st.frames_evicted,
                 st.starts_rejected, st.chunks_rejected, st.chunks_unknown, st.malformed);
    frames_at_last_stats_ = frames_completed_;
    last_stats_ = now;
}

bool ViewerClient::run() {
    if (!registered_.load()) {
        LOG_GEN_ERROR("run() called before a successful connect()");
        return false;
    }

    std::vector<char> buf(MAX_UDP_DATAGRAM);
    const auto server_timeout = std::chrono::seconds(cfg_.server_timeout_s);
    last_stats_ = Clock::now();
    bool ok = true;

    LOG_GEN_INFO("Receiving from {} into {}", server_.to_string(), sink_.describe());
    while (!stop_.load()) {
        Endpoint src;
        ssize_t n = socket_.recv_from(buf.data(), buf.size(), src, POLL_TICK_MS);
        if (n < 0) {
            LOG_NET_ERROR("Receive failed; leaving receive loop");
            ok = false;
            break;
        }
        auto now = Clock::now();

        if (n > 0 && src != server_) {
            LOG_NET_DEBUG("Dropping {} bytes from {}: not the server", n, src.to_string());
        } else if (n > 0) {
            last_rx_ = now;
            auto done = reassembler_.handle_datagram(buf.data(), (size_t)n, now);
            if (done) {
                frames_completed_++;
                if (!sink_.consume(done->frame_id, std::move(done->data))) {
                    LOG_VIDEO_ERROR("Frame sink {} stopped accepting frames", sink_.describe());
                    ok = false;
                    break;
                }
            }
        }

        // staleness is evaluated every tick, whether or not anything arrived
        reassembler_.expire_stale(now);
        sink_.tick();

        // server silent for a whole session timeout: it may have restarted and forgotten us
        if (now - last_rx_ > server_timeout && now - last_reregister_ > server_timeout) {
            LOG_NET_WARN("Nothing received from {} for {} ms, registering again", server_.to_string(), elapsed_ms(last_rx_, now));
            sendControl(PacketType::REGISTER_CLIENT);
            last_reregister_ = now;
        }

        if (now - last_stats_ >= STATUS_INTERVAL) reportStats(now);
    }
    return ok;
}

void ViewerClient::stop() {
    {
        std::lock_guard<std::mutex> lk(ka_mtx_);
        stop_.store(true);
    }
    ka_cv_.notify_all();
    if (keepalive_thread_.joinable()) keepalive_thread_.join();

    if (registered_.exchange(false)) {
        sendControl(PacketType::DISCONNECT);
        LOG_NET_INFO("Disconnected from {}", server_.to_string());
    }
    reassembler_.reset();
    socket_.close();
}
