/*
* @license
* (C) zachbabanov
*
*/

#include <frame_transmitter.hpp>
#include <chunker.hpp>
#include <logger.hpp>

#include <limits>

using namespace framecast::transmit;
using namespace framecast::net;
using namespace framecast::registry;

FrameTransmitter::FrameTransmitter(DatagramSink &sink, const ClientRegistry &registry, size_t payload_size)
        : sink_(sink), registry_(registry),
          payload_size_(framecast::chunk::effective_payload_size(payload_size)),
          next_frame_id_(0),
          frames_sent_(0), packets_sent_(0), packets_dropped_(0) {}

FrameSendStats FrameTransmitter::send_frame(const char *data, size_t len) {
    FrameSendStats st;

    if (!data || len == 0) {
        LOG_NET_WARN("Skipping empty frame");
        return st;
    }
    if (len > std::numeric_limits<uint32_t>::max()) {
        LOG_NET_WARN("Skipping frame of {} bytes: does not fit the 32-bit frame_size field", len);
        return st;
    }

    std::vector<Endpoint> clients = registry_.snapshot();
    if (clients.empty()) return st;

    st.frame_id = next_frame_id_++; // unsigned overflow wraps to 0
    auto packets = framecast::chunk::build_frame_packets(data, len, st.frame_id, payload_size_);
    st.chunk_count = packets.size() - 1;
    st.destinations = clients.size();

    for (const Endpoint &dst : clients) {
        size_t i = 0;
        for (; i < packets.size(); ++i) {
            SendResult r = sink_.send_to(dst, packets[i].data(), packets[i].size());
            if (r != SendResult::Sent) {
                LOG_NET_DEBUG("frame {} to {}: send {} at packet {}/{}, dropping the rest",
                              st.frame_id, dst.to_string(),
                              r == SendResult::WouldBlock ? "would block" : "failed",
                              i, packets.size());
                break;
            }
        }
        st.packets_sent += i;
        st.packets_dropped += packets.size() - i;
    }

    st.sent = true;
    frames_sent_.fetch_add(1);
    packets_sent_.fetch_add(st.packets_sent);
    packets_dropped_.fetch_add(st.packets_dropped);

    LOG_NET_TRACE("frame_send: id={} size={} chunks={} clients={} sent={} dropped={}",
                  st.frame_id, len, st.chunk_count, st.destinations, st.packets_sent, st.packets_dropped);
    return st;
}
