/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <frame_transmitter.hpp>
#include <client_registry.hpp>
#include <reassembler.hpp>
#include <protocol.hpp>

#include <map>
#include <vector>

using namespace framecast::transmit;
using namespace framecast::registry;
using namespace framecast::net;
using namespace framecast::protocol;
using framecast::common::Clock;

namespace {

    /// Records every datagram per destination; destinations in `blocked_after` stop accepting after N sends.
    struct CaptureSink : public DatagramSink {
        std::map<Endpoint, std::vector<std::vector<char>>> sent;
        std::map<Endpoint, size_t> blocked_after;

        SendResult send_to(const Endpoint &dst, const char *data, size_t len) override {
            auto it = blocked_after.find(dst);
            if (it != blocked_after.end() && sent[dst].size() >= it->second) return SendResult::WouldBlock;
            sent[dst].emplace_back(data, data + len);
            return SendResult::Sent;
        }
    };

    std::vector<char> make_frame(size_t n) {
        std::vector<char> v(n);
        for (size_t i = 0; i < n; ++i) v[i] = (char)(i % 251);
        return v;
    }

}

TEST_CASE("no clients: frame skipped and no id consumed", "[transmitter]") {
    CaptureSink sink;
    ClientRegistry reg;
    FrameTransmitter tx(sink, reg, 1200);

    auto frame = make_frame(3000);
    FrameSendStats st = tx.send_frame(frame.data(), frame.size());
    REQUIRE_FALSE(st.sent);
    REQUIRE(tx.next_frame_id() == 0);
    REQUIRE(sink.sent.empty());
}

TEST_CASE("empty frames are never sent", "[transmitter]") {
    CaptureSink sink;
    ClientRegistry reg;
    reg.register_client(Endpoint{0x7F000001u, 4000}, Clock::now());
    FrameTransmitter tx(sink, reg, 1200);

    REQUIRE_FALSE(tx.send_frame(nullptr, 0).sent);
    REQUIRE(tx.next_frame_id() == 0);
    REQUIRE(sink.sent.empty());
}

TEST_CASE("every client receives FRAME_START then all chunks", "[transmitter]") {
    CaptureSink sink;
    ClientRegistry reg;
    Endpoint a{0x7F000001u, 4000};
    Endpoint b{0x7F000001u, 4001};
    reg.register_client(a, Clock::now());
    reg.register_client(b, Clock::now());
    FrameTransmitter tx(sink, reg, 1200);

    auto frame = make_frame(3000);
    FrameSendStats st = tx.send_frame(frame.data(), frame.size());
    REQUIRE(st.sent);
    REQUIRE(st.frame_id == 0);
    REQUIRE(st.chunk_count == 3);
    REQUIRE(st.destinations == 2);
    REQUIRE(st.packets_sent == 8);
    REQUIRE(st.packets_dropped == 0);
    REQUIRE(tx.next_frame_id() == 1);

    for (const Endpoint &dst : {a, b}) {
        auto &pk = sink.sent[dst];
        REQUIRE(pk.size() == 4);
        ParsedPacket start = parse_packet(pk[0].data(), pk[0].size());
        REQUIRE(start.type == PacketType::FRAME_START);
        REQUIRE(start.frame_size == 3000);
        REQUIRE(start.chunk_count == 3);

        // what each client got reassembles to the original frame
        framecast::assembly::FrameReassembler r;
        std::vector<char> out;
        for (auto &p : pk) {
            auto done = r.handle_datagram(p.data(), p.size(), Clock::now());
            if (done) out = done->data;
        }
        REQUIRE(out == frame);
    }
}

TEST_CASE("frame ids increase and wrap at 2^32", "[transmitter]") {
    CaptureSink sink;
    ClientRegistry reg;
    reg.register_client(Endpoint{0x7F000001u, 4000}, Clock::now());
    FrameTransmitter tx(sink, reg, 1200);
    tx.set_next_frame_id(0xFFFFFFFFu);

    auto frame = make_frame(10);
    REQUIRE(tx.send_frame(frame.data(), frame.size()).frame_id == 0xFFFFFFFFu);
    REQUIRE(tx.send_frame(frame.data(), frame.size()).frame_id == 0);
    REQUIRE(tx.send_frame(frame.data(), frame.size()).frame_id == 1);
    REQUIRE(tx.frames_sent() == 3);
}

TEST_CASE("a blocked destination loses the rest of that frame only", "[transmitter]") {
    CaptureSink sink;
    ClientRegistry reg;
    Endpoint slow{0x7F000001u, 4000};
    Endpoint fast{0x7F000001u, 4001};
    reg.register_client(slow, Clock::now());
    reg.register_client(fast, Clock::now());
    sink.blocked_after[slow] = 2; // FRAME_START + first chunk
    FrameTransmitter tx(sink, reg, 1000);

    auto frame = make_frame(4500); // 5 chunks
    FrameSendStats st = tx.send_frame(frame.data(), frame.size());
    REQUIRE(st.sent);
    REQUIRE(sink.sent[slow].size() == 2);
    REQUIRE(sink.sent[fast].size() == 6);
    REQUIRE(st.packets_sent == 8);
    REQUIRE(st.packets_dropped == 4);
    REQUIRE(tx.packets_dropped() == 4);

    // still registered: a send failure is not a reason to forget the client
    REQUIRE(reg.contains(slow));
}
