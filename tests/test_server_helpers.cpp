/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <server.hpp>
#include <protocol.hpp>

#include <string>
#include <vector>

using namespace framecast::server;
using namespace framecast::registry;
using namespace framecast::net;
using namespace framecast::protocol;
using framecast::common::Clock;

namespace {

    struct ReplySink : public DatagramSink {
        std::vector<std::pair<Endpoint, std::string>> replies;

        SendResult send_to(const Endpoint &dst, const char *data, size_t len) override {
            replies.emplace_back(dst, std::string(data, len));
            return SendResult::Sent;
        }
    };

    helpers::ControlAction dispatch(ClientRegistry &reg, ReplySink &sink, const std::string &pkt,
                                    const Endpoint &src, Clock::time_point now) {
        return helpers::handle_control_datagram(reg, sink, pkt.data(), pkt.size(), src, now);
    }

}

TEST_CASE("REGISTER_CLIENT is answered with REGISTERED to the observed address", "[server_helpers]") {
    ClientRegistry reg;
    ReplySink sink;
    Endpoint src{0x7F000001u, 40000};

    REQUIRE(dispatch(reg, sink, "REGISTER_CLIENT", src, Clock::now()) == helpers::ControlAction::Registered);
    REQUIRE(reg.contains(src));
    REQUIRE(sink.replies.size() == 1);
    REQUIRE(sink.replies[0].first == src);
    REQUIRE(sink.replies[0].second == "REGISTERED");

    // a retry after a lost REGISTERED gets a fresh reply
    REQUIRE(dispatch(reg, sink, "REGISTER_CLIENT", src, Clock::now()) == helpers::ControlAction::Refreshed);
    REQUIRE(sink.replies.size() == 2);
    REQUIRE(reg.size() == 1);
}

TEST_CASE("refused registrations get no reply", "[server_helpers]") {
    ClientRegistry reg(std::chrono::seconds(30), 1);
    ReplySink sink;
    dispatch(reg, sink, "REGISTER_CLIENT", Endpoint{0x7F000001u, 1}, Clock::now());
    REQUIRE(dispatch(reg, sink, "REGISTER_CLIENT", Endpoint{0x7F000001u, 2}, Clock::now())
            == helpers::ControlAction::Refused);
    REQUIRE(sink.replies.size() == 1);
    REQUIRE(reg.size() == 1);
}

TEST_CASE("KEEPALIVE and DISCONNECT", "[server_helpers]") {
    ClientRegistry reg;
    ReplySink sink;
    Endpoint src{0x7F000001u, 40000};
    auto t0 = Clock::now();

    REQUIRE(dispatch(reg, sink, "KEEPALIVE", src, t0) == helpers::ControlAction::KeepaliveUnknown);
    REQUIRE_FALSE(reg.contains(src));

    dispatch(reg, sink, "REGISTER_CLIENT", src, t0);
    REQUIRE(dispatch(reg, sink, "KEEPALIVE", src, t0 + std::chrono::seconds(20)) == helpers::ControlAction::KeepaliveAccepted);
    REQUIRE(reg.sweep(t0 + std::chrono::seconds(45)).empty());

    REQUIRE(dispatch(reg, sink, "DISCONNECT", src, t0) == helpers::ControlAction::Disconnected);
    REQUIRE_FALSE(reg.contains(src));
    REQUIRE(dispatch(reg, sink, "DISCONNECT", src, t0) == helpers::ControlAction::DisconnectUnknown);

    // keepalive/disconnect never produce replies
    REQUIRE(sink.replies.size() == 1);
}

TEST_CASE("data, stray and malformed packets leave the registry alone", "[server_helpers]") {
    ClientRegistry reg;
    ReplySink sink;
    Endpoint src{0x7F000001u, 40000};

    auto fs = encode_frame_start(1, 100, 1);
    REQUIRE(helpers::handle_control_datagram(reg, sink, fs.data(), fs.size(), src, Clock::now())
            == helpers::ControlAction::Ignored);
    REQUIRE(dispatch(reg, sink, "REGISTERED", src, Clock::now()) == helpers::ControlAction::Ignored);
    REQUIRE(dispatch(reg, sink, "REGISTER_CLIENT ", src, Clock::now()) == helpers::ControlAction::Malformed);
    REQUIRE(dispatch(reg, sink, "hello", src, Clock::now()) == helpers::ControlAction::Malformed);

    REQUIRE(reg.size() == 0);
    REQUIRE(sink.replies.empty());
}
