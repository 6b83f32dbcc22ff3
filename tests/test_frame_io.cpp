/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <frame_source.hpp>
#include <frame_sink.hpp>
#include <common.hpp>

#include <csignal>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

using namespace framecast::video;
using namespace framecast::common;

static std::vector<char> bytes(std::initializer_list<int> v) {
    std::vector<char> out;
    for (int b : v) out.push_back((char)b);
    return out;
}

static std::string temp_path(const char *tag) {
    return "/tmp/framecast_" + std::string(tag) + "_" + std::to_string(getpid());
}

TEST_CASE("split_annexb_nals handles 3- and 4-byte start codes", "[annexb]") {
    auto stream = bytes({0xFF, 0x00, 0x00, 0x00, 0x01, 0x67, 0x10,
                         0x00, 0x00, 0x01, 0x68, 0x20,
                         0x00, 0x00, 0x00, 0x01, 0x65, 0x30, 0x31});
    auto nals = split_annexb_nals(stream);
    REQUIRE(nals.size() == 3);
    REQUIRE(nals[0] == bytes({0x00, 0x00, 0x00, 0x01, 0x67, 0x10}));
    REQUIRE(nals[1] == bytes({0x00, 0x00, 0x01, 0x68, 0x20}));
    REQUIRE(nals[2] == bytes({0x00, 0x00, 0x00, 0x01, 0x65, 0x30, 0x31}));

    REQUIRE(annexb_nal_type(nals[0]) == 7);
    REQUIRE(annexb_nal_type(nals[1]) == 8);
    REQUIRE(annexb_nal_type(nals[2]) == 5);
    REQUIRE(is_picture_nal(nals[2]));
    REQUIRE_FALSE(is_picture_nal(nals[0]));
    REQUIRE(annexb_nal_type(bytes({0x12, 0x34})) == -1);
}

TEST_CASE("take_complete_annexb_nals keeps the unfinished tail", "[annexb]") {
    std::vector<char> accum = bytes({0x00, 0x00, 0x00, 0x01, 0x41, 0xAA, 0x00, 0x00});
    REQUIRE(take_complete_annexb_nals(accum).empty());

    // the next read completes the start code that straddled the boundary
    auto more = bytes({0x00, 0x01, 0x41, 0xBB});
    accum.insert(accum.end(), more.begin(), more.end());
    auto nals = take_complete_annexb_nals(accum);
    REQUIRE(nals.size() == 1);
    REQUIRE(nals[0] == bytes({0x00, 0x00, 0x00, 0x01, 0x41, 0xAA}));
    REQUIRE(accum == bytes({0x00, 0x00, 0x00, 0x01, 0x41, 0xBB}));
}

TEST_CASE("AnnexBFileSource yields NAL units and loops", "[annexb][source]") {
    std::string path = temp_path("src.h264");
    auto stream = bytes({0x00, 0x00, 0x00, 0x01, 0x67, 0x01, 0x00, 0x00, 0x01, 0x65, 0x02});
    {
        std::ofstream f(path, std::ios::binary);
        f.write(stream.data(), (std::streamsize)stream.size());
    }

    AnnexBFileSource once(path, false);
    REQUIRE(once.open());
    REQUIRE(once.nal_count() == 2);
    std::vector<char> frame;
    REQUIRE(once.next_frame(frame));
    REQUIRE(once.next_frame(frame));
    REQUIRE(annexb_nal_type(frame) == 5);
    REQUIRE_FALSE(once.next_frame(frame));

    AnnexBFileSource looping(path, true);
    REQUIRE(looping.open());
    for (int i = 0; i < 5; ++i) REQUIRE(looping.next_frame(frame));
    REQUIRE(annexb_nal_type(frame) == 7);

    std::remove(path.c_str());
    AnnexBFileSource missing(path, false);
    REQUIRE_FALSE(missing.open());
}

TEST_CASE("CommandFrameSource reads NAL units from a command", "[annexb][source]") {
    CommandFrameSource src("printf '\\000\\000\\000\\001\\145AA\\000\\000\\001\\101BB'");
    REQUIRE(src.open());
    REQUIRE(src.is_live());

    std::vector<char> frame;
    REQUIRE(src.next_frame(frame));
    REQUIRE(frame == bytes({0x00, 0x00, 0x00, 0x01, 0x65, 'A', 'A'}));
    REQUIRE(src.next_frame(frame));
    REQUIRE(frame == bytes({0x00, 0x00, 0x01, 0x41, 'B', 'B'}));
    REQUIRE_FALSE(src.next_frame(frame));
    src.close();
}

TEST_CASE("CommandFrameSource reassembles NAL units spanning many pipe reads", "[annexb][source]") {
    std::string path = temp_path("big.h264");
    std::vector<char> big = bytes({0x00, 0x00, 0x00, 0x01, 0x65});
    big.resize(big.size() + 200000, 'x');
    std::vector<char> small = bytes({0x00, 0x00, 0x01, 0x41, 'y'});
    {
        std::ofstream f(path, std::ios::binary);
        f.write(big.data(), (std::streamsize)big.size());
        f.write(small.data(), (std::streamsize)small.size());
    }

    CommandFrameSource src("cat " + path);
    REQUIRE(src.open());
    std::vector<char> frame;
    REQUIRE(src.next_frame(frame));
    REQUIRE(frame == big);
    REQUIRE(src.next_frame(frame));
    REQUIRE(frame == small);
    REQUIRE_FALSE(src.next_frame(frame));
    src.close();

    // reopening runs the command again from the start
    REQUIRE(src.open());
    REQUIRE(src.next_frame(frame));
    REQUIRE(frame.size() == big.size());
    src.close();
    std::remove(path.c_str());
}

TEST_CASE("ffmpeg capture command", "[source]") {
    std::string cam = ffmpeg_capture_command("/dev/video0", 640, 480, 30);
    REQUIRE(cam.find("-f v4l2") != std::string::npos);
    REQUIRE(cam.find("640x480") != std::string::npos);
    REQUIRE(cam.find("-f h264 -") != std::string::npos);

    std::string url = ffmpeg_capture_command("rtsp://cam/stream", 320, 240, 15);
    REQUIRE(url.find("v4l2") == std::string::npos);
    REQUIRE(url.find("scale=320:240") != std::string::npos);
}

TEST_CASE("enforce_backlog_limits soft drop", "[sink]") {
    std::string backlog;
    for (int i = 0; i < 150; ++i) backlog.push_back((char)i);
    REQUIRE(helpers::enforce_backlog_limits(backlog, 100, 200) == helpers::BacklogAction::DroppedOldestHalf);
    REQUIRE(backlog.size() == 75);
    // the newest bytes survive
    REQUIRE(backlog.back() == (char)149);
    REQUIRE(backlog.front() == (char)75);

    REQUIRE(helpers::enforce_backlog_limits(backlog, 100, 200) == helpers::BacklogAction::Kept);
}

TEST_CASE("enforce_backlog_limits hard close", "[sink]") {
    std::string backlog(MAX_PLAYER_BUFFER_HARD + 1, 'y');
    REQUIRE(helpers::enforce_backlog_limits(backlog) == helpers::BacklogAction::Close);

    std::string soft(MAX_PLAYER_BUFFER + 1024, 'x');
    REQUIRE(helpers::enforce_backlog_limits(soft) == helpers::BacklogAction::DroppedOldestHalf);
    REQUIRE(soft.size() <= (MAX_PLAYER_BUFFER + 1024) - ((MAX_PLAYER_BUFFER + 1024) / 2));
}

TEST_CASE("FileFrameSink writes frames back to back", "[sink]") {
    std::string path = temp_path("sink.h264");
    {
        FileFrameSink sink(path);
        REQUIRE(sink.open());
        REQUIRE(sink.consume(1, bytes({0x00, 0x00, 0x01, 0x65})));
        REQUIRE(sink.consume(2, bytes({0x00, 0x00, 0x01, 0x41, 0x7F})));
        REQUIRE(sink.bytes_written() == 9);
    }
    std::ifstream in(path, std::ios::binary);
    std::vector<char> all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(all == bytes({0x00, 0x00, 0x01, 0x65, 0x00, 0x00, 0x01, 0x41, 0x7F}));
    std::remove(path.c_str());
}

TEST_CASE("PlayerSink pipes frames into a child process", "[sink][player]") {
    signal(SIGPIPE, SIG_IGN);

    PlayerSink sink("sh", {"-c", "cat > /dev/null"});
    REQUIRE(sink.start());
    for (uint32_t i = 0; i < 20; ++i) {
        REQUIRE(sink.consume(i, std::vector<char>(10000, 'z')));
        sink.tick();
    }
    sink.stop();
    REQUIRE(sink.closed());
    REQUIRE_FALSE(sink.consume(21, std::vector<char>(10, 'z')));
}
