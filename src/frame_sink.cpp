/*
* @license
* (C) zachbabanov
*
*/

#include <frame_sink.hpp>
#include <logger.hpp>

#include <fmt/core.h>

using namespace framecast::video;
using namespace framecast::player;

FileFrameSink::FileFrameSink(const std::string &path) : path_(path), bytes_written_(0) {}

bool FileFrameSink::open() {
    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        LOG_VIDEO_ERROR("Failed to open output file '{}'", path_);
        return false;
    }
    LOG_VIDEO_INFO("Writing frames to {}", path_);
    return true;
}

bool FileFrameSink::consume(uint32_t frame_id, std::vector<char> &&frame) {
    if (!out_.is_open()) return false;
    out_.write(frame.data(), (std::streamsize)frame.size());
    if (!out_) {
        LOG_VIDEO_ERROR("Write to '{}' failed at frame {}", path_, frame_id);
        return false;
    }
    out_.flush();
    bytes_written_ += frame.size();
    return true;
}

std::string FileFrameSink::describe() const {
    return fmt::format("file '{}'", path_);
}

helpers::BacklogAction framecast::video::helpers::enforce_backlog_limits(std::string &backlog, size_t soft, size_t hard) {
    if (backlog.size() > hard) {
        LOG_VIDEO_ERROR("player backlog {} bytes exceeded HARD limit {}", backlog.size(), hard);
        return BacklogAction::Close;
    }
    if (backlog.size() > soft) {
        size_t drop = backlog.size() / 2;
        backlog.erase(0, drop);
        LOG_VIDEO_WARN("player backlog exceeded soft limit {}; dropped {} bytes", soft, drop);
        return BacklogAction::DroppedOldestHalf;
    }
    return BacklogAction::Kept;
}

PlayerSink::PlayerSink(const std::string &player_cmd, const std::vector<std::string> &args)
        : player_cmd_(player_cmd), args_(args), closed_(false) {}

PlayerSink::~PlayerSink() {
    stop();
}

bool PlayerSink::start() {
    player_ = PlayerProcess::launch(player_cmd_, args_);
    if (!player_) {
        closed_ = true;
        return false;
    }
    closed_ = false;
    return true;
}

void PlayerSink::stop() {
    if (player_) {
        player_->stop();
        player_.reset();
    }
    backlog_.clear();
    closed_ = true;
}

bool PlayerSink::flush() {
    if (backlog_.empty()) return true;
    ssize_t w = player_->write_data(backlog_.data(), backlog_.size());
    if (w < 0) {
        LOG_VIDEO_ERROR("Player stdin closed; stopping player");
        stop();
        return false;
    }
    if ((size_t)w >= backlog_.size()) {
        backlog_.clear();
    } else {
        backlog_.erase(0, (size_t)w);
        LOG_VIDEO_TRACE("Partial flush, wrote={} remain={}", (uint32_t)w, (uint32_t)backlog_.size());
    }
    return true;
}

bool PlayerSink::consume(uint32_t frame_id, std::vector<char> &&frame) {
    if (closed_ || !player_) return false;

    // older bytes first, then try to hand the new frame over without copying
    if (!flush()) return false;
    size_t off = 0;
    if (backlog_.empty()) {
        ssize_t w = player_->write_data(frame.data(), frame.size());
        if (w < 0) {
            LOG_VIDEO_ERROR("Player write failed at frame {}; stopping player", frame_id);
            stop();
            return false;
        }
        off = (size_t)w;
    }
    if (off < frame.size()) backlog_.append(frame.data() + off, frame.size() - off);

    if (helpers::enforce_backlog_limits(backlog_) == helpers::BacklogAction::Close) {
        stop();
        return false;
    }
    return true;
}

void PlayerSink::tick() {
    if (closed_ || !player_) return;
    flush();
}

std::string PlayerSink::describe() const {
    return fmt::format("player '{}'", player_cmd_);
}
