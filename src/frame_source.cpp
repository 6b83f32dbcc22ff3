/*
* @license
* (C) zachbabanov
*
*/

#include <frame_source.hpp>
#include <logger.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <fstream>

#include <sys/wait.h>
#include <unistd.h>

using namespace framecast::video;

/**
 * find_start_codes:
 *  Positions of every Annex-B start code (0x000001 or 0x00000001) in data[0..sz).
 *  The position is that of the first zero byte, so a NAL spans [start_i, start_{i+1}).
 */
static std::vector<size_t> find_start_codes(const char *data, size_t sz) {
    std::vector<size_t> starts;
    size_t p = 0;
    while (p + 2 < sz) {
        if (data[p] == 0x00 && data[p+1] == 0x00) {
            if (data[p+2] == 0x01) {
                starts.push_back(p);
                p += 3;
                continue;
            }
            if (data[p+2] == 0x00 && p + 3 < sz && data[p+3] == 0x01) {
                starts.push_back(p);
                p += 4;
                continue;
            }
        }
        ++p;
    }
    return starts;
}

std::vector<std::vector<char>> framecast::video::split_annexb_nals(const std::vector<char> &data) {
    std::vector<std::vector<char>> nals;
    auto starts = find_start_codes(data.data(), data.size());
    for (size_t i = 0; i < starts.size(); ++i) {
        size_t end = (i + 1 < starts.size()) ? starts[i+1] : data.size();
        nals.emplace_back(data.begin() + starts[i], data.begin() + end);
    }
    return nals;
}

std::vector<std::vector<char>> framecast::video::take_complete_annexb_nals(std::vector<char> &accum) {
    std::vector<std::vector<char>> out;
    auto starts = find_start_codes(accum.data(), accum.size());

    if (starts.empty()) {
        // No start code yet. Bound the garbage but keep 3 bytes: a start code may straddle reads.
        if (accum.size() > 65536) {
            std::vector<char> tail(accum.end() - 3, accum.end());
            accum.swap(tail);
        }
        return out;
    }

    for (size_t i = 0; i + 1 < starts.size(); ++i) {
        out.emplace_back(accum.begin() + starts[i], accum.begin() + starts[i+1]);
    }

    // Preserve tail from last start to end (it may be incomplete)
    std::vector<char> tail(accum.begin() + starts.back(), accum.end());
    accum.swap(tail);
    return out;
}

int framecast::video::annexb_nal_type(const std::vector<char> &nal) {
    size_t sc_len = 0;
    if (nal.size() >= 4 && nal[0] == 0x00 && nal[1] == 0x00 && nal[2] == 0x00 && nal[3] == 0x01) {
        sc_len = 4;
    } else if (nal.size() >= 3 && nal[0] == 0x00 && nal[1] == 0x00 && nal[2] == 0x01) {
        sc_len = 3;
    }
    if (sc_len == 0 || nal.size() <= sc_len) return -1;
    return (unsigned char)nal[sc_len] & 0x1F;
}

bool framecast::video::is_picture_nal(const std::vector<char> &nal) {
    int t = annexb_nal_type(nal);
    return t == 1 || t == 5;
}

AnnexBFileSource::AnnexBFileSource(const std::string &path, bool loop)
        : path_(path), loop_(loop), next_(0) {}

bool AnnexBFileSource::open() {
    // Read entire file into memory (simpler and robust for test streams).
    std::ifstream infile(path_, std::ios::binary);
    if (!infile.is_open()) {
        LOG_VIDEO_ERROR("Failed to open file '{}'", path_);
        return false;
    }
    infile.seekg(0, std::ios::end);
    std::streamsize fsize = infile.tellg();
    infile.seekg(0, std::ios::beg);
    if (fsize <= 0) {
        LOG_VIDEO_ERROR("Empty or inaccessible file '{}'", path_);
        return false;
    }
    std::vector<char> fileData((size_t)fsize);
    if (!infile.read(fileData.data(), fsize)) {
        LOG_VIDEO_ERROR("Short read on '{}'", path_);
        return false;
    }

    nals_ = split_annexb_nals(fileData);
    if (nals_.empty()) {
        LOG_VIDEO_ERROR("No NAL units found in '{}'. Is it raw H.264 (Annex-B)?", path_);
        return false;
    }
    next_ = 0;
    LOG_VIDEO_INFO("Extracted {} NAL units from {}", nals_.size(), path_);
    return true;
}

bool AnnexBFileSource::next_frame(std::vector<char> &out) {
    if (nals_.empty()) return false;
    if (next_ >= nals_.size()) {
        if (!loop_) return false;
        next_ = 0;
        LOG_VIDEO_DEBUG("Looping '{}'", path_);
    }
    out = nals_[next_++];
    return true;
}

std::string AnnexBFileSource::describe() const {
    return fmt::format("file '{}'{}", path_, loop_ ? " (loop)" : "");
}

CommandFrameSource::CommandFrameSource(const std::string &command)
        : command_(command), pipe_(nullptr), eof_(false) {}

CommandFrameSource::~CommandFrameSource() {
    close();
}

static constexpr size_t READ_CHUNK = 64 * 1024;

bool CommandFrameSource::open() {
    close();
    LOG_VIDEO_INFO("Launching capture command: {}", command_);
    pipe_ = popen(command_.c_str(), "r");
    if (!pipe_) {
        LOG_VIDEO_ERROR("Failed to launch capture command: {}", strerror(errno));
        return false;
    }
    eof_ = false;
    read_buf_.resize(READ_CHUNK);
    accum_.clear();
    accum_.reserve(256 * 1024);
    ready_.clear();
    return true;
}

void CommandFrameSource::close() {
    if (!pipe_) return;
    int status = pclose(pipe_);
    pipe_ = nullptr;
    if (status == -1) {
        LOG_VIDEO_WARN("pclose failed: {}", strerror(errno));
    } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        LOG_VIDEO_WARN("Capture command exited with status {}", WEXITSTATUS(status));
    } else {
        LOG_VIDEO_INFO("Capture command finished");
    }
}

bool CommandFrameSource::fill() {
    // read(2) on the pipe fd returns whatever the encoder has flushed; fread would wait for a full block
    ssize_t n = ::read(fileno(pipe_), read_buf_.data(), read_buf_.size());
    if (n < 0) {
        if (errno == EINTR) return true;
        LOG_VIDEO_WARN("Error reading from capture command: {}", strerror(errno));
        n = 0;
    }
    if (n == 0) {
        LOG_VIDEO_INFO("Capture command stdout closed (EOF)");
        eof_ = true;
        // whatever is left after the last start code is the final NAL
        for (auto &nal : split_annexb_nals(accum_)) ready_.push_back(std::move(nal));
        accum_.clear();
        return !ready_.empty();
    }

    accum_.insert(accum_.end(), read_buf_.data(), read_buf_.data() + n);
    for (auto &nal : take_complete_annexb_nals(accum_)) ready_.push_back(std::move(nal));
    return true;
}

bool CommandFrameSource::next_frame(std::vector<char> &out) {
    if (!pipe_) return false;
    while (ready_.empty() && !eof_) {
        if (!fill()) break;
    }
    if (ready_.empty()) return false;
    out = std::move(ready_.front());
    ready_.pop_front();
    return true;
}

std::string CommandFrameSource::describe() const {
    return fmt::format("command '{}'", command_);
}

std::string framecast::video::ffmpeg_capture_command(const std::string &input, int width, int height, int fps) {
    std::string in_opts;
    if (input.rfind("/dev/video", 0) == 0) {
        in_opts = fmt::format("-f v4l2 -framerate {} -video_size {}x{} -i \"{}\"", fps, width, height, input);
    } else {
        in_opts = fmt::format("-re -i \"{}\" -vf scale={}:{} -r {}", input, width, height, fps);
    }
    // one IDR per second, no B-frames: every NAL can be sent as soon as it is encoded
    return fmt::format("ffmpeg -hide_banner -loglevel error {} -an -c:v libx264 -preset ultrafast -tune zerolatency "
                       "-bf 0 -g {} -f h264 - 2>/dev/null", in_opts, fps);
}
