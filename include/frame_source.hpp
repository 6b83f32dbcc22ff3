/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_FRAME_SOURCE_HPP
#define FRAMECAST_FRAME_SOURCE_HPP

#pragma once

#include <cstddef>
#include <cstdio>
#include <deque>
#include <string>
#include <vector>

namespace framecast::video {

    /**
     * @brief Producer of compressed frames. Each call yields one opaque buffer to transmit.
     */
    class FrameSource {
    public:
        virtual ~FrameSource() = default;

        /// Fill `out` with the next frame. Returns false when the source is exhausted or failed.
        virtual bool next_frame(std::vector<char> &out) = 0;

        /// Live sources deliver frames at capture cadence; others are paced by the server.
        virtual bool is_live() const = 0;

        virtual std::string describe() const = 0;
    };

    //
    // Annex-B helpers
    //

    /// Split a complete Annex-B byte stream into NAL units (start codes included).
    std::vector<std::vector<char>> split_annexb_nals(const std::vector<char> &data);

    /**
     * @brief Return the complete NAL units at the front of `accum` and keep the unfinished
     * tail (from the last start code on) in `accum`.
     */
    std::vector<std::vector<char>> take_complete_annexb_nals(std::vector<char> &accum);

    /// H.264 nal_unit_type of a NAL that starts with a start code, or -1.
    int annexb_nal_type(const std::vector<char> &nal);

    /// Slice (1) or IDR (5): one picture, used as the pacing unit.
    bool is_picture_nal(const std::vector<char> &nal);

    /**
     * @brief Raw H.264 Annex-B file, one NAL unit per frame, optionally looping forever.
     */
    class AnnexBFileSource : public FrameSource {
    public:
        AnnexBFileSource(const std::string &path, bool loop);

        bool open();
        bool next_frame(std::vector<char> &out) override;
        bool is_live() const override { return false; }
        std::string describe() const override;

        size_t nal_count() const { return nals_.size(); }

    private:
        std::string path_;
        bool loop_;
        std::vector<std::vector<char>> nals_;
        size_t next_;
    };

    /**
     * @brief Runs a capture/encode command (typically ffmpeg) and reads raw Annex-B H.264
     * from its stdout, yielding NAL units as soon as they are complete.
     */
    class CommandFrameSource : public FrameSource {
    public:
        explicit CommandFrameSource(const std::string &command);
        ~CommandFrameSource() override;

        CommandFrameSource(const CommandFrameSource&) = delete;
        CommandFrameSource& operator=(const CommandFrameSource&) = delete;

        bool open();
        void close();
        bool next_frame(std::vector<char> &out) override;
        bool is_live() const override { return true; }
        std::string describe() const override;

    private:
        bool fill();

        std::string command_;
        FILE *pipe_;
        bool eof_;
        std::vector<char> read_buf_; // sized once in open()
        std::vector<char> accum_;
        std::deque<std::vector<char>> ready_;
    };

    /// ffmpeg command line capturing `input` (e.g. /dev/video0) to low-latency H.264 on stdout.
    std::string ffmpeg_capture_command(const std::string &input, int width, int height, int fps);

} // namespace framecast::video

#endif // FRAMECAST_FRAME_SOURCE_HPP
