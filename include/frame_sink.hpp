/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_FRAME_SINK_HPP
#define FRAMECAST_FRAME_SINK_HPP

#pragma once

#include <common.hpp>
#include <player.hpp>

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace framecast::video {

    /**
     * @brief Consumer of completed frames on the viewer side.
     */
    class FrameSink {
    public:
        virtual ~FrameSink() = default;

        /// Take ownership of one completed frame. Returns false once the sink is unusable.
        virtual bool consume(uint32_t frame_id, std::vector<char> &&frame) = 0;

        /// Called on every receive-loop tick, with or without new frames.
        virtual void tick() {}

        virtual std::string describe() const = 0;
    };

    /// Appends every frame to a file, producing a playable Annex-B stream for H.264 input.
    class FileFrameSink : public FrameSink {
    public:
        explicit FileFrameSink(const std::string &path);

        bool open();
        bool consume(uint32_t frame_id, std::vector<char> &&frame) override;
        std::string describe() const override;

        uint64_t bytes_written() const { return bytes_written_; }

    private:
        std::string path_;
        std::ofstream out_;
        uint64_t bytes_written_;
    };

    namespace helpers {

        enum class BacklogAction {
            Kept,
            DroppedOldestHalf,
            Close
        };

        /// Above `hard` the consumer must be closed; above `soft` the oldest half is dropped.
        BacklogAction enforce_backlog_limits(std::string &backlog,
                                             size_t soft = framecast::common::MAX_PLAYER_BUFFER,
                                             size_t hard = framecast::common::MAX_PLAYER_BUFFER_HARD);

    } // namespace helpers

    /**
     * @brief Pipes frames into an external player's stdin.
     *
     * Writes never block. Bytes the pipe does not take stay in a backlog that is
     * flushed on every tick and bounded by helpers::enforce_backlog_limits.
     */
    class PlayerSink : public FrameSink {
    public:
        PlayerSink(const std::string &player_cmd, const std::vector<std::string> &args = {});
        ~PlayerSink() override;

        bool start();
        void stop();

        bool consume(uint32_t frame_id, std::vector<char> &&frame) override;
        void tick() override;
        std::string describe() const override;

        bool closed() const { return closed_; }
        size_t backlog_size() const { return backlog_.size(); }

    private:
        bool flush();

        std::string player_cmd_;
        std::vector<std::string> args_;
        std::unique_ptr<framecast::player::PlayerProcess> player_;
        std::string backlog_; // bytes pending to write to player
        bool closed_;
    };

} // namespace framecast::video

#endif // FRAMECAST_FRAME_SINK_HPP
